#include "dockstart_catalog.h"

#include "dockstart_errors.h"
#include "dockstart_logging.h"

#include <utility>

#define TAG DOCKSTART_TAG("catalog")

namespace dockstart
{

std::shared_ptr<Connection> InMemoryConnectionStore::Get(const std::string& identifier) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = connections_.find(identifier);
    return it == connections_.end() ? nullptr : it->second;
}

std::set<std::string> InMemoryConnectionStore::Identifiers() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> identifiers;
    for (const auto& entry : connections_)
        identifiers.insert(entry.first);
    return identifiers;
}

void InMemoryConnectionStore::Put(std::shared_ptr<Connection> connection)
{
    if (!connection)
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string identifier = connection->Identifier();
    connections_[identifier] = std::move(connection);
}

OverlayConnectionCatalog::OverlayConnectionCatalog(const ConnectionStore& store,
                                                   LifecycleOrchestrator* orchestrator,
                                                   std::string username, UpdatePermission canUpdate)
    : store_(store), orchestrator_(orchestrator), username_(std::move(username)),
      canUpdate_(std::move(canUpdate))
{
}

std::shared_ptr<Connection> OverlayConnectionCatalog::Get(const std::string& identifier)
{
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const auto internal = internal_.find(identifier);
        if (internal != internal_.end())
            return internal->second;

        const auto decorated = decorated_.find(identifier);
        if (decorated != decorated_.end())
            return decorated->second;
    }

    std::shared_ptr<Connection> stored = store_.Get(identifier);
    if (!stored)
        return nullptr;

    return Decorate(std::move(stored));
}

std::vector<std::shared_ptr<Connection>>
OverlayConnectionCatalog::List(const std::vector<std::string>& identifiers)
{
    std::vector<std::shared_ptr<Connection>> connections;
    connections.reserve(identifiers.size());
    for (const auto& identifier : identifiers)
    {
        if (auto connection = Get(identifier))
            connections.push_back(std::move(connection));
    }
    return connections;
}

std::set<std::string> OverlayConnectionCatalog::Identifiers() const
{
    std::set<std::string> identifiers = store_.Identifiers();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& entry : internal_)
        identifiers.insert(entry.first);
    return identifiers;
}

void OverlayConnectionCatalog::Add(std::shared_ptr<Connection> connection)
{
    if (!connection)
        return;

    const std::string identifier = connection->Identifier();
    std::unique_lock<std::shared_mutex> lock(mutex_);
    internal_[identifier] = std::move(connection);
}

bool OverlayConnectionCatalog::Remove(const std::string& identifier)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return internal_.erase(identifier) > 0;
}

std::vector<std::shared_ptr<ContainerConnection>> OverlayConnectionCatalog::ContainerConnections() const
{
    std::vector<std::shared_ptr<ContainerConnection>> connections;

    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& entry : internal_)
    {
        if (auto container = std::dynamic_pointer_cast<ContainerConnection>(entry.second))
            connections.push_back(std::move(container));
    }
    for (const auto& entry : decorated_)
        connections.push_back(entry.second);
    return connections;
}

std::shared_ptr<Connection> OverlayConnectionCatalog::Decorate(std::shared_ptr<Connection> stored)
{
    if (!orchestrator_)
        return stored;

    const AttributeExtension extension = AttributeExtension::ForConnection();
    const AttributeBag attributes = stored->Attributes();
    if (!extension.HasContainerAssociation(attributes))
        return stored;

    const std::string identifier = stored->Identifier();
    std::optional<ContainerSpec> spec;
    try
    {
        spec = extension.Extract(attributes);
        spec->protocol = ParseProtocol(stored->Configuration().protocol);
    }
    catch (const DockstartError& ex)
    {
        DOCKSTART_LOG_ERROR(TAG, "Container attributes of connection %s rejected: %s",
                            identifier.c_str(), ex.what());
        return stored;
    }

    const bool canUpdate = canUpdate_ && canUpdate_(EntityKind::Connection, identifier);
    auto wrapper = std::make_shared<ContainerConnection>(
        stored, DeriveContainerIdentity(stored->Name(), username_), std::move(*spec),
        *orchestrator_, username_, canUpdate);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto inserted = decorated_.emplace(identifier, std::move(wrapper));
    if (inserted.second)
        DOCKSTART_LOG_INFO(TAG, "Connection %s is backed by container %s", identifier.c_str(),
                           inserted.first->second->Identity().c_str());
    return inserted.first->second;
}

} // namespace dockstart
