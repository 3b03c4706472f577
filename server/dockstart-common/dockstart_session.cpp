#include "dockstart_session.h"

#include "dockstart_errors.h"
#include "dockstart_logging.h"

#include <utility>

#define TAG DOCKSTART_TAG("session")

namespace dockstart
{

UserSession::UserSession(std::string username, Entity user, std::vector<Entity> groups,
                         UpdatePermission canUpdate, const ConnectionStore& store,
                         LifecycleOrchestrator& orchestrator,
                         std::optional<ContainerSpec> defaultSpec)
    : username_(std::move(username)), user_(std::move(user)), groups_(std::move(groups)),
      canUpdate_(std::move(canUpdate)), orchestrator_(orchestrator),
      catalog_(store, &orchestrator, username_, canUpdate_)
{
    logging::ScopedLogUser scopedUser(username_);

    // Each source has its own identity prefix so no group name can reach the
    // user or default container.
    SynthesizeFromEntity(user_, AttributeExtension::ForUser(), kUserConnectionPrefix + username_,
                         kUserIdentityPrefix);

    for (const auto& group : groups_)
        SynthesizeFromEntity(group, AttributeExtension::ForUserGroup(),
                             kGroupConnectionPrefix + group.identifier,
                             std::string(kGroupIdentityPrefix) + "_" + group.identifier);

    if (defaultSpec)
        AddContainerConnection(kDefaultConnectionId, kDefaultIdentityPrefix,
                               std::move(*defaultSpec));

    DOCKSTART_LOG_INFO(TAG, "Session opened with %zu container connection(s)",
                       catalog_.ContainerConnections().size());
}

UserSession::~UserSession()
{
    Close();
}

void UserSession::SynthesizeFromEntity(const Entity& entity, const AttributeExtension& extension,
                                       const std::string& identifier,
                                       const std::string& identityBase)
{
    std::optional<ContainerSpec> spec;
    try
    {
        spec = extension.Extract(entity.attributes);
    }
    catch (const DockstartError& ex)
    {
        // Malformed attributes disable only this entity's connection.
        DOCKSTART_LOG_ERROR(TAG, "Ignoring container attributes of %s '%s': %s",
                            EntityKindName(entity.kind), entity.identifier.c_str(), ex.what());
        return;
    }

    if (spec)
        AddContainerConnection(identifier, identityBase, std::move(*spec));
}

void UserSession::AddContainerConnection(const std::string& identifier,
                                         const std::string& identityBase, ContainerSpec spec)
{
    const std::string identity = DeriveContainerIdentity(identityBase, username_);
    DOCKSTART_LOG_INFO(TAG, "Connection %s uses image %s as container %s", identifier.c_str(),
                       spec.image.c_str(), identity.c_str());
    catalog_.Add(std::make_shared<ContainerConnection>(identifier, identifier, identity,
                                                       std::move(spec), orchestrator_, username_));
}

AttributeView UserSession::UserView()
{
    const bool canUpdate = canUpdate_ && canUpdate_(EntityKind::User, user_.identifier);
    return AttributeView(user_, {AttributeExtension::ForUser()}, canUpdate);
}

std::vector<AttributeView> UserSession::GroupViews()
{
    std::vector<AttributeView> views;
    views.reserve(groups_.size());
    for (auto& group : groups_)
    {
        const bool canUpdate = canUpdate_ && canUpdate_(EntityKind::UserGroup, group.identifier);
        views.emplace_back(group, AttributeExtensions{AttributeExtension::ForUserGroup()},
                           canUpdate);
    }
    return views;
}

void UserSession::Close()
{
    if (closed_.exchange(true))
        return;

    logging::ScopedLogUser scopedUser(username_);
    for (const auto& connection : catalog_.ContainerConnections())
    {
        try
        {
            connection->Release();
        }
        catch (const std::exception& ex)
        {
            DOCKSTART_LOG_ERROR(TAG, "Failed to release container %s: %s",
                                connection->Identity().c_str(), ex.what());
        }
    }

    DOCKSTART_LOG_INFO(TAG, "Session closed");
}

} // namespace dockstart
