#pragma once

#include "dockstart_connection.h"
#include "dockstart_orchestrator.h"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace dockstart
{

/**
 * Connections owned by the outside world. The catalog reads from it and never
 * writes synthesized entries back.
 */
class ConnectionStore
{
public:
    virtual ~ConnectionStore() = default;

    virtual std::shared_ptr<Connection> Get(const std::string& identifier) const = 0;
    virtual std::set<std::string> Identifiers() const = 0;
};

class InMemoryConnectionStore : public ConnectionStore
{
public:
    std::shared_ptr<Connection> Get(const std::string& identifier) const override;
    std::set<std::string> Identifiers() const override;

    void Put(std::shared_ptr<Connection> connection);

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Connection>> connections_;
};

/**
 * Union of the external store and the container connections of one session.
 * Entries added here shadow store entries with the same identifier.
 */
class OverlayConnectionCatalog
{
public:
    // Without an orchestrator, stored connections are returned undecorated.
    OverlayConnectionCatalog(const ConnectionStore& store, LifecycleOrchestrator* orchestrator,
                             std::string username, UpdatePermission canUpdate = {});

    OverlayConnectionCatalog(const OverlayConnectionCatalog&) = delete;
    OverlayConnectionCatalog& operator=(const OverlayConnectionCatalog&) = delete;

    std::shared_ptr<Connection> Get(const std::string& identifier);

    // Caller order is kept; unknown identifiers are skipped.
    std::vector<std::shared_ptr<Connection>> List(const std::vector<std::string>& identifiers);

    std::set<std::string> Identifiers() const;

    void Add(std::shared_ptr<Connection> connection);
    bool Remove(const std::string& identifier);

    // Every container connection the overlay owns, synthesized or decorated.
    std::vector<std::shared_ptr<ContainerConnection>> ContainerConnections() const;

private:
    std::shared_ptr<Connection> Decorate(std::shared_ptr<Connection> stored);

    const ConnectionStore& store_;
    LifecycleOrchestrator* orchestrator_;
    std::string username_;
    UpdatePermission canUpdate_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<Connection>> internal_;
    std::map<std::string, std::shared_ptr<ContainerConnection>> decorated_;
};

} // namespace dockstart
