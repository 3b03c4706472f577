#pragma once

#include "dockstart_attributes.h"
#include "dockstart_catalog.h"
#include "dockstart_orchestrator.h"

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dockstart
{

inline constexpr char kUserConnectionPrefix[] = "docker-user-";
inline constexpr char kGroupConnectionPrefix[] = "docker-group-";
inline constexpr char kDefaultConnectionId[] = "docker-default";

// Container identities: user_<u>, group_<g>_<u> and default_<u>.
inline constexpr char kUserIdentityPrefix[] = "user";
inline constexpr char kGroupIdentityPrefix[] = "group";
inline constexpr char kDefaultIdentityPrefix[] = "default";

/**
 * Scope of one login. Owns the overlay catalog holding the user's container
 * connections and releases every container on Close() or destruction.
 *
 * defaultSpec is usually Config().DefaultContainerSpec(); when set, every
 * session gets a docker-default connection.
 */
class UserSession
{
public:
    UserSession(std::string username, Entity user, std::vector<Entity> groups,
                UpdatePermission canUpdate, const ConnectionStore& store,
                LifecycleOrchestrator& orchestrator,
                std::optional<ContainerSpec> defaultSpec = std::nullopt);
    ~UserSession();

    UserSession(const UserSession&) = delete;
    UserSession& operator=(const UserSession&) = delete;

    const std::string& Username() const
    {
        return username_;
    }

    OverlayConnectionCatalog& Connections()
    {
        return catalog_;
    }

    AttributeView UserView();
    std::vector<AttributeView> GroupViews();

    // Best effort: teardown failures are logged, never thrown. Idempotent and
    // safe to race with another Close() or the destructor.
    void Close();

    bool Closed() const
    {
        return closed_.load();
    }

private:
    void AddContainerConnection(const std::string& identifier, const std::string& identityBase,
                                ContainerSpec spec);
    void SynthesizeFromEntity(const Entity& entity, const AttributeExtension& extension,
                              const std::string& identifier, const std::string& identityBase);

    std::string username_;
    Entity user_;
    std::vector<Entity> groups_;
    UpdatePermission canUpdate_;
    LifecycleOrchestrator& orchestrator_;
    OverlayConnectionCatalog catalog_;
    std::atomic_bool closed_{false};
};

} // namespace dockstart
