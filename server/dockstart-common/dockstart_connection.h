#pragma once

#include "dockstart_attributes.h"
#include "dockstart_container_spec.h"
#include "dockstart_orchestrator.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace dockstart
{

using ParameterMap = std::map<std::string, std::string>;

inline constexpr char kHostTokenName[] = "DOCKER_HOST";
inline constexpr char kPortTokenName[] = "DOCKER_PORT";

// What a remote-desktop client needs to open the session.
struct ConnectionConfiguration
{
    std::string protocol;
    ParameterMap parameters;
};

// Replaces ${NAME} occurrences for every NAME in tokens. Unknown tokens are kept.
std::string SubstituteTokens(const std::string& value, const ParameterMap& tokens);

class Connection
{
public:
    virtual ~Connection() = default;

    virtual const std::string& Identifier() const = 0;
    virtual const std::string& Name() const = 0;
    virtual AttributeBag Attributes() const = 0;

    // Stored parameters. Never provisions anything.
    virtual ConnectionConfiguration Configuration() const = 0;

    // Parameters ready for use, provisioning backing resources if needed.
    virtual ConnectionConfiguration Connect() = 0;
};

/**
 * Connection kept by the external store.
 */
class StoredConnection : public Connection
{
public:
    StoredConnection(std::string identifier, std::string name, ConnectionConfiguration configuration,
                     AttributeBag attributes = {});

    const std::string& Identifier() const override
    {
        return identifier_;
    }

    const std::string& Name() const override
    {
        return name_;
    }

    AttributeBag Attributes() const override
    {
        return attributes_;
    }

    ConnectionConfiguration Configuration() const override
    {
        return configuration_;
    }

    ConnectionConfiguration Connect() override
    {
        return configuration_;
    }

private:
    std::string identifier_;
    std::string name_;
    ConnectionConfiguration configuration_;
    AttributeBag attributes_;
};

enum class ProvisioningState
{
    Unprovisioned,
    Provisioning,
    Ready,
    TornDown
};

const char* ProvisioningStateName(ProvisioningState state);

/**
 * Connection backed by a single-use container. The container is provisioned
 * on the first Connect() and stopped by Release(). A failed provisioning
 * leaves the connection Unprovisioned so a later Connect() retries.
 */
class ContainerConnection : public Connection
{
public:
    // Synthesized from user, group or default attributes.
    ContainerConnection(std::string identifier, std::string name, std::string identity,
                        ContainerSpec spec, LifecycleOrchestrator& orchestrator,
                        std::string username);

    // Wraps a stored connection carrying container attributes.
    ContainerConnection(std::shared_ptr<Connection> stored, std::string identity,
                        ContainerSpec spec, LifecycleOrchestrator& orchestrator,
                        std::string username, bool canUpdate);

    ContainerConnection(const ContainerConnection&) = delete;
    ContainerConnection& operator=(const ContainerConnection&) = delete;

    const std::string& Identifier() const override;
    const std::string& Name() const override;
    AttributeBag Attributes() const override;
    ConnectionConfiguration Configuration() const override;
    ConnectionConfiguration Connect() override;

    // Stops the backing container if one was provisioned. Errors propagate.
    void Release();

    ProvisioningState State() const;

    const std::string& Identity() const
    {
        return identity_;
    }

    const ContainerSpec& Spec() const
    {
        return spec_;
    }

    const std::shared_ptr<Connection>& Stored() const
    {
        return stored_;
    }

private:
    ConnectionConfiguration BuildConfiguration(const ResolvedEndpoint& endpoint) const;
    ProvisioningState SetState(ProvisioningState state);

    std::shared_ptr<Connection> stored_;
    std::string identifier_;
    std::string name_;
    std::string identity_;
    ContainerSpec spec_;
    LifecycleOrchestrator& orchestrator_;
    std::string username_;
    bool canUpdate_;

    // Serializes Connect() and Release(); held across engine calls.
    std::mutex operationMutex_;
    // Guards state_ only, so State() never waits on the engine.
    mutable std::mutex mutex_;
    ProvisioningState state_;
};

} // namespace dockstart
