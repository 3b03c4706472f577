#pragma once

#include "dockstart_container_spec.h"

#include <cstdint>
#include <string>

namespace dockstart
{

/**
 * Observed state of a container. Always re-read from the engine.
 */
enum class ContainerRuntimeState
{
    Absent,
    Created,
    Running,
    Unknown
};

const char* RuntimeStateName(ContainerRuntimeState state);

/**
 * Host and port reaching a running container. Stale as soon as it stops.
 */
struct ResolvedEndpoint
{
    std::string hostname;
    std::string port;

    bool operator==(const ResolvedEndpoint& other) const
    {
        return hostname == other.hostname && port == other.port;
    }

    bool operator!=(const ResolvedEndpoint& other) const
    {
        return !(*this == other);
    }
};

/**
 * Blocking facade over a container engine. Every call is a network round trip
 * and failures are raised as DockstartError with an engine error code.
 */
class ContainerEngineClient
{
public:
    virtual ~ContainerEngineClient() = default;

    // False when the engine reports the identity as unknown.
    virtual bool Exists(const std::string& identity) = 0;

    // Creates without starting. Throws AlreadyExists when the identity is taken.
    virtual std::string Create(const std::string& identity, const ContainerSpec& spec) = 0;

    // Throws NotFound when the container does not exist.
    virtual void Start(const std::string& containerId) = 0;

    // Returns Unknown when the engine cannot be reached.
    virtual ContainerRuntimeState InspectState(const std::string& identity) = 0;

    // Throws NotRunning, or NoPublishedPort while the engine has not bound the port yet.
    virtual ResolvedEndpoint InspectEndpoint(const std::string& identity,
                                             std::uint16_t internalPort) = 0;

    // Throws NotFound when absent. Stopping a stopped container succeeds.
    virtual void Stop(const std::string& identity) = 0;

    // Deletes a stopped container so the identity can be created again. Throws NotFound when absent.
    virtual void Remove(const std::string& identity) = 0;
};

} // namespace dockstart
