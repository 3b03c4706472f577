#pragma once

#include "dockstart_config.h"
#include "dockstart_container_spec.h"
#include "dockstart_engine_client.h"
#include "dockstart_lock_registry.h"

#include <atomic>
#include <string>

namespace dockstart
{

/**
 * Drives a container through create, start, resolve, stop and remove. Calls for the
 * same identity are totally ordered through the lock registry; calls for
 * different identities run in parallel. Engine state is re-read on every call.
 */
class LifecycleOrchestrator
{
public:
    LifecycleOrchestrator(ContainerEngineClient& engine, IdentityLockRegistry& locks,
                          EndpointRetryPolicy retryPolicy = EndpointRetryPolicy{});

    LifecycleOrchestrator(const LifecycleOrchestrator&) = delete;
    LifecycleOrchestrator& operator=(const LifecycleOrchestrator&) = delete;

    /**
     * Makes sure the container for identity runs and returns its endpoint.
     * Creates it at most once. The optional flag is checked before locking and
     * between engine calls; a set flag fails the call with Cancelled.
     */
    ResolvedEndpoint EnsureRunning(const std::string& identity, const ContainerSpec& spec,
                                   const std::atomic_bool* cancelled = nullptr);

    // Stops and removes the container. A container that no longer exists counts as torn down.
    void Teardown(const std::string& identity);

    const EndpointRetryPolicy& RetryPolicy() const
    {
        return retryPolicy_;
    }

private:
    void StartFresh(const std::string& identity, const ContainerSpec& spec,
                    const std::atomic_bool* cancelled);
    ResolvedEndpoint ResolveEndpoint(const std::string& identity, std::uint16_t internalPort,
                                     const std::atomic_bool* cancelled);

    ContainerEngineClient& engine_;
    IdentityLockRegistry& locks_;
    EndpointRetryPolicy retryPolicy_;
};

} // namespace dockstart
