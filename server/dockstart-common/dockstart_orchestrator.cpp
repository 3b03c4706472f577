#include "dockstart_orchestrator.h"

#include "dockstart_errors.h"
#include "dockstart_logging.h"

#include <algorithm>
#include <chrono>
#include <thread>

#define TAG DOCKSTART_TAG("orchestrator")

namespace dockstart
{
namespace
{
void ThrowIfCancelled(const std::atomic_bool* cancelled, const std::string& identity)
{
    if (cancelled && cancelled->load())
    {
        DOCKSTART_LOG_WARN(TAG, "Operation on container %s cancelled", identity.c_str());
        throw DockstartError(ErrorCode::Cancelled, identity);
    }
}
} // namespace

LifecycleOrchestrator::LifecycleOrchestrator(ContainerEngineClient& engine,
                                             IdentityLockRegistry& locks,
                                             EndpointRetryPolicy retryPolicy)
    : engine_(engine), locks_(locks), retryPolicy_(retryPolicy)
{
    if (retryPolicy_.attempts < 1)
        retryPolicy_.attempts = 1;
    if (retryPolicy_.maxBackoff < retryPolicy_.initialBackoff)
        retryPolicy_.maxBackoff = retryPolicy_.initialBackoff;
}

ResolvedEndpoint LifecycleOrchestrator::EnsureRunning(const std::string& identity,
                                                      const ContainerSpec& spec,
                                                      const std::atomic_bool* cancelled)
{
    // Caller errors never reach the engine.
    ValidateContainerSpec(spec);
    ThrowIfCancelled(cancelled, identity);

    logging::ScopedLogContainer scopedContainer(identity);
    const IdentityLock lock = locks_.Acquire(identity);
    ThrowIfCancelled(cancelled, identity);

    const ContainerRuntimeState state = engine_.InspectState(identity);
    DOCKSTART_LOG_INFO(TAG, "Ensuring container %s is running (current state: %s)",
                       identity.c_str(), RuntimeStateName(state));

    switch (state)
    {
    case ContainerRuntimeState::Absent:
        StartFresh(identity, spec, cancelled);
        break;
    case ContainerRuntimeState::Created:
        ThrowIfCancelled(cancelled, identity);
        engine_.Start(identity);
        break;
    case ContainerRuntimeState::Running:
        break;
    case ContainerRuntimeState::Unknown:
        DOCKSTART_LOG_ERROR(TAG, "State of container %s unknown, refusing to create it",
                            identity.c_str());
        throw DockstartError(ErrorCode::EngineUnavailable,
                             "state of " + identity + " could not be determined");
    }

    ThrowIfCancelled(cancelled, identity);
    return ResolveEndpoint(identity, *spec.internalPort, cancelled);
}

void LifecycleOrchestrator::StartFresh(const std::string& identity, const ContainerSpec& spec,
                                       const std::atomic_bool* cancelled)
{
    ThrowIfCancelled(cancelled, identity);

    std::string containerId;
    try
    {
        containerId = engine_.Create(identity, spec);
    }
    catch (const DockstartError& ex)
    {
        if (ex.Code() != ErrorCode::AlreadyExists)
            throw;

        DOCKSTART_LOG_ERROR(TAG, "Container %s appeared while its identity lock was held: %s",
                            identity.c_str(), ex.what());
        throw DockstartError(ErrorCode::LockDisciplineViolation, identity);
    }

    ThrowIfCancelled(cancelled, identity);
    engine_.Start(containerId.empty() ? identity : containerId);
}

ResolvedEndpoint LifecycleOrchestrator::ResolveEndpoint(const std::string& identity,
                                                        std::uint16_t internalPort,
                                                        const std::atomic_bool* cancelled)
{
    auto backoff = retryPolicy_.initialBackoff;
    for (int attempt = 1;; ++attempt)
    {
        try
        {
            return engine_.InspectEndpoint(identity, internalPort);
        }
        catch (const DockstartError& ex)
        {
            if (ex.Code() != ErrorCode::NoPublishedPort)
                throw;

            if (attempt >= retryPolicy_.attempts)
            {
                DOCKSTART_LOG_ERROR(TAG, "No host port published for %s:%u after %d attempts",
                                    identity.c_str(), static_cast<unsigned>(internalPort),
                                    attempt);
                throw DockstartError(ErrorCode::EndpointUnavailable,
                                     identity + ":" + std::to_string(internalPort));
            }

            DOCKSTART_LOG_INFO(TAG, "Port %u of %s not published yet, retrying in %lld ms",
                               static_cast<unsigned>(internalPort), identity.c_str(),
                               static_cast<long long>(backoff.count()));
        }

        std::this_thread::sleep_for(backoff);
        ThrowIfCancelled(cancelled, identity);
        backoff = std::min(backoff * 2, retryPolicy_.maxBackoff);
    }
}

void LifecycleOrchestrator::Teardown(const std::string& identity)
{
    logging::ScopedLogContainer scopedContainer(identity);
    const IdentityLock lock = locks_.Acquire(identity);

    // The container is removed as well so the next EnsureRunning creates a fresh one.
    try
    {
        engine_.Stop(identity);
        engine_.Remove(identity);
        DOCKSTART_LOG_INFO(TAG, "Container %s stopped and removed", identity.c_str());
    }
    catch (const DockstartError& ex)
    {
        if (ex.Code() != ErrorCode::NotFound)
            throw;

        DOCKSTART_LOG_INFO(TAG, "Container %s already gone", identity.c_str());
    }
}

} // namespace dockstart
