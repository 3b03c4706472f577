#include "dockstart_engine_client.h"

namespace dockstart
{

const char* RuntimeStateName(ContainerRuntimeState state)
{
    switch (state)
    {
    case ContainerRuntimeState::Absent:
        return "absent";
    case ContainerRuntimeState::Created:
        return "created";
    case ContainerRuntimeState::Running:
        return "running";
    case ContainerRuntimeState::Unknown:
        return "unknown";
    }
    return "unknown";
}

} // namespace dockstart
