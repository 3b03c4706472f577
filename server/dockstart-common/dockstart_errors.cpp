#include "dockstart_errors.h"

#include <sstream>

namespace dockstart
{
namespace
{
std::string FormatWhat(ErrorCode code, const std::string& detail)
{
    std::ostringstream stream;
    stream << '[' << GetDockstartErrorCategory().name() << ' ' << static_cast<int>(code) << "] "
           << GetDockstartErrorCategory().message(static_cast<int>(code));
    if (!detail.empty())
        stream << ": " << detail;
    return stream.str();
}
} // namespace

const char* DockstartErrorCategory::name() const noexcept
{
    return "dockstart";
}

std::string DockstartErrorCategory::message(int ev) const
{
    switch (static_cast<ErrorCode>(ev))
    {
    case ErrorCode::MissingField:
        return "Required container field missing";
    case ErrorCode::InvalidSpec:
        return "Invalid container specification";
    case ErrorCode::HostUnresolvable:
        return "Container engine host cannot be resolved";
    case ErrorCode::ConfigInvalid:
        return "Invalid configuration";
    case ErrorCode::NotFound:
        return "Container not found";
    case ErrorCode::AlreadyExists:
        return "Container already exists";
    case ErrorCode::NotRunning:
        return "Container is not running";
    case ErrorCode::NoPublishedPort:
        return "No published host port";
    case ErrorCode::EngineUnavailable:
        return "Container engine unavailable";
    case ErrorCode::EngineTimeout:
        return "Container engine request timed out";
    case ErrorCode::EngineTransport:
        return "Container engine transport failure";
    case ErrorCode::EngineProtocol:
        return "Container engine rejected request";
    case ErrorCode::EndpointUnavailable:
        return "Container endpoint unavailable";
    case ErrorCode::LockDisciplineViolation:
        return "Container created concurrently despite identity lock";
    case ErrorCode::Cancelled:
        return "Operation cancelled";
    }
    return "Unknown error";
}

const DockstartErrorCategory& GetDockstartErrorCategory()
{
    static DockstartErrorCategory category;
    return category;
}

std::error_code make_error_code(ErrorCode code)
{
    return {static_cast<int>(code), GetDockstartErrorCategory()};
}

bool IsConfigurationError(ErrorCode code)
{
    const int value = static_cast<int>(code);
    return value >= 100 && value < 200;
}

bool IsEngineError(ErrorCode code)
{
    const int value = static_cast<int>(code);
    return value >= 200 && value < 300;
}

DockstartError::DockstartError(ErrorCode code, const std::string& detail)
    : std::runtime_error(FormatWhat(code, detail)), code_(code), detail_(detail)
{
}

} // namespace dockstart
