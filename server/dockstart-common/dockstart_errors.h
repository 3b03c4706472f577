#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace dockstart
{

enum class ErrorCode
{
    // Configuration errors, never retried
    MissingField = 100,
    InvalidSpec = 101,
    HostUnresolvable = 102,
    ConfigInvalid = 103,

    // Container engine errors
    NotFound = 200,
    AlreadyExists = 201,
    NotRunning = 202,
    NoPublishedPort = 203,
    EngineUnavailable = 204,
    EngineTimeout = 205,
    EngineTransport = 206,
    EngineProtocol = 207,

    // Orchestration errors
    EndpointUnavailable = 300,
    LockDisciplineViolation = 301,
    Cancelled = 302
};

class DockstartErrorCategory : public std::error_category
{
public:
    const char* name() const noexcept override;
    std::string message(int ev) const override;
};

const DockstartErrorCategory& GetDockstartErrorCategory();

std::error_code make_error_code(ErrorCode code);

bool IsConfigurationError(ErrorCode code);
bool IsEngineError(ErrorCode code);

/**
 * Single exception type raised by the orchestrator, the engine client and the
 * attribute extensions. The code tells callers which part of the taxonomy failed.
 */
class DockstartError : public std::runtime_error
{
public:
    DockstartError(ErrorCode code, const std::string& detail);

    ErrorCode Code() const noexcept
    {
        return code_;
    }

    const std::string& Detail() const noexcept
    {
        return detail_;
    }

    std::error_code ErrorCodeValue() const
    {
        return make_error_code(code_);
    }

private:
    ErrorCode code_;
    std::string detail_;
};

} // namespace dockstart

namespace std
{
template <>
struct is_error_code_enum<dockstart::ErrorCode> : true_type
{
};
} // namespace std
