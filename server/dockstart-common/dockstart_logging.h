#pragma once

#include <string>

#include <winpr/wlog.h>

#define DOCKSTART_TAG(tag) "com.dockstart." tag

namespace dockstart
{
namespace logging
{
enum class LogLevel
{
    Info,
    Warn,
    Error
};

inline constexpr char kDefaultLogDirectory[] = "/var/log/dockstart";
inline constexpr char kLogDirectoryEnv[] = "DOCKSTART_LOG_DIR";

/**
 * Per-thread logging context. Every line carries the user the work is done
 * for and, inside orchestrator calls, the container identity.
 */
struct LogContext
{
    std::string user = "system";
    std::string container;
};

LogContext& CurrentContext();

// Directory of the log files; DOCKSTART_LOG_DIR overrides the default.
std::string LogDirectory();

class ScopedLogUser
{
public:
    explicit ScopedLogUser(std::string user);
    ~ScopedLogUser();

    ScopedLogUser(const ScopedLogUser&) = delete;
    ScopedLogUser& operator=(const ScopedLogUser&) = delete;

private:
    std::string previous_;
};

class ScopedLogContainer
{
public:
    explicit ScopedLogContainer(std::string identity);
    ~ScopedLogContainer();

    ScopedLogContainer(const ScopedLogContainer&) = delete;
    ScopedLogContainer& operator=(const ScopedLogContainer&) = delete;

private:
    std::string previous_;
};

void LogMessage(const char* tag, LogLevel level, const char* fmt, ...);

} // namespace logging
} // namespace dockstart

#define DOCKSTART_LOG_INFO(tag, fmt, ...) \
    ::dockstart::logging::LogMessage(tag, ::dockstart::logging::LogLevel::Info, fmt, ##__VA_ARGS__)

#define DOCKSTART_LOG_WARN(tag, fmt, ...) \
    ::dockstart::logging::LogMessage(tag, ::dockstart::logging::LogLevel::Warn, fmt, ##__VA_ARGS__)

#define DOCKSTART_LOG_ERROR(tag, fmt, ...) \
    ::dockstart::logging::LogMessage(tag, ::dockstart::logging::LogLevel::Error, fmt, ##__VA_ARGS__)
