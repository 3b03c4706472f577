#include "dockstart_logging.h"

#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <utility>

namespace dockstart
{
namespace logging
{
namespace
{
std::string FileSafe(std::string value)
{
    if (value.empty())
        return "system";

    for (char& ch : value)
    {
        if (!(std::isalnum(static_cast<unsigned char>(ch)) || ch == '-' || ch == '_'))
            ch = '_';
    }
    return value;
}

std::string Timestamp()
{
    const auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

const char* LevelName(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

std::string ContextPrefix(const LogContext& context)
{
    std::string prefix = "[user=" + context.user + "]";
    if (!context.container.empty())
        prefix.append(" [container=" + context.container + "]");
    return prefix;
}

// Global file plus one file per user. Failures to write are not reported.
void AppendToFiles(const LogContext& context, LogLevel level, const char* tag,
                   const std::string& message)
{
    static std::mutex fileMutex;
    std::lock_guard<std::mutex> lock(fileMutex);

    const std::filesystem::path root{LogDirectory()};
    std::error_code ec;
    std::filesystem::create_directories(root, ec);
    if (ec)
        return;

    const std::string line = Timestamp() + " [" + LevelName(level) + "] [" + tag + "] " +
                             ContextPrefix(context) + " " + message + '\n';

    std::ofstream global(root / "dockstart.log", std::ios::app);
    if (global.is_open())
        global << line;

    std::ofstream perUser(root / ("user_" + FileSafe(context.user) + ".log"), std::ios::app);
    if (perUser.is_open())
        perUser << line;
}

std::string FormatVa(const char* fmt, va_list args)
{
    va_list copy;
    va_copy(copy, args);
    const int needed = std::vsnprintf(nullptr, 0, fmt, copy);
    va_end(copy);
    if (needed <= 0)
        return {};

    std::string buffer(static_cast<size_t>(needed) + 1, '\0');
    std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
    buffer.resize(static_cast<size_t>(needed));
    return buffer;
}
} // namespace

LogContext& CurrentContext()
{
    thread_local LogContext context;
    return context;
}

std::string LogDirectory()
{
    const char* env = std::getenv(kLogDirectoryEnv);
    if (env && *env)
        return env;
    return kDefaultLogDirectory;
}

ScopedLogUser::ScopedLogUser(std::string user) : previous_(CurrentContext().user)
{
    CurrentContext().user = user.empty() ? "system" : std::move(user);
}

ScopedLogUser::~ScopedLogUser()
{
    CurrentContext().user = std::move(previous_);
}

ScopedLogContainer::ScopedLogContainer(std::string identity)
    : previous_(CurrentContext().container)
{
    CurrentContext().container = std::move(identity);
}

ScopedLogContainer::~ScopedLogContainer()
{
    CurrentContext().container = std::move(previous_);
}

void LogMessage(const char* tag, LogLevel level, const char* fmt, ...)
{
    va_list args;
    va_start(args, fmt);
    const std::string message = FormatVa(fmt, args);
    va_end(args);

    const LogContext context = CurrentContext();
    const std::string line = ContextPrefix(context) + " " + message;

    switch (level)
    {
    case LogLevel::Info:
        WLog_INFO(tag, "%s", line.c_str());
        break;
    case LogLevel::Warn:
        WLog_WARN(tag, "%s", line.c_str());
        break;
    case LogLevel::Error:
        WLog_ERR(tag, "%s", line.c_str());
        break;
    }

    AppendToFiles(context, level, tag, message);
}

} // namespace logging
} // namespace dockstart
