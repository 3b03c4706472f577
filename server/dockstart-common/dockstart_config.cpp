#include "dockstart_config.h"

#include "dockstart_config_parser.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace
{
constexpr char kDefaultConfigPath[] = "/etc/dockstart/dockstart.yaml";
constexpr char kEnvConfigPath[] = "DOCKSTART_CONFIG";
constexpr char kDefaultEngineHost[] = "unix:///var/run/docker.sock";
} // namespace

namespace dockstart
{

DockstartConfig& DockstartConfig::Instance()
{
    static DockstartConfig instance;
    return instance;
}

DockstartConfig::DockstartConfig()
    : configPath_(), engine_(), retryPolicy_(), defaultImage_(), defaultPort_(),
      defaultProtocol_(), defaultCommand_(), hasLastWrite_(false), loaded_(false),
      reloaded_(false)
{
    const char* env = std::getenv(kEnvConfigPath);
    if (env && *env)
        configPath_ = env;
    else
        configPath_ = kDefaultConfigPath;

    ApplyDefaultsUnlocked();
}

void DockstartConfig::SetConfigPath(const std::string& path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (path.empty() || path == configPath_)
        return;

    configPath_ = path;
    hasLastWrite_ = false;
    loaded_ = false;
}

std::string DockstartConfig::ConfigPath() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return configPath_;
}

bool DockstartConfig::Refresh()
{
    std::lock_guard<std::mutex> lock(mutex_);
    bool reloaded = false;

    if (!loaded_)
    {
        ApplyDefaultsUnlocked();
        reloaded = true;
    }

    if (configPath_.empty())
    {
        loaded_ = true;
        hasLastWrite_ = false;
        reloaded_ = reloaded;
        return true;
    }

    std::error_code ec;
    const auto writeTime = std::filesystem::last_write_time(configPath_, ec);
    if (ec)
    {
        hasLastWrite_ = false;
        loaded_ = true;
        reloaded_ = reloaded;
        return false;
    }

    if (!hasLastWrite_ || writeTime != lastWrite_ || !loaded_)
    {
        if (!LoadFromFileUnlocked(configPath_))
        {
            ApplyDefaultsUnlocked();
            hasLastWrite_ = false;
            loaded_ = true;
            reloaded_ = true;
            return false;
        }
        lastWrite_ = writeTime;
        hasLastWrite_ = true;
        loaded_ = true;
        reloaded = true;
    }

    reloaded_ = reloaded;
    return true;
}

bool DockstartConfig::ConsumeReloadedFlag()
{
    std::lock_guard<std::mutex> lock(mutex_);
    const bool value = reloaded_;
    reloaded_ = false;
    return value;
}

bool DockstartConfig::LoadFromString(const std::string& content)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ApplyDefaultsUnlocked();
    const bool parsed = ParseYamlContentUnlocked(content);
    if (!parsed)
        ApplyDefaultsUnlocked();
    loaded_ = true;
    hasLastWrite_ = false;
    reloaded_ = true;
    return parsed;
}

EngineSettings DockstartConfig::Engine() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_;
}

EndpointRetryPolicy DockstartConfig::RetryPolicy() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return retryPolicy_;
}

std::string DockstartConfig::EngineHost() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.host;
}

bool DockstartConfig::VerifyTls() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.verifyTls;
}

std::string DockstartConfig::CertPath() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.certPath;
}

std::string DockstartConfig::ApiVersion() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.apiVersion;
}

std::string DockstartConfig::PublicHostname() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.publicHostname;
}

bool DockstartConfig::PublishAllPorts() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.publishAllPorts;
}

std::chrono::seconds DockstartConfig::RequestTimeout() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_.requestTimeout;
}

bool DockstartConfig::HasRegistryCredentials() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return !engine_.registryUser.empty();
}

std::optional<ContainerSpec> DockstartConfig::DefaultContainerSpec() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (defaultImage_.empty() || !defaultPort_ || !defaultProtocol_)
        return std::nullopt;

    ContainerSpec spec;
    spec.image = defaultImage_;
    spec.internalPort = defaultPort_;
    spec.protocol = defaultProtocol_;
    if (!defaultCommand_.empty())
        spec.command = defaultCommand_;
    return spec;
}

void DockstartConfig::ApplyDefaultsUnlocked()
{
    engine_ = EngineSettings{};
    engine_.host = kDefaultEngineHost;
    retryPolicy_ = EndpointRetryPolicy{};
    defaultImage_.clear();
    defaultPort_.reset();
    defaultProtocol_.reset();
    defaultCommand_.clear();
}

bool DockstartConfig::LoadFromFileUnlocked(const std::string& path)
{
    std::ifstream stream(path);
    if (!stream.is_open())
    {
        std::cerr << "Unable to open configuration file: " << path << std::endl;
        return false;
    }

    std::stringstream buffer;
    buffer << stream.rdbuf();

    ApplyDefaultsUnlocked();

    return ParseYamlContentUnlocked(buffer.str());
}

bool DockstartConfig::ParseYamlContentUnlocked(const std::string& content)
{
    return ParseDockstartConfigYaml(content, *this);
}

std::string DockstartConfig::Trim(const std::string& value)
{
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string DockstartConfig::StripQuotes(const std::string& value)
{
    if (value.size() >= 2)
    {
        const char front = value.front();
        const char back = value.back();
        if ((front == '"' && back == '"') || (front == '\'' && back == '\''))
            return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string DockstartConfig::ToLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

DockstartConfig& Config()
{
    return DockstartConfig::Instance();
}

} // namespace dockstart
