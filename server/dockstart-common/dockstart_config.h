#pragma once

#include "dockstart_container_spec.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace dockstart
{
class ConfigYamlParser;

/**
 * Connection parameters for the container engine. Handed as-is to the engine
 * client; certificate material stays on disk.
 */
struct EngineSettings
{
    std::string host;
    bool verifyTls = false;
    std::string certPath;
    std::string apiVersion;
    std::string publicHostname;
    bool publishAllPorts = false;
    std::chrono::seconds requestTimeout{60};
    std::string registryUrl;
    std::string registryUser;
    std::string registryPassword;
    std::string registryEmail;
};

struct EndpointRetryPolicy
{
    int attempts = 5;
    std::chrono::milliseconds initialBackoff{200};
    std::chrono::milliseconds maxBackoff{2000};
};

class DockstartConfig
{
public:
    static DockstartConfig& Instance();

    void SetConfigPath(const std::string& path);
    std::string ConfigPath() const;

    bool Refresh();
    bool ConsumeReloadedFlag();

    // Replaces the current state with defaults overlaid by the given YAML text.
    bool LoadFromString(const std::string& content);

    EngineSettings Engine() const;
    EndpointRetryPolicy RetryPolicy() const;
    std::string EngineHost() const;
    bool VerifyTls() const;
    std::string CertPath() const;
    std::string ApiVersion() const;
    std::string PublicHostname() const;
    bool PublishAllPorts() const;
    std::chrono::seconds RequestTimeout() const;
    bool HasRegistryCredentials() const;

    // Spec of the connection offered to every session, if one is configured.
    std::optional<ContainerSpec> DefaultContainerSpec() const;

private:
    DockstartConfig();
    DockstartConfig(const DockstartConfig&) = delete;
    DockstartConfig& operator=(const DockstartConfig&) = delete;

    friend class ConfigYamlParser;

    void ApplyDefaultsUnlocked();
    bool LoadFromFileUnlocked(const std::string& path);
    bool ParseYamlContentUnlocked(const std::string& content);

    static std::string Trim(const std::string& value);
    static std::string StripQuotes(const std::string& value);
    static std::string ToLower(std::string value);

    mutable std::mutex mutex_;
    std::string configPath_;
    EngineSettings engine_;
    EndpointRetryPolicy retryPolicy_;
    std::string defaultImage_;
    std::optional<std::uint16_t> defaultPort_;
    std::optional<Protocol> defaultProtocol_;
    std::string defaultCommand_;
    std::filesystem::file_time_type lastWrite_;
    bool hasLastWrite_;
    bool loaded_;
    bool reloaded_;
};

DockstartConfig& Config();

} // namespace dockstart

void dockstart_log_configuration_state(bool refreshed);
void dockstart_log_refresh_outcome(bool refreshed, bool reloaded);
