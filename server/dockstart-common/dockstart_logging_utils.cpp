#include "dockstart_logging.h"

#include "dockstart_config.h"

#include <string>

#define TAG DOCKSTART_TAG("config")

void dockstart_log_configuration_state(bool refreshed)
{
    auto& configuration = dockstart::Config();
    const std::string configPath = configuration.ConfigPath();
    const dockstart::EngineSettings engine = configuration.Engine();
    const dockstart::EndpointRetryPolicy retry = configuration.RetryPolicy();
    const auto defaultSpec = configuration.DefaultContainerSpec();

    const char* configPathStr = configPath.empty() ? "<defaults>" : configPath.c_str();
    const char* certPathStr = engine.certPath.empty() ? "<unset>" : engine.certPath.c_str();
    const char* apiVersionStr = engine.apiVersion.empty() ? "<engine default>"
                                                          : engine.apiVersion.c_str();
    const char* publicHostStr = engine.publicHostname.empty() ? "<engine host>"
                                                              : engine.publicHostname.c_str();
    const char* registryUrlStr = engine.registryUrl.empty() ? "<unset>" : engine.registryUrl.c_str();
    const char* registryUserStr =
        engine.registryUser.empty() ? "<unset>" : engine.registryUser.c_str();
    const char* registryPasswordStr = engine.registryPassword.empty() ? "<unset>" : "<redacted>";

    if (!refreshed)
        DOCKSTART_LOG_WARN(TAG, "Failed to refresh dockstart configuration at %s; using defaults",
                           configPathStr);

    DOCKSTART_LOG_INFO(TAG, "dockstart configuration loaded");
    DOCKSTART_LOG_INFO(TAG, "  config_path     : %s", configPathStr);
    DOCKSTART_LOG_INFO(TAG, "  engine_host     : %s", engine.host.c_str());
    DOCKSTART_LOG_INFO(TAG, "  verify_tls      : %s", engine.verifyTls ? "yes" : "no");
    DOCKSTART_LOG_INFO(TAG, "  cert_path       : %s", certPathStr);
    DOCKSTART_LOG_INFO(TAG, "  api_version     : %s", apiVersionStr);
    DOCKSTART_LOG_INFO(TAG, "  public_hostname : %s", publicHostStr);
    DOCKSTART_LOG_INFO(TAG, "  request_timeout : %llds",
                       static_cast<long long>(engine.requestTimeout.count()));
    DOCKSTART_LOG_INFO(TAG, "  endpoint_retry  : %d attempts, %lldms initial backoff",
                       retry.attempts, static_cast<long long>(retry.initialBackoff.count()));
    DOCKSTART_LOG_INFO(TAG, "  registry        : %s (user %s, password %s)", registryUrlStr,
                       registryUserStr, registryPasswordStr);
    if (defaultSpec)
        DOCKSTART_LOG_INFO(TAG, "  default_image   : %s (%s port %u)", defaultSpec->image.c_str(),
                           dockstart::ProtocolName(*defaultSpec->protocol),
                           static_cast<unsigned>(*defaultSpec->internalPort));
    else
        DOCKSTART_LOG_INFO(TAG, "  default_image   : <unset>");

    if (engine.publishAllPorts)
        DOCKSTART_LOG_WARN(TAG, "  publish_all_ports is enabled: every exposed container port "
                                "will be published on the engine host");
}

void dockstart_log_refresh_outcome(bool refreshed, bool reloaded)
{
    if (reloaded)
    {
        dockstart_log_configuration_state(refreshed);
        return;
    }

    if (!refreshed)
    {
        const std::string configPath = dockstart::Config().ConfigPath();
        const char* configPathStr = configPath.empty() ? "<defaults>" : configPath.c_str();
        DOCKSTART_LOG_WARN(TAG, "Failed to refresh dockstart configuration at %s; using defaults",
                           configPathStr);
    }
}
