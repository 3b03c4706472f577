#pragma once

#include "dockstart_config.h"
#include "dockstart_endpoint_resolver.h"
#include "dockstart_engine_client.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

namespace dockstart
{

struct EngineRequest
{
    std::string method;
    std::string path;
    std::optional<std::string> body;
    std::vector<std::string> headers;
};

struct EngineResponse
{
    long status = 0;
    std::string body;
};

// Sends one request to the engine API; path is relative to the versioned base URL.
// Transport failures throw DockstartError with an engine error code.
using HttpTransport = std::function<EngineResponse(const EngineRequest&)>;

/**
 * ContainerEngineClient speaking the Docker Engine REST API through libcurl,
 * over the local unix socket or TCP with optional TLS client certificates.
 *
 * The engine host is resolved once at construction; an unresolvable host
 * throws DockstartError(HostUnresolvable). Each request is bounded by the
 * configured timeout. A transport may be injected in place of libcurl.
 */
class DockerEngineClient : public ContainerEngineClient
{
public:
    explicit DockerEngineClient(EngineSettings settings, HttpTransport transport = {});
    ~DockerEngineClient() override = default;

    DockerEngineClient(const DockerEngineClient&) = delete;
    DockerEngineClient& operator=(const DockerEngineClient&) = delete;

    bool Exists(const std::string& identity) override;
    std::string Create(const std::string& identity, const ContainerSpec& spec) override;
    void Start(const std::string& containerId) override;
    ContainerRuntimeState InspectState(const std::string& identity) override;
    ResolvedEndpoint InspectEndpoint(const std::string& identity,
                                     std::uint16_t internalPort) override;
    void Stop(const std::string& identity) override;
    void Remove(const std::string& identity) override;

private:
    EngineResponse Perform(const char* method, const std::string& path,
                           const std::string* body = nullptr,
                           const std::vector<std::string>& extraHeaders = {});
    EngineResponse CurlPerform(const EngineRequest& request);
    std::optional<Json::Value> InspectContainer(const std::string& identity);
    EngineResponse PostCreate(const std::string& identity, const std::string& payload);
    void PullImage(const std::string& image);
    std::string BuildUrl(const std::string& path) const;

    EngineSettings settings_;
    EngineHostUri uri_;
    std::string baseUrl_;
    EngineHostResolver hostResolver_;
    HttpTransport transport_;
};

} // namespace dockstart
