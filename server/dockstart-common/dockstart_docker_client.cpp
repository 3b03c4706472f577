#include "dockstart_docker_client.h"

#include "dockstart_docker_constants.h"
#include "dockstart_docker_internal.h"
#include "dockstart_errors.h"
#include "dockstart_logging.h"

#include <curl/curl.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#define TAG DOCKSTART_TAG("docker-client")

namespace dockstart
{
namespace
{
void EnsureCurlInitialized()
{
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

bool IsSuccess(long httpCode)
{
    return httpCode >= 200 && httpCode < 300;
}

std::string Escape(const std::string& value)
{
    std::unique_ptr<char, decltype(&curl_free)> escaped(
        curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size())), curl_free);
    if (!escaped)
        throw DockstartError(ErrorCode::EngineTransport, "unable to escape '" + value + "'");
    return escaped.get();
}
} // namespace

ErrorCode MapCurlError(CURLcode code)
{
    switch (code)
    {
    case CURLE_OPERATION_TIMEDOUT:
        return ErrorCode::EngineTimeout;
    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
        return ErrorCode::EngineUnavailable;
    default:
        return ErrorCode::EngineTransport;
    }
}

bool IsTransportFailure(ErrorCode code)
{
    return code == ErrorCode::EngineUnavailable || code == ErrorCode::EngineTimeout ||
           code == ErrorCode::EngineTransport;
}

CreateStatus ClassifyCreateStatus(long status)
{
    if (IsSuccess(status))
        return CreateStatus::Created;
    if (status == kHttpNotFound)
        return CreateStatus::ImageMissing;
    if (status == kHttpConflict)
        return CreateStatus::Conflict;
    return CreateStatus::Rejected;
}

bool CheckLifecycleResponse(const char* operation, const std::string& target,
                            const EngineResponse& response)
{
    if (response.status == kHttpNotFound)
        throw DockstartError(ErrorCode::NotFound, target);

    if (response.status == kHttpNotModified)
        return false;

    if (!IsSuccess(response.status))
    {
        const std::string details = ParseEngineErrorResponse(response.body);
        DOCKSTART_LOG_ERROR(TAG, "Failed to %s container %s, HTTP code: %ld (%s)", operation,
                            target.c_str(), response.status, details.c_str());
        throw DockstartError(ErrorCode::EngineProtocol,
                             std::string(operation) + " " + target + ": " + details);
    }
    return true;
}

DockerEngineClient::DockerEngineClient(EngineSettings settings, HttpTransport transport)
    : settings_(std::move(settings)), uri_(ParseEngineHostUri(settings_.host)),
      hostResolver_(settings_), transport_(std::move(transport))
{
    EnsureCurlInitialized();

    if (uri_.scheme == "unix")
    {
        if (uri_.path.empty())
            throw DockstartError(ErrorCode::ConfigInvalid,
                                 "unix engine host has no socket path: " + settings_.host);
        baseUrl_ = kUnixSocketBaseUrl;
    }
    else if (uri_.scheme == "tcp" || uri_.scheme == "http" || uri_.scheme == "https")
    {
        const bool tls = settings_.verifyTls || uri_.scheme == "https";
        const std::string host =
            uri_.host.find(':') != std::string::npos ? "[" + uri_.host + "]" : uri_.host;
        const std::string port = uri_.port.empty() ? (tls ? "2376" : "2375") : uri_.port;
        baseUrl_ = std::string(tls ? "https://" : "http://") + host + ":" + port;
    }
    else
    {
        throw DockstartError(ErrorCode::ConfigInvalid,
                             "unsupported engine host scheme: " + uri_.scheme);
    }

    if (!settings_.apiVersion.empty())
        baseUrl_.append("/v" + settings_.apiVersion);

    if (!transport_)
        transport_ = [this](const EngineRequest& request) { return CurlPerform(request); };

    DOCKSTART_LOG_INFO(TAG, "Docker engine client ready (host=%s, api=%s, tls=%s)",
                       settings_.host.c_str(),
                       settings_.apiVersion.empty() ? "<default>" : settings_.apiVersion.c_str(),
                       settings_.verifyTls ? "verify" : "off");
}

std::string DockerEngineClient::BuildUrl(const std::string& path) const
{
    std::string url = baseUrl_;
    url.append(path);
    return url;
}

EngineResponse DockerEngineClient::Perform(const char* method, const std::string& path,
                                           const std::string* body,
                                           const std::vector<std::string>& extraHeaders)
{
    EngineRequest request;
    request.method = method;
    request.path = path;
    if (body)
        request.body = *body;
    request.headers = extraHeaders;
    return transport_(request);
}

EngineResponse DockerEngineClient::CurlPerform(const EngineRequest& request)
{
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
        throw DockstartError(ErrorCode::EngineTransport, "unable to allocate CURL handle");

    curl_slist* list = nullptr;
    std::vector<std::string> headerLines = request.headers;
    if (request.body)
        headerLines.emplace_back("Content-Type: application/json");
    for (const auto& header : headerLines)
    {
        curl_slist* next = curl_slist_append(list, header.c_str());
        if (!next)
        {
            curl_slist_free_all(list);
            throw DockstartError(ErrorCode::EngineTransport, "unable to allocate request headers");
        }
        list = next;
    }
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(list, curl_slist_free_all);

    EngineResponse response;
    const std::string url = BuildUrl(request.path);

    if (uri_.scheme == "unix")
        curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, uri_.path.c_str());

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, static_cast<long>(kConnectTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT,
                     static_cast<long>(settings_.requestTimeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    if (headers)
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

    if (request.method == "GET")
    {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    }
    else
    {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (request.body)
        {
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body->c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                             static_cast<long>(request.body->size()));
        }
        else if (request.method == "POST")
        {
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, "");
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, 0L);
        }
    }

    const std::string caPath = (std::filesystem::path(settings_.certPath) / kTlsCaFile).string();
    const std::string certPath = (std::filesystem::path(settings_.certPath) / kTlsCertFile).string();
    const std::string keyPath = (std::filesystem::path(settings_.certPath) / kTlsKeyFile).string();
    if (url.rfind("https://", 0) == 0)
    {
        if (!settings_.certPath.empty())
        {
            curl_easy_setopt(curl.get(), CURLOPT_CAINFO, caPath.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_SSLCERT, certPath.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_SSLKEY, keyPath.c_str());
        }
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, settings_.verifyTls ? 1L : 0L);
        curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, settings_.verifyTls ? 2L : 0L);
    }

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK)
    {
        DOCKSTART_LOG_ERROR(TAG, "%s %s failed: %s", request.method.c_str(), request.path.c_str(),
                            curl_easy_strerror(res));
        throw DockstartError(MapCurlError(res), request.method + " " + request.path + ": " +
                                                    curl_easy_strerror(res));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::optional<Json::Value> DockerEngineClient::InspectContainer(const std::string& identity)
{
    const EngineResponse response = Perform("GET", "/containers/" + Escape(identity) + "/json");
    if (response.status == kHttpNotFound)
        return std::nullopt;

    if (!IsSuccess(response.status))
    {
        const std::string details = ParseEngineErrorResponse(response.body);
        DOCKSTART_LOG_ERROR(TAG, "HTTP error %ld while inspecting container %s: %s",
                            response.status, identity.c_str(), details.c_str());
        throw DockstartError(ErrorCode::EngineProtocol, "inspect " + identity + ": " + details);
    }

    Json::Value root;
    std::string errs;
    if (!ParseJson(response.body, root, &errs) || !root.isObject())
    {
        DOCKSTART_LOG_ERROR(TAG, "Failed to parse inspect response for %s: %s", identity.c_str(),
                            errs.c_str());
        throw DockstartError(ErrorCode::EngineProtocol, "unparsable inspect response for " + identity);
    }

    return root;
}

bool DockerEngineClient::Exists(const std::string& identity)
{
    const bool exists = InspectContainer(identity).has_value();
    if (!exists)
        DOCKSTART_LOG_INFO(TAG, "Container does not exist: %s", identity.c_str());
    return exists;
}

EngineResponse DockerEngineClient::PostCreate(const std::string& identity,
                                              const std::string& payload)
{
    return Perform("POST", "/containers/create?name=" + Escape(identity), &payload);
}

std::string DockerEngineClient::Create(const std::string& identity, const ContainerSpec& spec)
{
    const std::string payload = WriteCompactJson(BuildCreatePayload(spec, settings_.publishAllPorts));
    DOCKSTART_LOG_INFO(TAG, "Creating container %s from image %s (port %u)", identity.c_str(),
                       spec.image.c_str(), static_cast<unsigned>(*spec.internalPort));
    if (settings_.publishAllPorts)
        DOCKSTART_LOG_WARN(TAG, "Container %s publishes all exposed ports", identity.c_str());

    EngineResponse response = PostCreate(identity, payload);
    if (ClassifyCreateStatus(response.status) == CreateStatus::ImageMissing)
    {
        DOCKSTART_LOG_INFO(TAG, "Image %s missing on engine; pulling before retrying create",
                           spec.image.c_str());
        PullImage(spec.image);
        response = PostCreate(identity, payload);
    }

    switch (ClassifyCreateStatus(response.status))
    {
    case CreateStatus::Created:
        break;
    case CreateStatus::Conflict:
        DOCKSTART_LOG_WARN(TAG, "Container %s already exists", identity.c_str());
        throw DockstartError(ErrorCode::AlreadyExists, identity);
    case CreateStatus::ImageMissing:
        throw DockstartError(ErrorCode::NotFound, "image " + spec.image + ": " +
                                                      ParseEngineErrorResponse(response.body));
    case CreateStatus::Rejected:
    {
        const std::string details = ParseEngineErrorResponse(response.body);
        DOCKSTART_LOG_ERROR(TAG, "Failed to create container %s, HTTP code: %ld (%s)",
                            identity.c_str(), response.status, details.c_str());
        throw DockstartError(ErrorCode::EngineProtocol, "create " + identity + ": " + details);
    }
    }

    Json::Value created;
    if (!ParseJson(response.body, created) || created.get("Id", "").asString().empty())
        throw DockstartError(ErrorCode::EngineProtocol,
                             "create response for " + identity + " has no Id");

    const std::string containerId = created["Id"].asString();
    DOCKSTART_LOG_INFO(TAG, "Created container %s (%s)", identity.c_str(),
                       containerId.substr(0, 12).c_str());
    return containerId;
}

void DockerEngineClient::PullImage(const std::string& image)
{
    const auto reference = SplitImageReference(image);
    std::string path = "/images/create?fromImage=" + Escape(reference.first);
    if (!reference.second.empty())
        path.append("&tag=" + Escape(reference.second));

    std::vector<std::string> headers;
    const std::string authHeader = BuildRegistryAuthHeader(settings_);
    if (!authHeader.empty())
        headers.push_back(authHeader);

    const EngineResponse response = Perform("POST", path, nullptr, headers);
    if (!IsSuccess(response.status))
    {
        const std::string details = ParseEngineErrorResponse(response.body);
        DOCKSTART_LOG_ERROR(TAG, "Failed to pull image %s, HTTP code: %ld (%s)", image.c_str(),
                            response.status, details.c_str());
        if (response.status == kHttpNotFound)
            throw DockstartError(ErrorCode::NotFound, "image " + image + ": " + details);
        throw DockstartError(ErrorCode::EngineProtocol, "pull " + image + ": " + details);
    }

    std::string pullError;
    if (FindPullError(response.body, pullError))
    {
        DOCKSTART_LOG_ERROR(TAG, "Pull of image %s reported: %s", image.c_str(),
                            SanitizeForLog(pullError).c_str());
        throw DockstartError(ErrorCode::EngineProtocol, "pull " + image + ": " + pullError);
    }

    DOCKSTART_LOG_INFO(TAG, "Pulled image %s", image.c_str());
}

void DockerEngineClient::Start(const std::string& containerId)
{
    DOCKSTART_LOG_INFO(TAG, "Starting container: %s", containerId.c_str());

    const EngineResponse response =
        Perform("POST", "/containers/" + Escape(containerId) + "/start");
    if (!CheckLifecycleResponse("start", containerId, response))
        DOCKSTART_LOG_INFO(TAG, "Container %s was already started", containerId.c_str());
}

ContainerRuntimeState DockerEngineClient::InspectState(const std::string& identity)
{
    try
    {
        const auto inspect = InspectContainer(identity);
        if (!inspect)
            return ContainerRuntimeState::Absent;

        const ContainerRuntimeState state = ParseRuntimeState(*inspect);
        DOCKSTART_LOG_INFO(TAG, "Container %s is %s (engine status '%s')", identity.c_str(),
                           RuntimeStateName(state),
                           (*inspect)["State"].get("Status", "").asString().c_str());
        return state;
    }
    catch (const DockstartError& ex)
    {
        if (!IsTransportFailure(ex.Code()))
            throw;

        DOCKSTART_LOG_WARN(TAG, "Engine unreachable while inspecting %s: %s", identity.c_str(),
                           ex.what());
        return ContainerRuntimeState::Unknown;
    }
}

ResolvedEndpoint DockerEngineClient::InspectEndpoint(const std::string& identity,
                                                     std::uint16_t internalPort)
{
    const auto inspect = InspectContainer(identity);
    if (!inspect)
        throw DockstartError(ErrorCode::NotFound, identity);

    if (ParseRuntimeState(*inspect) != ContainerRuntimeState::Running)
        throw DockstartError(ErrorCode::NotRunning, identity);

    const PortBindingMap bindings = ParsePortBindings((*inspect)["NetworkSettings"]["Ports"]);

    ResolvedEndpoint endpoint;
    endpoint.hostname = hostResolver_.Hostname();
    endpoint.port = SelectPublishedPort(bindings, internalPort);

    DOCKSTART_LOG_INFO(TAG, "Container %s port %u published at %s:%s", identity.c_str(),
                       static_cast<unsigned>(internalPort), endpoint.hostname.c_str(),
                       endpoint.port.c_str());
    return endpoint;
}

void DockerEngineClient::Stop(const std::string& identity)
{
    DOCKSTART_LOG_INFO(TAG, "Stopping container %s", identity.c_str());

    const EngineResponse response = Perform(
        "POST", "/containers/" + Escape(identity) + "/stop?t=" + std::to_string(kStopGraceSeconds));
    if (!CheckLifecycleResponse("stop", identity, response))
        DOCKSTART_LOG_INFO(TAG, "Container %s was already stopped", identity.c_str());
}

void DockerEngineClient::Remove(const std::string& identity)
{
    DOCKSTART_LOG_INFO(TAG, "Removing container %s", identity.c_str());

    const EngineResponse response =
        Perform("DELETE", "/containers/" + Escape(identity) + "?v=1");
    CheckLifecycleResponse("remove", identity, response);
}

} // namespace dockstart
