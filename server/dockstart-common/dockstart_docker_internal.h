#pragma once

#include "dockstart_config.h"
#include "dockstart_container_spec.h"
#include "dockstart_docker_client.h"
#include "dockstart_engine_client.h"
#include "dockstart_errors.h"

#include <cstddef>
#include <string>
#include <utility>

#include <curl/curl.h>
#include <json/json.h>

namespace dockstart
{

std::string TrimWhitespace(const std::string& value);
std::string SanitizeForLog(const std::string& input, size_t maxLength = 256);
std::string ParseEngineErrorResponse(const std::string& responseBody);
size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp);
bool ParseJson(const std::string& text, Json::Value& root, std::string* errors = nullptr);
std::string WriteCompactJson(const Json::Value& value);
std::string Base64UrlEncode(const std::string& input);

// "registry:5000/team/desktop:2.1" -> {"registry:5000/team/desktop", "2.1"}; tag defaults to latest.
std::pair<std::string, std::string> SplitImageReference(const std::string& image);

ContainerRuntimeState ParseRuntimeState(const Json::Value& inspect);
Json::Value BuildCreatePayload(const ContainerSpec& spec, bool publishAllPorts);
std::string BuildRegistryAuthHeader(const EngineSettings& settings);

// Scans a streamed pull response for an {"error": ...} line.
bool FindPullError(const std::string& responseBody, std::string& error);

ErrorCode MapCurlError(CURLcode code);
bool IsTransportFailure(ErrorCode code);

enum class CreateStatus
{
    Created,
    ImageMissing,
    Conflict,
    Rejected
};

CreateStatus ClassifyCreateStatus(long status);

/**
 * Checks the answer to a start, stop or remove request. Returns true when the
 * engine changed the container and false on 304 (already in that state).
 * Throws NotFound on 404 and EngineProtocol on any other failure.
 */
bool CheckLifecycleResponse(const char* operation, const std::string& target,
                            const EngineResponse& response);

} // namespace dockstart
