#include "dockstart_endpoint_resolver.h"

#include "dockstart_errors.h"
#include "dockstart_logging.h"

#include <netdb.h>
#include <sys/socket.h>

#include <string>

#define TAG DOCKSTART_TAG("endpoint-resolver")

namespace dockstart
{

PortBindingMap ParsePortBindings(const Json::Value& ports)
{
    PortBindingMap bindings;
    if (!ports.isObject())
        return bindings;

    for (const auto& key : ports.getMemberNames())
    {
        const auto slash = key.find('/');
        const std::string portPart = key.substr(0, slash);
        const std::string protocol = slash == std::string::npos ? "tcp" : key.substr(slash + 1);
        if (protocol != "tcp")
            continue;

        const auto internalPort = ParsePort(portPart);
        if (!internalPort)
            continue;

        auto& target = bindings[*internalPort];
        const Json::Value& entries = ports[key];
        if (!entries.isArray())
            continue;

        for (const auto& entry : entries)
        {
            if (!entry.isObject())
                continue;

            HostBinding binding;
            binding.hostIp = entry.get("HostIp", "").asString();
            binding.hostPort = entry.get("HostPort", "").asString();
            target.push_back(binding);
        }
    }

    return bindings;
}

std::string SelectPublishedPort(const PortBindingMap& bindings, std::uint16_t internalPort)
{
    const auto it = bindings.find(internalPort);
    if (it != bindings.end())
    {
        for (const auto& binding : it->second)
        {
            if (!binding.hostPort.empty())
                return binding.hostPort;
        }
    }

    throw DockstartError(ErrorCode::NoPublishedPort,
                         "no host binding for container port " + std::to_string(internalPort));
}

EngineHostUri ParseEngineHostUri(const std::string& uri)
{
    EngineHostUri parsed;
    std::string rest = uri;

    const auto schemeEnd = rest.find("://");
    if (schemeEnd == std::string::npos)
    {
        parsed.scheme = "tcp";
    }
    else
    {
        parsed.scheme = rest.substr(0, schemeEnd);
        rest = rest.substr(schemeEnd + 3);
    }

    if (parsed.scheme == "unix" || parsed.scheme == "npipe")
    {
        parsed.path = rest;
        return parsed;
    }

    const auto pathStart = rest.find('/');
    if (pathStart != std::string::npos)
    {
        parsed.path = rest.substr(pathStart);
        rest = rest.substr(0, pathStart);
    }

    if (!rest.empty() && rest.front() == '[')
    {
        const auto close = rest.find(']');
        if (close == std::string::npos)
            throw DockstartError(ErrorCode::ConfigInvalid, "malformed engine host: " + uri);
        parsed.host = rest.substr(1, close - 1);
        if (close + 1 < rest.size() && rest[close + 1] == ':')
            parsed.port = rest.substr(close + 2);
        return parsed;
    }

    const auto colon = rest.rfind(':');
    if (colon == std::string::npos)
    {
        parsed.host = rest;
    }
    else
    {
        parsed.host = rest.substr(0, colon);
        parsed.port = rest.substr(colon + 1);
    }

    return parsed;
}

EngineHostResolver::EngineHostResolver(const EngineSettings& settings)
{
    if (!settings.publicHostname.empty())
    {
        EnsureResolvable(settings.publicHostname);
        hostname_ = settings.publicHostname;
        return;
    }

    const EngineHostUri uri = ParseEngineHostUri(settings.host);
    if (uri.scheme == "unix")
    {
        hostname_ = "localhost";
        return;
    }

    if (uri.host.empty())
        throw DockstartError(ErrorCode::HostUnresolvable,
                             "engine host URI has no host name: " + settings.host);

    EnsureResolvable(uri.host);
    hostname_ = uri.host;
}

void EngineHostResolver::EnsureResolvable(const std::string& host)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    const int status = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (status != 0)
    {
        DOCKSTART_LOG_ERROR(TAG, "Cannot resolve container engine host %s: %s", host.c_str(),
                            gai_strerror(status));
        throw DockstartError(ErrorCode::HostUnresolvable,
                             host + ": " + std::string(gai_strerror(status)));
    }

    freeaddrinfo(result);
    DOCKSTART_LOG_INFO(TAG, "Container engine host %s resolved", host.c_str());
}

} // namespace dockstart
