#pragma once

#include "dockstart_config.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <json/json.h>

namespace dockstart
{

struct HostBinding
{
    std::string hostIp;
    std::string hostPort;
};

// Internal container port -> host bindings published by the engine.
using PortBindingMap = std::map<std::uint16_t, std::vector<HostBinding>>;

/**
 * Reads NetworkSettings.Ports of an inspect payload. Keys look like "5901/tcp";
 * non-tcp keys and unparsable keys are skipped.
 */
PortBindingMap ParsePortBindings(const Json::Value& ports);

/**
 * Host port of the first binding with a non-empty host port for internalPort.
 * Throws DockstartError(NoPublishedPort) when there is none.
 */
std::string SelectPublishedPort(const PortBindingMap& bindings, std::uint16_t internalPort);

struct EngineHostUri
{
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

// Splits unix:///path, tcp://host:port, http(s)://host:port and [v6]:port forms.
EngineHostUri ParseEngineHostUri(const std::string& uri);

/**
 * Resolves the hostname handed to connections. Done once per engine client;
 * a name that does not resolve throws DockstartError(HostUnresolvable).
 */
class EngineHostResolver
{
public:
    explicit EngineHostResolver(const EngineSettings& settings);

    const std::string& Hostname() const
    {
        return hostname_;
    }

private:
    static void EnsureResolvable(const std::string& host);

    std::string hostname_;
};

} // namespace dockstart
