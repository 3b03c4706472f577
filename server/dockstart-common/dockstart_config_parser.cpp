#include "dockstart_config_parser.h"
#include "dockstart_config_parser_internal.h"

#include "dockstart_config.h"

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>

namespace dockstart
{

ConfigYamlParser::ConfigYamlParser(DockstartConfig& config) : config_(config)
{
}

bool ConfigYamlParser::Parse(const std::string& content)
{
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line))
        ProcessLine(line);

    return valid_;
}

void ConfigYamlParser::ProcessLine(const std::string& line)
{
    const std::string trimmed = DockstartConfig::Trim(line);
    if (trimmed.empty() || trimmed[0] == '#')
        return;

    const bool isTopLevel =
        !line.empty() && !std::isspace(static_cast<unsigned char>(line.front()));

    if (isTopLevel)
        inRegistryBlock_ = false;

    if (inRegistryBlock_ && ProcessRegistryLine(trimmed))
        return;

    ProcessTopLevelLine(trimmed);
}

bool ConfigYamlParser::ProcessRegistryLine(const std::string& trimmed)
{
    const auto pos = trimmed.find(':');
    if (pos == std::string::npos)
        return true;

    const std::string key = DockstartConfig::ToLower(DockstartConfig::Trim(trimmed.substr(0, pos)));
    const std::string value = RemoveCommentAndStrip(trimmed.substr(pos + 1));
    HandleRegistryEntry(key, value);
    return true;
}

void ConfigYamlParser::ProcessTopLevelLine(const std::string& trimmed)
{
    const auto pos = trimmed.find(':');
    if (pos == std::string::npos)
        return;

    const std::string key = DockstartConfig::Trim(trimmed.substr(0, pos));
    const std::string value = RemoveCommentAndStrip(trimmed.substr(pos + 1));
    HandleTopLevelEntry(key, value);
}

void ConfigYamlParser::HandleTopLevelEntry(const std::string& key, const std::string& value)
{
    const std::string normalized = DockstartConfig::ToLower(key);
    auto& engine = config_.engine_;

    if (normalized == "engine_host" || normalized == "docker_host")
    {
        if (!value.empty())
            engine.host = value;
        return;
    }

    if (normalized == "verify_tls" || normalized == "docker_verify_tls")
    {
        if (IsTruthy(value))
            engine.verifyTls = true;
        else if (IsFalsy(value))
            engine.verifyTls = false;
        else
            Reject(key, value);
        return;
    }

    if (normalized == "cert_path" || normalized == "docker_cert_path")
    {
        engine.certPath = value;
        return;
    }

    if (normalized == "api_version" || normalized == "docker_api_version")
    {
        if (!value.empty() && (value[0] == 'v' || value[0] == 'V'))
            engine.apiVersion = value.substr(1);
        else
            engine.apiVersion = value;
        return;
    }

    if (normalized == "public_hostname")
    {
        engine.publicHostname = value;
        return;
    }

    if (normalized == "publish_all_ports")
    {
        if (IsTruthy(value))
            engine.publishAllPorts = true;
        else if (IsFalsy(value))
            engine.publishAllPorts = false;
        else
            Reject(key, value);
        return;
    }

    if (normalized == "request_timeout_seconds")
    {
        long parsed = 0;
        if (ParsePositive(value, 3600, parsed))
            engine.requestTimeout = std::chrono::seconds(parsed);
        else
            Reject(key, value);
        return;
    }

    if (normalized == "endpoint_retry_attempts")
    {
        long parsed = 0;
        if (ParsePositive(value, 100, parsed))
            config_.retryPolicy_.attempts = static_cast<int>(parsed);
        else
            Reject(key, value);
        return;
    }

    if (normalized == "endpoint_retry_backoff_ms")
    {
        long parsed = 0;
        if (ParsePositive(value, 60000, parsed))
            config_.retryPolicy_.initialBackoff = std::chrono::milliseconds(parsed);
        else
            Reject(key, value);
        return;
    }

    if (normalized == "registry")
    {
        inRegistryBlock_ = value.empty();
        return;
    }

    if (normalized == "default_image" || normalized == "docker_image_name")
    {
        config_.defaultImage_ = value;
        return;
    }

    if (normalized == "default_port" || normalized == "docker_image_port")
    {
        if (value.empty())
        {
            config_.defaultPort_.reset();
            return;
        }

        const auto port = ParsePort(value);
        if (port)
            config_.defaultPort_ = port;
        else
            Reject(key, value);
        return;
    }

    if (normalized == "default_protocol" || normalized == "docker_image_protocol")
    {
        if (value.empty())
        {
            config_.defaultProtocol_.reset();
            return;
        }

        const auto protocol = ParseProtocol(value);
        if (protocol)
            config_.defaultProtocol_ = protocol;
        else
            Reject(key, value);
        return;
    }

    if (normalized == "default_command" || normalized == "docker_image_cmd")
    {
        config_.defaultCommand_ = value;
        return;
    }
}

void ConfigYamlParser::HandleRegistryEntry(const std::string& key, const std::string& value)
{
    auto& engine = config_.engine_;

    if (key == "url")
        engine.registryUrl = value;
    else if (key == "user" || key == "username")
        engine.registryUser = value;
    else if (key == "password")
        engine.registryPassword = value;
    else if (key == "email")
        engine.registryEmail = value;
}

void ConfigYamlParser::Reject(const std::string& key, const std::string& value)
{
    std::cerr << "Invalid value for configuration key '" << key << "': " << value << std::endl;
    valid_ = false;
}

std::string ConfigYamlParser::RemoveCommentAndStrip(const std::string& value)
{
    std::string result;
    char quote = '\0';
    for (char ch : value)
    {
        if (quote == '\0' && ch == '#')
            break;
        if (ch == '"' || ch == '\'')
        {
            if (quote == '\0')
                quote = ch;
            else if (quote == ch)
                quote = '\0';
        }
        result.push_back(ch);
    }

    return DockstartConfig::StripQuotes(DockstartConfig::Trim(result));
}

bool ConfigYamlParser::IsTruthy(const std::string& value)
{
    const std::string lower = DockstartConfig::ToLower(value);
    return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

bool ConfigYamlParser::IsFalsy(const std::string& value)
{
    const std::string lower = DockstartConfig::ToLower(value);
    return lower == "false" || lower == "no" || lower == "off" || lower == "0";
}

bool ConfigYamlParser::ParsePositive(const std::string& value, long maxValue, long& out)
{
    if (value.empty())
        return false;

    char* end = nullptr;
    const long parsed = std::strtol(value.c_str(), &end, 10);
    if (!end || *end != '\0' || parsed < 1 || parsed > maxValue)
        return false;

    out = parsed;
    return true;
}

bool ParseDockstartConfigYaml(const std::string& content, DockstartConfig& config)
{
    ConfigYamlParser parser(config);
    return parser.Parse(content);
}

} // namespace dockstart
