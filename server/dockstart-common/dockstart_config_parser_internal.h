#pragma once

#include <string>

namespace dockstart
{
class DockstartConfig;

class ConfigYamlParser
{
public:
    explicit ConfigYamlParser(DockstartConfig& config);

    bool Parse(const std::string& content);

private:
    void ProcessLine(const std::string& line);
    bool ProcessRegistryLine(const std::string& trimmed);
    void ProcessTopLevelLine(const std::string& trimmed);
    void HandleTopLevelEntry(const std::string& key, const std::string& value);
    void HandleRegistryEntry(const std::string& key, const std::string& value);
    void Reject(const std::string& key, const std::string& value);

    static std::string RemoveCommentAndStrip(const std::string& value);
    static bool IsTruthy(const std::string& value);
    static bool IsFalsy(const std::string& value);
    static bool ParsePositive(const std::string& value, long maxValue, long& out);

    DockstartConfig& config_;
    bool inRegistryBlock_ = false;
    bool valid_ = true;
};

} // namespace dockstart
