#pragma once

#include <string>

namespace dockstart
{
class DockstartConfig;

bool ParseDockstartConfigYaml(const std::string& content, DockstartConfig& config);

} // namespace dockstart
