#pragma once

#include <string>
#include <vector>

namespace ctl
{
enum class Command
{
	Ensure,
	Teardown,
	State
};

/**
 * Command line options of dockstart_ctl.
 */
struct CtlOptions
{
	Command command = Command::State;
	std::string identity;
	std::string configPath;
	std::string image;
	std::string port;
	std::string protocol;
	std::string commandLine;
	std::vector<std::string> environment;
};

} // namespace ctl
