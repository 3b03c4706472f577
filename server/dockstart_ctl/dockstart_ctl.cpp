#include "dockstart_ctl_options.h"

#include "dockstart_config.h"
#include "dockstart_docker_client.h"
#include "dockstart_errors.h"
#include "dockstart_lock_registry.h"
#include "dockstart_logging.h"
#include "dockstart_orchestrator.h"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

#define TAG DOCKSTART_TAG("ctl")

namespace ctl
{

constexpr int kExitUsage = 1;
constexpr int kExitConfiguration = 2;
constexpr int kExitEngine = 3;
constexpr int kExitOrchestration = 4;

void print_usage(const char* program)
{
	std::cout << "Usage: " << program << " [options] <command> <identity>\n"
	          << "Commands:\n"
	          << "  ensure <identity>       Create and start the container, print host:port\n"
	          << "  teardown <identity>     Stop and remove the container\n"
	          << "  state <identity>        Print the container state\n"
	          << "Options:\n"
	          << "  --config <path>         Configuration file\n"
	          << "  --image <name>          Image for ensure (default: default_image)\n"
	          << "  --port <port>           Internal port for ensure (default: default_port)\n"
	          << "  --protocol <name>       rdp, ssh, telnet or vnc\n"
	          << "  --cmd <command>         Startup command\n"
	          << "  --env <KEY=VALUE>       Environment entry, may be repeated\n"
	          << "  --help                  Show this help message\n";
}

bool parse_arguments(int argc, char** argv, CtlOptions& options)
{
	std::vector<std::string> positional;
	for (int i = 1; i < argc; ++i)
	{
		const std::string arg = argv[i];
		if (arg == "--help")
		{
			print_usage(argv[0]);
			return false;
		}

		if (arg.rfind("--", 0) == 0)
		{
			if (i + 1 >= argc)
			{
				std::cerr << "Missing value for " << arg << '\n';
				return false;
			}

			const std::string value = argv[++i];
			if (arg == "--config")
				options.configPath = value;
			else if (arg == "--image")
				options.image = value;
			else if (arg == "--port")
				options.port = value;
			else if (arg == "--protocol")
				options.protocol = value;
			else if (arg == "--cmd")
				options.commandLine = value;
			else if (arg == "--env")
				options.environment.push_back(value);
			else
			{
				std::cerr << "Unknown argument: " << arg << '\n';
				print_usage(argv[0]);
				return false;
			}
			continue;
		}

		positional.push_back(arg);
	}

	if (positional.size() != 2)
	{
		print_usage(argv[0]);
		return false;
	}

	if (positional[0] == "ensure")
		options.command = Command::Ensure;
	else if (positional[0] == "teardown")
		options.command = Command::Teardown;
	else if (positional[0] == "state")
		options.command = Command::State;
	else
	{
		std::cerr << "Unknown command: " << positional[0] << '\n';
		return false;
	}

	options.identity = dockstart::SanitizeIdentity(positional[1]);
	return true;
}

dockstart::ContainerSpec build_spec(const CtlOptions& options)
{
	dockstart::ContainerSpec spec =
	    dockstart::Config().DefaultContainerSpec().value_or(dockstart::ContainerSpec{});

	if (!options.image.empty())
		spec.image = options.image;

	if (!options.port.empty())
	{
		spec.internalPort = dockstart::ParsePort(options.port);
		if (!spec.internalPort)
			throw dockstart::DockstartError(dockstart::ErrorCode::InvalidSpec,
			                                "--port '" + options.port + "'");
	}

	if (!options.protocol.empty())
	{
		spec.protocol = dockstart::ParseProtocol(options.protocol);
		if (!spec.protocol)
			throw dockstart::DockstartError(dockstart::ErrorCode::InvalidSpec,
			                                "--protocol '" + options.protocol + "'");
	}

	if (!options.commandLine.empty())
		spec.command = options.commandLine;

	for (const auto& entry : options.environment)
	{
		for (auto& parsed : dockstart::ParseEnvironment(entry))
			spec.environment.push_back(std::move(parsed));
	}

	return spec;
}

int exit_code_for(dockstart::ErrorCode code)
{
	if (dockstart::IsConfigurationError(code))
		return kExitConfiguration;
	if (dockstart::IsEngineError(code))
		return kExitEngine;
	return kExitOrchestration;
}

std::atomic_bool g_cancelled{ false };

void handle_signal(int)
{
	g_cancelled.store(true);
}

int run(int argc, char** argv)
{
	CtlOptions options;
	if (!parse_arguments(argc, argv, options))
		return kExitUsage;

	dockstart::logging::ScopedLogUser scopedUser("ctl");

	if (!options.configPath.empty())
		dockstart::Config().SetConfigPath(options.configPath);

	const bool refreshed = dockstart::Config().Refresh();
	const bool reloaded = dockstart::Config().ConsumeReloadedFlag();
	dockstart_log_refresh_outcome(refreshed, reloaded);

	std::signal(SIGINT, handle_signal);
	std::signal(SIGTERM, handle_signal);

	try
	{
		dockstart::DockerEngineClient engine(dockstart::Config().Engine());
		dockstart::IdentityLockRegistry locks;
		dockstart::LifecycleOrchestrator orchestrator(engine, locks,
		                                              dockstart::Config().RetryPolicy());

		switch (options.command)
		{
		case Command::Ensure:
		{
			const dockstart::ContainerSpec spec = build_spec(options);
			const dockstart::ResolvedEndpoint endpoint =
			    orchestrator.EnsureRunning(options.identity, spec, &g_cancelled);
			std::cout << endpoint.hostname << ':' << endpoint.port << '\n';
			break;
		}
		case Command::Teardown:
			orchestrator.Teardown(options.identity);
			break;
		case Command::State:
			std::cout << dockstart::RuntimeStateName(engine.InspectState(options.identity))
			          << '\n';
			break;
		}
	}
	catch (const dockstart::DockstartError& ex)
	{
		DOCKSTART_LOG_ERROR(TAG, "%s", ex.what());
		std::cerr << ex.what() << '\n';
		return exit_code_for(ex.Code());
	}

	return EXIT_SUCCESS;
}

} // namespace ctl

int main(int argc, char** argv)
{
	return ctl::run(argc, argv);
}
