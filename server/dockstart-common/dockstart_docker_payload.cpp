#include "dockstart_docker_internal.h"

#include <string>

namespace dockstart
{
namespace
{
class ContainerPayloadBuilder
{
public:
    ContainerPayloadBuilder(const ContainerSpec& spec, bool publishAllPorts)
        : spec_(spec), publishAllPorts_(publishAllPorts)
    {
        root_["Image"] = spec_.image;
    }

    Json::Value Build()
    {
        AddCommand();
        AddEnvironment();
        AddPorts();

        root_["HostConfig"] = hostConfig_;
        return root_;
    }

private:
    void AddCommand()
    {
        if (!spec_.command || TrimWhitespace(*spec_.command).empty())
            return;

        Json::Value cmd(Json::arrayValue);
        for (const auto& argument : SplitCommand(*spec_.command))
            cmd.append(argument);
        root_["Cmd"] = cmd;
    }

    void AddEnvironment()
    {
        if (spec_.environment.empty())
            return;

        Json::Value env(Json::arrayValue);
        for (const auto& entry : spec_.environment)
            env.append(entry);
        root_["Env"] = env;
    }

    // The engine picks the host port: HostPort is left empty.
    void AddPorts()
    {
        const std::string portKey = std::to_string(*spec_.internalPort) + "/tcp";

        Json::Value exposed(Json::objectValue);
        exposed[portKey] = Json::Value(Json::objectValue);
        root_["ExposedPorts"] = exposed;

        Json::Value binding(Json::objectValue);
        binding["HostPort"] = "";
        Json::Value bindingList(Json::arrayValue);
        bindingList.append(binding);

        Json::Value portBindings(Json::objectValue);
        portBindings[portKey] = bindingList;
        hostConfig_["PortBindings"] = portBindings;
        hostConfig_["PublishAllPorts"] = publishAllPorts_;
    }

    const ContainerSpec& spec_;
    bool publishAllPorts_ = false;
    Json::Value root_{Json::objectValue};
    Json::Value hostConfig_{Json::objectValue};
};
} // namespace

Json::Value BuildCreatePayload(const ContainerSpec& spec, bool publishAllPorts)
{
    ValidateContainerSpec(spec);
    ContainerPayloadBuilder builder(spec, publishAllPorts);
    return builder.Build();
}

ContainerRuntimeState ParseRuntimeState(const Json::Value& inspect)
{
    const Json::Value& state = inspect["State"];
    if (!state.isObject())
        return ContainerRuntimeState::Unknown;

    if (state.get("Running", false).asBool())
        return ContainerRuntimeState::Running;

    const std::string status = state.get("Status", "").asString();
    if (status == "running" || status == "restarting" || status == "paused")
        return ContainerRuntimeState::Running;
    if (status == "created" || status == "exited" || status == "dead")
        return ContainerRuntimeState::Created;

    return ContainerRuntimeState::Unknown;
}

std::string BuildRegistryAuthHeader(const EngineSettings& settings)
{
    if (settings.registryUser.empty())
        return {};

    Json::Value auth(Json::objectValue);
    auth["username"] = settings.registryUser;
    auth["password"] = settings.registryPassword;
    if (!settings.registryEmail.empty())
        auth["email"] = settings.registryEmail;
    if (!settings.registryUrl.empty())
        auth["serveraddress"] = settings.registryUrl;

    return "X-Registry-Auth: " + Base64UrlEncode(WriteCompactJson(auth));
}

} // namespace dockstart
