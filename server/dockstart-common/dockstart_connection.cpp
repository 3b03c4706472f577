#include "dockstart_connection.h"

#include "dockstart_errors.h"
#include "dockstart_logging.h"

#include <utility>

#define TAG DOCKSTART_TAG("connection")

namespace dockstart
{

std::string SubstituteTokens(const std::string& value, const ParameterMap& tokens)
{
    std::string result;
    result.reserve(value.size());

    size_t pos = 0;
    while (pos < value.size())
    {
        const auto start = value.find("${", pos);
        if (start == std::string::npos)
            break;

        const auto end = value.find('}', start + 2);
        if (end == std::string::npos)
            break;

        result.append(value, pos, start - pos);
        const std::string name = value.substr(start + 2, end - start - 2);
        const auto token = tokens.find(name);
        if (token != tokens.end())
            result.append(token->second);
        else
            result.append(value, start, end - start + 1);
        pos = end + 1;
    }

    result.append(value, pos, std::string::npos);
    return result;
}

StoredConnection::StoredConnection(std::string identifier, std::string name,
                                   ConnectionConfiguration configuration, AttributeBag attributes)
    : identifier_(std::move(identifier)), name_(std::move(name)),
      configuration_(std::move(configuration)), attributes_(std::move(attributes))
{
}

const char* ProvisioningStateName(ProvisioningState state)
{
    switch (state)
    {
    case ProvisioningState::Unprovisioned:
        return "unprovisioned";
    case ProvisioningState::Provisioning:
        return "provisioning";
    case ProvisioningState::Ready:
        return "ready";
    case ProvisioningState::TornDown:
        return "torn down";
    }
    return "unknown";
}

ContainerConnection::ContainerConnection(std::string identifier, std::string name,
                                         std::string identity, ContainerSpec spec,
                                         LifecycleOrchestrator& orchestrator, std::string username)
    : identifier_(std::move(identifier)), name_(std::move(name)), identity_(std::move(identity)),
      spec_(std::move(spec)), orchestrator_(orchestrator), username_(std::move(username)),
      canUpdate_(false), state_(ProvisioningState::Unprovisioned)
{
}

ContainerConnection::ContainerConnection(std::shared_ptr<Connection> stored, std::string identity,
                                         ContainerSpec spec, LifecycleOrchestrator& orchestrator,
                                         std::string username, bool canUpdate)
    : stored_(std::move(stored)), identity_(std::move(identity)), spec_(std::move(spec)),
      orchestrator_(orchestrator), username_(std::move(username)), canUpdate_(canUpdate),
      state_(ProvisioningState::Unprovisioned)
{
    if (!stored_)
        throw DockstartError(ErrorCode::MissingField, "stored connection for " + identity_);
}

const std::string& ContainerConnection::Identifier() const
{
    return stored_ ? stored_->Identifier() : identifier_;
}

const std::string& ContainerConnection::Name() const
{
    return stored_ ? stored_->Name() : name_;
}

AttributeBag ContainerConnection::Attributes() const
{
    if (!stored_)
        return {};
    return AttributeExtension::ForConnection().FilterForVisibility(stored_->Attributes(),
                                                                   canUpdate_);
}

ConnectionConfiguration ContainerConnection::Configuration() const
{
    if (stored_)
        return stored_->Configuration();

    ConnectionConfiguration configuration;
    if (spec_.protocol)
        configuration.protocol = ProtocolName(*spec_.protocol);
    return configuration;
}

ProvisioningState ContainerConnection::State() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

ConnectionConfiguration ContainerConnection::Connect()
{
    logging::ScopedLogUser scopedUser(username_);
    std::lock_guard<std::mutex> operation(operationMutex_);

    const ProvisioningState previous = SetState(ProvisioningState::Provisioning);

    ResolvedEndpoint endpoint;
    try
    {
        endpoint = orchestrator_.EnsureRunning(identity_, spec_);
    }
    catch (const DockstartError& ex)
    {
        SetState(previous == ProvisioningState::Ready ? ProvisioningState::Ready
                                                      : ProvisioningState::Unprovisioned);
        DOCKSTART_LOG_ERROR(TAG, "Connection %s could not provision container %s: %s",
                            Identifier().c_str(), identity_.c_str(), ex.what());
        throw;
    }

    SetState(ProvisioningState::Ready);
    DOCKSTART_LOG_INFO(TAG, "Connection %s ready at %s:%s", Identifier().c_str(),
                       endpoint.hostname.c_str(), endpoint.port.c_str());
    return BuildConfiguration(endpoint);
}

ProvisioningState ContainerConnection::SetState(ProvisioningState state)
{
    std::lock_guard<std::mutex> lock(mutex_);
    const ProvisioningState previous = state_;
    state_ = state;
    return previous;
}

ConnectionConfiguration ContainerConnection::BuildConfiguration(const ResolvedEndpoint& endpoint) const
{
    ConnectionConfiguration configuration = Configuration();
    if (spec_.protocol)
        configuration.protocol = ProtocolName(*spec_.protocol);

    const ParameterMap tokens{{kHostTokenName, endpoint.hostname},
                              {kPortTokenName, endpoint.port}};
    for (auto& parameter : configuration.parameters)
        parameter.second = SubstituteTokens(parameter.second, tokens);

    configuration.parameters["hostname"] = endpoint.hostname;
    configuration.parameters["port"] = endpoint.port;

    const ContainerCredentials& credentials = spec_.credentials;
    if (credentials.username)
        configuration.parameters["username"] = *credentials.username;
    if (credentials.password)
        configuration.parameters["password"] = *credentials.password;
    if (credentials.domain)
        configuration.parameters["domain"] = *credentials.domain;

    return configuration;
}

void ContainerConnection::Release()
{
    logging::ScopedLogUser scopedUser(username_);
    std::lock_guard<std::mutex> operation(operationMutex_);

    const ProvisioningState current = State();
    if (current == ProvisioningState::Unprovisioned || current == ProvisioningState::TornDown)
        return;

    orchestrator_.Teardown(identity_);
    SetState(ProvisioningState::TornDown);
    DOCKSTART_LOG_INFO(TAG, "Connection %s released container %s", Identifier().c_str(),
                       identity_.c_str());
}

} // namespace dockstart
