#include <gtest/gtest.h>

#include "dockstart_docker_internal.h"
#include "dockstart_endpoint_resolver.h"
#include "dockstart_errors.h"

#include <string>

using namespace dockstart;

namespace
{
Json::Value ParseOrFail(const std::string& text)
{
    Json::Value root;
    std::string errors;
    EXPECT_TRUE(ParseJson(text, root, &errors)) << errors;
    return root;
}
} // namespace

class DockerParsingTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        spec_.image = "guacamole/desktop:latest";
        spec_.internalPort = 5901;
        spec_.command = "/usr/bin/startvnc -geometry 1280x800";
        spec_.environment = {"DISPLAY=:1", "LANG=C.UTF-8"};
    }

    ContainerSpec spec_;
};

TEST_F(DockerParsingTest, RuntimeStateFromInspect)
{
    EXPECT_EQ(ParseRuntimeState(ParseOrFail(R"({"State":{"Status":"running","Running":true}})")),
              ContainerRuntimeState::Running);
    EXPECT_EQ(ParseRuntimeState(ParseOrFail(R"({"State":{"Status":"exited","Running":false}})")),
              ContainerRuntimeState::Created);
    EXPECT_EQ(ParseRuntimeState(ParseOrFail(R"({"State":{"Status":"created"}})")),
              ContainerRuntimeState::Created);
    EXPECT_EQ(ParseRuntimeState(ParseOrFail(R"({"State":{"Status":"paused"}})")),
              ContainerRuntimeState::Running);
    EXPECT_EQ(ParseRuntimeState(ParseOrFail(R"({"State":{"Status":"removing"}})")),
              ContainerRuntimeState::Unknown);
    EXPECT_EQ(ParseRuntimeState(ParseOrFail(R"({"Id":"abc"})")), ContainerRuntimeState::Unknown);
}

TEST_F(DockerParsingTest, PortBindingsKeepTcpOnly)
{
    const Json::Value ports = ParseOrFail(R"({
        "5901/tcp": [{"HostIp": "0.0.0.0", "HostPort": "34921"}, {"HostIp": "::", "HostPort": "34921"}],
        "5901/udp": [{"HostIp": "0.0.0.0", "HostPort": "40000"}],
        "22/tcp": null
    })");

    const PortBindingMap bindings = ParsePortBindings(ports);
    ASSERT_EQ(bindings.count(5901), 1u);
    EXPECT_EQ(bindings.at(5901).size(), 2u);
    EXPECT_EQ(bindings.at(5901).front().hostIp, "0.0.0.0");
    EXPECT_TRUE(bindings.at(22).empty());

    EXPECT_EQ(SelectPublishedPort(bindings, 5901), "34921");
}

TEST_F(DockerParsingTest, SelectPublishedPortSkipsEmptyBindings)
{
    PortBindingMap bindings;
    bindings[3389] = {HostBinding{"0.0.0.0", ""}, HostBinding{"0.0.0.0", "32768"}};
    EXPECT_EQ(SelectPublishedPort(bindings, 3389), "32768");

    try
    {
        SelectPublishedPort(bindings, 22);
        FAIL() << "expected NoPublishedPort";
    }
    catch (const DockstartError& ex)
    {
        EXPECT_EQ(ex.Code(), ErrorCode::NoPublishedPort);
    }
}

TEST_F(DockerParsingTest, CreatePayloadLetsEngineChooseHostPort)
{
    const Json::Value payload = BuildCreatePayload(spec_, false);

    EXPECT_EQ(payload["Image"].asString(), "guacamole/desktop:latest");
    ASSERT_EQ(payload["Cmd"].size(), 3u);
    EXPECT_EQ(payload["Cmd"][1].asString(), "-geometry");
    ASSERT_EQ(payload["Env"].size(), 2u);
    EXPECT_TRUE(payload["ExposedPorts"].isMember("5901/tcp"));

    const Json::Value& binding = payload["HostConfig"]["PortBindings"]["5901/tcp"];
    ASSERT_TRUE(binding.isArray());
    EXPECT_EQ(binding[0]["HostPort"].asString(), "");
    EXPECT_FALSE(payload["HostConfig"]["PublishAllPorts"].asBool());

    EXPECT_TRUE(BuildCreatePayload(spec_, true)["HostConfig"]["PublishAllPorts"].asBool());
}

TEST_F(DockerParsingTest, CreatePayloadOmitsUnsetFields)
{
    spec_.command.reset();
    spec_.environment.clear();
    const Json::Value payload = BuildCreatePayload(spec_, false);
    EXPECT_FALSE(payload.isMember("Cmd"));
    EXPECT_FALSE(payload.isMember("Env"));

    spec_.internalPort.reset();
    EXPECT_THROW(BuildCreatePayload(spec_, false), DockstartError);
}

TEST(EngineErrorTest, PrefersMessageField)
{
    EXPECT_EQ(ParseEngineErrorResponse(R"({"message":"No such image: desk:latest"})"),
              "No such image: desk:latest");
    EXPECT_EQ(ParseEngineErrorResponse("  "), "empty response body");
    EXPECT_EQ(ParseEngineErrorResponse("bad gateway\n"), "raw=bad gateway");
}

TEST(EngineErrorTest, FindsErrorInPullStream)
{
    std::string error;
    EXPECT_FALSE(FindPullError("{\"status\":\"Pulling fs layer\"}\n{\"status\":\"Done\"}\n", error));
    EXPECT_TRUE(FindPullError("{\"status\":\"Pulling\"}\n{\"error\":\"manifest unknown\"}\n", error));
    EXPECT_EQ(error, "manifest unknown");
}

TEST(ImageReferenceTest, SplitsTagAfterLastSlash)
{
    EXPECT_EQ(SplitImageReference("registry:5000/team/desktop:2.1"),
              std::make_pair(std::string("registry:5000/team/desktop"), std::string("2.1")));
    EXPECT_EQ(SplitImageReference("registry:5000/team/desktop"),
              std::make_pair(std::string("registry:5000/team/desktop"), std::string("latest")));
    EXPECT_EQ(SplitImageReference("desktop@sha256:abc").second, "");
}

TEST(RegistryAuthTest, EncodesCredentialsOnlyWhenConfigured)
{
    EngineSettings settings;
    EXPECT_TRUE(BuildRegistryAuthHeader(settings).empty());

    settings.registryUser = "deploy";
    settings.registryPassword = "secret";
    settings.registryUrl = "registry.example.net";
    const std::string header = BuildRegistryAuthHeader(settings);
    ASSERT_EQ(header.rfind("X-Registry-Auth: ", 0), 0u);
    EXPECT_EQ(header.find_first_of("+/"), std::string::npos);

    EXPECT_EQ(Base64UrlEncode("ab?"), "YWI_");
}

TEST(EngineHostUriTest, ParsesSupportedForms)
{
    const EngineHostUri unixUri = ParseEngineHostUri("unix:///var/run/docker.sock");
    EXPECT_EQ(unixUri.scheme, "unix");
    EXPECT_EQ(unixUri.path, "/var/run/docker.sock");

    const EngineHostUri tcpUri = ParseEngineHostUri("tcp://docker.example.net:2376");
    EXPECT_EQ(tcpUri.scheme, "tcp");
    EXPECT_EQ(tcpUri.host, "docker.example.net");
    EXPECT_EQ(tcpUri.port, "2376");

    const EngineHostUri v6Uri = ParseEngineHostUri("[::1]:2375");
    EXPECT_EQ(v6Uri.scheme, "tcp");
    EXPECT_EQ(v6Uri.host, "::1");
    EXPECT_EQ(v6Uri.port, "2375");

    EXPECT_THROW(ParseEngineHostUri("tcp://[::1:2375"), DockstartError);
}

TEST(EngineHostResolverTest, UnixSocketMeansLocalhost)
{
    EngineSettings settings;
    settings.host = "unix:///var/run/docker.sock";
    EXPECT_EQ(EngineHostResolver(settings).Hostname(), "localhost");

    settings.host = "tcp://127.0.0.1:2375";
    EXPECT_EQ(EngineHostResolver(settings).Hostname(), "127.0.0.1");

    settings.publicHostname = "127.0.0.2";
    EXPECT_EQ(EngineHostResolver(settings).Hostname(), "127.0.0.2");
}

TEST(EngineHostResolverTest, UnresolvableHostIsConfigurationError)
{
    EngineSettings settings;
    settings.host = "tcp://no-such-host.invalid:2375";
    try
    {
        EngineHostResolver resolver(settings);
        FAIL() << "expected HostUnresolvable";
    }
    catch (const DockstartError& ex)
    {
        EXPECT_EQ(ex.Code(), ErrorCode::HostUnresolvable);
        EXPECT_TRUE(IsConfigurationError(ex.Code()));
    }
}
