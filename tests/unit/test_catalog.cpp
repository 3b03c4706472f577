#include <gtest/gtest.h>

#include "dockstart_catalog.h"
#include "dockstart_errors.h"
#include "fake_engine_client.h"

#include <chrono>
#include <thread>
#include <vector>

using namespace dockstart;
using dockstart::test::FakeEngineClient;

namespace
{
EndpointRetryPolicy NoWaitRetry()
{
    EndpointRetryPolicy policy;
    policy.attempts = 2;
    policy.initialBackoff = std::chrono::milliseconds(1);
    policy.maxBackoff = std::chrono::milliseconds(1);
    return policy;
}

std::shared_ptr<StoredConnection> MakeStored(const std::string& identifier, const std::string& name,
                                             AttributeBag attributes = {})
{
    ConnectionConfiguration configuration;
    configuration.protocol = "vnc";
    configuration.parameters = {{"hostname", "static.example.com"}, {"port", "5900"}};
    return std::make_shared<StoredConnection>(identifier, name, configuration,
                                              std::move(attributes));
}

ContainerSpec DesktopSpec()
{
    ContainerSpec spec;
    spec.image = "vnc-box";
    spec.internalPort = 5901;
    spec.protocol = Protocol::Vnc;
    spec.credentials.password = "secret";
    return spec;
}
} // namespace

class CatalogTest : public ::testing::Test {
protected:
    CatalogTest()
        : orchestrator_(engine_, locks_, NoWaitRetry()),
          catalog_(store_, &orchestrator_, "alice",
                   [](EntityKind, const std::string&) { return false; })
    {
        store_.Put(MakeStored("1", "Shared desktop"));
        store_.Put(MakeStored("2", "Lab"));
    }

    FakeEngineClient engine_;
    IdentityLockRegistry locks_;
    LifecycleOrchestrator orchestrator_;
    InMemoryConnectionStore store_;
    OverlayConnectionCatalog catalog_;
};

TEST_F(CatalogTest, InternalEntriesShadowStore)
{
    auto overlay = std::make_shared<ContainerConnection>("1", "Overlay", "desktop_alice",
                                                         DesktopSpec(), orchestrator_, "alice");
    catalog_.Add(overlay);

    EXPECT_EQ(catalog_.Get("1"), overlay);
    EXPECT_EQ(catalog_.Get("2")->Name(), "Lab");
    EXPECT_FALSE(catalog_.Get("404"));
}

TEST_F(CatalogTest, ListKeepsOrderAndSkipsUnknown)
{
    catalog_.Add(std::make_shared<ContainerConnection>("docker-user-alice", "docker-user-alice",
                                                       "user_alice", DesktopSpec(), orchestrator_,
                                                       "alice"));

    const auto listed = catalog_.List({"2", "missing", "docker-user-alice", "1"});
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed[0]->Identifier(), "2");
    EXPECT_EQ(listed[1]->Identifier(), "docker-user-alice");
    EXPECT_EQ(listed[2]->Identifier(), "1");

    const std::set<std::string> expected{"1", "2", "docker-user-alice"};
    EXPECT_EQ(catalog_.Identifiers(), expected);
}

TEST_F(CatalogTest, RemoveOnlyTouchesOverlay)
{
    catalog_.Add(MakeStored("extra", "Extra"));
    EXPECT_TRUE(catalog_.Remove("extra"));
    EXPECT_FALSE(catalog_.Remove("1"));
    EXPECT_TRUE(catalog_.Get("1"));
    EXPECT_EQ(catalog_.Identifiers().count("extra"), 0u);
}

TEST_F(CatalogTest, ListingNeverProvisions)
{
    catalog_.Add(std::make_shared<ContainerConnection>("docker-user-alice", "docker-user-alice",
                                                       "user_alice", DesktopSpec(), orchestrator_,
                                                       "alice"));
    catalog_.List({"docker-user-alice"});
    catalog_.Identifiers();
    EXPECT_EQ(engine_.inspectStateCalls.load(), 0);
    EXPECT_EQ(engine_.createCalls.load(), 0);
}

TEST_F(CatalogTest, StoredConnectionWithContainerAttributesIsDecorated)
{
    store_.Put(MakeStored("7", "desktop",
                          {{kImageNameAttribute, std::string("vnc-box")},
                           {kImagePortAttribute, std::string("5901")}}));

    const auto first = catalog_.Get("7");
    const auto decorated = std::dynamic_pointer_cast<ContainerConnection>(first);
    ASSERT_TRUE(decorated);
    EXPECT_EQ(decorated->Identity(), "desktop_alice");
    EXPECT_EQ(decorated->Spec().protocol, Protocol::Vnc);
    EXPECT_EQ(catalog_.Get("7"), first);

    // Without update rights the container attributes are hidden.
    EXPECT_EQ(decorated->Attributes().count(kImageNameAttribute), 0u);
    EXPECT_EQ(catalog_.ContainerConnections().size(), 1u);
}

TEST_F(CatalogTest, MalformedContainerAttributesLeaveConnectionUndecorated)
{
    store_.Put(MakeStored("2", "Lab",
                          {{kImageNameAttribute, std::string("vnc-box")},
                           {kImagePortAttribute, std::string("abc")}}));

    const auto stored = catalog_.Get("2");
    ASSERT_TRUE(stored);
    EXPECT_FALSE(std::dynamic_pointer_cast<ContainerConnection>(stored));
    EXPECT_EQ(stored->Configuration().parameters.at("hostname"), "static.example.com");

    const auto listed = catalog_.List({"1", "2"});
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0]->Identifier(), "1");
    EXPECT_EQ(listed[1]->Identifier(), "2");
    EXPECT_TRUE(catalog_.ContainerConnections().empty());
}

TEST_F(CatalogTest, ConcurrentAddsAndReadsStayConsistent)
{
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 50; ++i)
            {
                catalog_.Add(MakeStored("c" + std::to_string(t) + "-" + std::to_string(i), "x"));
                catalog_.Identifiers();
                catalog_.List({"1", "2"});
            }
        });
    }
    for (auto& thread : threads)
        thread.join();

    EXPECT_EQ(catalog_.Identifiers().size(), 202u);
}

class ContainerConnectionTest : public CatalogTest {
};

TEST_F(ContainerConnectionTest, ConnectProvisionsLazilyAndMergesParameters)
{
    ContainerConnection connection("docker-user-alice", "docker-user-alice", "user_alice",
                                   DesktopSpec(), orchestrator_, "alice");
    EXPECT_EQ(connection.State(), ProvisioningState::Unprovisioned);
    EXPECT_EQ(connection.Configuration().protocol, "vnc");

    const ConnectionConfiguration configuration = connection.Connect();
    EXPECT_EQ(connection.State(), ProvisioningState::Ready);
    EXPECT_EQ(configuration.protocol, "vnc");
    EXPECT_EQ(configuration.parameters.at("hostname"), "docker.example.com");
    EXPECT_EQ(configuration.parameters.at("port"), "34921");
    EXPECT_EQ(configuration.parameters.at("password"), "secret");
    EXPECT_EQ(configuration.parameters.count("username"), 0u);

    connection.Release();
    EXPECT_EQ(connection.State(), ProvisioningState::TornDown);
    EXPECT_FALSE(engine_.Contains("user_alice"));

    const ConnectionConfiguration again = connection.Connect();
    EXPECT_EQ(connection.State(), ProvisioningState::Ready);
    EXPECT_EQ(again.parameters.at("port"), "34922");
    EXPECT_EQ(engine_.createCalls.load(), 2);
}

TEST_F(ContainerConnectionTest, FailedProvisioningCanBeRetried)
{
    ContainerConnection connection("docker-user-alice", "docker-user-alice", "user_alice",
                                   DesktopSpec(), orchestrator_, "alice");
    engine_.failCreate = true;
    EXPECT_THROW(connection.Connect(), DockstartError);
    EXPECT_EQ(connection.State(), ProvisioningState::Unprovisioned);

    engine_.failCreate = false;
    EXPECT_NO_THROW(connection.Connect());
    EXPECT_EQ(connection.State(), ProvisioningState::Ready);
}

TEST_F(ContainerConnectionTest, StateIsReadableWhileProvisioning)
{
    ContainerConnection connection("docker-user-alice", "docker-user-alice", "user_alice",
                                   DesktopSpec(), orchestrator_, "alice");
    engine_.createDelay = std::chrono::milliseconds(300);

    std::thread connecting([&connection]() { connection.Connect(); });

    bool sawProvisioning = false;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!sawProvisioning && std::chrono::steady_clock::now() < deadline)
    {
        sawProvisioning = connection.State() == ProvisioningState::Provisioning;
        if (!sawProvisioning)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    connecting.join();

    EXPECT_TRUE(sawProvisioning);
    EXPECT_EQ(connection.State(), ProvisioningState::Ready);
}

TEST_F(ContainerConnectionTest, ReleaseWithoutConnectDoesNothing)
{
    ContainerConnection connection("docker-user-alice", "docker-user-alice", "user_alice",
                                   DesktopSpec(), orchestrator_, "alice");
    connection.Release();
    EXPECT_EQ(engine_.stopCalls.load(), 0);
}

TEST_F(ContainerConnectionTest, DecoratedConnectionSubstitutesTokens)
{
    ConnectionConfiguration stored;
    stored.protocol = "ssh";
    stored.parameters = {{"hostname", "${DOCKER_HOST}"},
                         {"sftp-hostname", "${DOCKER_HOST}"},
                         {"sftp-port", "${DOCKER_PORT}"},
                         {"command", "echo ${OTHER}"}};
    auto base = std::make_shared<StoredConnection>("9", "shell", stored, AttributeBag{});

    ContainerSpec spec;
    spec.image = "ssh-box";
    spec.internalPort = 22;
    spec.protocol = Protocol::Ssh;
    ContainerConnection connection(base, "shell_alice", spec, orchestrator_, "alice", false);

    const ConnectionConfiguration configuration = connection.Connect();
    EXPECT_EQ(connection.Identifier(), "9");
    EXPECT_EQ(configuration.protocol, "ssh");
    EXPECT_EQ(configuration.parameters.at("sftp-hostname"), "docker.example.com");
    EXPECT_EQ(configuration.parameters.at("sftp-port"), "34921");
    EXPECT_EQ(configuration.parameters.at("hostname"), "docker.example.com");
    EXPECT_EQ(configuration.parameters.at("command"), "echo ${OTHER}");
}

TEST(SubstituteTokensTest, ReplacesKnownTokensOnly)
{
    const ParameterMap tokens{{"DOCKER_HOST", "h"}, {"DOCKER_PORT", "1"}};
    EXPECT_EQ(SubstituteTokens("${DOCKER_HOST}:${DOCKER_PORT}", tokens), "h:1");
    EXPECT_EQ(SubstituteTokens("${UNKNOWN}-${DOCKER_PORT", tokens), "${UNKNOWN}-${DOCKER_PORT");
    EXPECT_EQ(SubstituteTokens("plain", tokens), "plain");
}
