#include <gtest/gtest.h>

#include "dockstart_session.h"
#include "fake_engine_client.h"

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace dockstart;
using dockstart::test::FakeEngineClient;

class UserSessionTest : public ::testing::Test {
protected:
    UserSessionTest() : orchestrator_(engine_, locks_, FastRetry())
    {
        user_.kind = EntityKind::User;
        user_.identifier = "alice";
        user_.attributes = {{kImageNameAttribute, std::string("vnc-box")},
                            {kImagePortAttribute, std::string("5901")},
                            {kImageProtocolAttribute, std::string("vnc")},
                            {kImageUserAttribute, std::string("alice")}};

        Entity lab;
        lab.kind = EntityKind::UserGroup;
        lab.identifier = "lab";
        lab.attributes = {{kImageNameAttribute, std::string("rdp-box")},
                          {kImagePortAttribute, std::string("3389")},
                          {kImageProtocolAttribute, std::string("rdp")}};

        Entity staff;
        staff.kind = EntityKind::UserGroup;
        staff.identifier = "staff";

        Entity broken;
        broken.kind = EntityKind::UserGroup;
        broken.identifier = "broken";
        broken.attributes = {{kImageNameAttribute, std::string("x")},
                             {kImagePortAttribute, std::string("99999")},
                             {kImageProtocolAttribute, std::string("vnc")}};

        groups_ = {lab, staff, broken};
    }

    static EndpointRetryPolicy FastRetry()
    {
        EndpointRetryPolicy policy;
        policy.initialBackoff = std::chrono::milliseconds(1);
        policy.maxBackoff = std::chrono::milliseconds(1);
        return policy;
    }

    std::unique_ptr<UserSession> Open(std::optional<ContainerSpec> defaultSpec = std::nullopt)
    {
        return std::make_unique<UserSession>(
            "alice", user_, groups_,
            [](EntityKind kind, const std::string& identifier) {
                return kind == EntityKind::UserGroup && identifier == "lab";
            },
            store_, orchestrator_, std::move(defaultSpec));
    }

    FakeEngineClient engine_;
    IdentityLockRegistry locks_;
    LifecycleOrchestrator orchestrator_;
    InMemoryConnectionStore store_;
    Entity user_;
    std::vector<Entity> groups_;
};

TEST_F(UserSessionTest, SynthesizesUserAndGroupConnections)
{
    auto session = Open();
    auto& catalog = session->Connections();

    const auto user = std::dynamic_pointer_cast<ContainerConnection>(catalog.Get("docker-user-alice"));
    ASSERT_TRUE(user);
    EXPECT_EQ(user->Identity(), "user_alice");

    const auto lab = std::dynamic_pointer_cast<ContainerConnection>(catalog.Get("docker-group-lab"));
    ASSERT_TRUE(lab);
    EXPECT_EQ(lab->Identity(), "group_lab_alice");
    EXPECT_EQ(lab->Spec().protocol, Protocol::Rdp);

    EXPECT_FALSE(catalog.Get("docker-group-staff"));
    EXPECT_FALSE(catalog.Get("docker-group-broken"));
    EXPECT_FALSE(catalog.Get(kDefaultConnectionId));
    EXPECT_EQ(engine_.createCalls.load(), 0);
}

TEST_F(UserSessionTest, DefaultSpecAddsDefaultConnection)
{
    ContainerSpec defaultSpec;
    defaultSpec.image = "desktop:latest";
    defaultSpec.internalPort = 5901;
    defaultSpec.protocol = Protocol::Vnc;

    auto session = Open(defaultSpec);
    const auto connection =
        std::dynamic_pointer_cast<ContainerConnection>(session->Connections().Get(kDefaultConnectionId));
    ASSERT_TRUE(connection);
    EXPECT_EQ(connection->Identity(), "default_alice");
}

TEST_F(UserSessionTest, GroupsNamedLikeOtherSourcesGetTheirOwnContainers)
{
    Entity userGroup;
    userGroup.kind = EntityKind::UserGroup;
    userGroup.identifier = "user";
    userGroup.attributes = {{kImageNameAttribute, std::string("rdp-box")},
                            {kImagePortAttribute, std::string("3389")},
                            {kImageProtocolAttribute, std::string("rdp")}};
    Entity defaultGroup = userGroup;
    defaultGroup.identifier = "default";
    groups_ = {userGroup, defaultGroup};

    ContainerSpec defaultSpec;
    defaultSpec.image = "desktop:latest";
    defaultSpec.internalPort = 5901;
    defaultSpec.protocol = Protocol::Vnc;

    auto session = Open(defaultSpec);
    auto& catalog = session->Connections();
    const auto user = std::dynamic_pointer_cast<ContainerConnection>(catalog.Get("docker-user-alice"));
    const auto group = std::dynamic_pointer_cast<ContainerConnection>(catalog.Get("docker-group-user"));
    const auto groupDefault =
        std::dynamic_pointer_cast<ContainerConnection>(catalog.Get("docker-group-default"));
    const auto fallback =
        std::dynamic_pointer_cast<ContainerConnection>(catalog.Get(kDefaultConnectionId));
    ASSERT_TRUE(user && group && groupDefault && fallback);

    EXPECT_EQ(user->Identity(), "user_alice");
    EXPECT_EQ(group->Identity(), "group_user_alice");
    EXPECT_EQ(groupDefault->Identity(), "group_default_alice");
    EXPECT_EQ(fallback->Identity(), "default_alice");

    const ConnectionConfiguration userConfiguration = user->Connect();
    const ConnectionConfiguration groupConfiguration = group->Connect();
    EXPECT_EQ(engine_.createCalls.load(), 2);
    EXPECT_NE(userConfiguration.parameters.at("port"), groupConfiguration.parameters.at("port"));

    group->Release();
    EXPECT_TRUE(engine_.IsRunning("user_alice"));
    EXPECT_FALSE(engine_.Contains("group_user_alice"));
}

TEST_F(UserSessionTest, CloseReleasesProvisionedContainers)
{
    auto session = Open();
    const ConnectionConfiguration configuration =
        session->Connections().Get("docker-user-alice")->Connect();
    EXPECT_EQ(configuration.parameters.at("username"), "alice");
    EXPECT_TRUE(engine_.IsRunning("user_alice"));

    session->Close();
    EXPECT_TRUE(session->Closed());
    EXPECT_FALSE(engine_.IsRunning("user_alice"));
    EXPECT_EQ(engine_.stopCalls.load(), 1);

    session.reset();
    EXPECT_EQ(engine_.stopCalls.load(), 1);
}

TEST_F(UserSessionTest, ConcurrentCloseReleasesOnce)
{
    auto session = Open();
    session->Connections().Get("docker-user-alice")->Connect();

    std::vector<std::thread> closers;
    for (int i = 0; i < 4; ++i)
        closers.emplace_back([&session]() { session->Close(); });
    for (auto& closer : closers)
        closer.join();
    session.reset();

    EXPECT_EQ(engine_.stopCalls.load(), 1);
    EXPECT_EQ(engine_.removeCalls.load(), 1);
}

TEST_F(UserSessionTest, DestructorReleasesDespiteStopFailures)
{
    {
        auto session = Open();
        session->Connections().Get("docker-user-alice")->Connect();
        session->Connections().Get("docker-group-lab")->Connect();
        engine_.failStop = true;
    }
    EXPECT_EQ(engine_.stopCalls.load(), 2);
    EXPECT_TRUE(engine_.IsRunning("user_alice"));
}

TEST_F(UserSessionTest, ViewsFollowUpdatePermission)
{
    auto session = Open();

    const AttributeView user = session->UserView();
    EXPECT_FALSE(user.CanUpdate());
    EXPECT_EQ(user.Attributes().count(kImageNameAttribute), 0u);

    const auto groups = session->GroupViews();
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_TRUE(groups[0].CanUpdate());
    EXPECT_EQ(groups[0].Attributes().at(kImageNameAttribute), std::optional<std::string>("rdp-box"));
    EXPECT_FALSE(groups[1].CanUpdate());
}
