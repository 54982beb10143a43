// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include <gtest/gtest.h>
#include <kcenon/topology/model/world.h>

namespace kcenon {
namespace topology {
namespace {

const timestamp t0 = from_unix(1699999200);
const duration step{60};

const application_id api{"shop", application_kind::deployment, "api"};
const application_id db{"shop", application_kind::stateful_set, "db"};

class WorldTest : public ::testing::Test {
  protected:
    world world_{t0, t0 + 10 * step, step};
};

// =============================================================================
// Identity
// =============================================================================

TEST(ApplicationIdTest, FormatsAndParses) {
    EXPECT_EQ(api.to_string(), "shop:Deployment:api");
    EXPECT_EQ(parse_application_kind("StatefulSet"), application_kind::stateful_set);
    EXPECT_FALSE(parse_application_kind("Rollout").has_value());
    EXPECT_NE(api, db);
    EXPECT_EQ(std::hash<application_id>{}(api), std::hash<application_id>{}(application_id{"shop", application_kind::deployment, "api"}));
}

TEST(MessageLevelTest, ParsesAliases) {
    EXPECT_EQ(parse_message_level("WARN"), message_level::warning);
    EXPECT_EQ(parse_message_level("fatal"), message_level::critical);
    EXPECT_EQ(parse_message_level("error"), message_level::error);
    EXPECT_EQ(parse_message_level("trace"), message_level::unknown);
}

TEST_F(WorldTest, PointsFollowWindow) {
    EXPECT_EQ(world_.points(), 10u);
    EXPECT_EQ(world(t0, t0, step).points(), 0u);
}

TEST_F(WorldTest, GetOrCreateNeverDuplicates) {
    auto& first = world_.get_or_create_application(api);
    auto& second = world_.get_or_create_application(application_id{"shop", application_kind::deployment, "api"});
    EXPECT_EQ(&first, &second);
    EXPECT_EQ(world_.applications().size(), 1u);

    world_.get_or_create_application(application_id{"shop", application_kind::stateful_set, "api"});
    EXPECT_EQ(world_.applications().size(), 2u);
}

TEST_F(WorldTest, InstancesAreCreatedOnce) {
    auto& app = world_.get_or_create_application(api);
    auto& a = app.get_or_create_instance("api-1", "node-1");
    auto& b = app.get_or_create_instance("api-1");
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(a.node_name(), "node-1");
    EXPECT_EQ(a.owner(), api);
    EXPECT_EQ(app.instances().size(), 1u);
}

TEST_F(WorldTest, NodesAndServicesUpsert) {
    world_.add_node(node{"node-1", "10.0.0.1"});
    world_.add_node(node{"node-1", "10.0.0.2"});
    ASSERT_EQ(world_.nodes().size(), 1u);
    EXPECT_EQ(world_.get_node("node-1")->internal_ip, "10.0.0.2");
    EXPECT_EQ(world_.get_node("node-2"), nullptr);

    world_.add_service(service{"api", "shop", "10.96.0.10", {}});
    world_.add_service(service{"api", "shop", "10.96.0.11", {}});
    ASSERT_EQ(world_.services().size(), 1u);
    EXPECT_EQ(world_.services().front().cluster_ip, "10.96.0.11");
}

TEST_F(WorldTest, RemoveApplication) {
    world_.get_or_create_application(api);
    EXPECT_TRUE(world_.remove_application(api));
    EXPECT_FALSE(world_.remove_application(api));
    EXPECT_EQ(world_.get_application(api), nullptr);
}

// =============================================================================
// Re-parenting
// =============================================================================

TEST_F(WorldTest, AdoptInstancesKeepsAddresses) {
    const application_id rs{"shop", application_kind::replica_set, "api-5d9c"};
    auto& rs_app = world_.get_or_create_application(rs);
    auto* inst = &rs_app.get_or_create_instance("api-5d9c-x1");

    auto& owner = world_.get_or_create_application(api);
    owner.adopt_instances(rs_app);
    world_.remove_application(rs);

    ASSERT_EQ(owner.instances().size(), 1u);
    EXPECT_EQ(owner.instances().front().get(), inst);
    EXPECT_EQ(inst->owner(), api);
    EXPECT_EQ(world_.get_instance(instance_ref{api, "api-5d9c-x1"}), inst);
}

// =============================================================================
// Indexes
// =============================================================================

TEST_F(WorldTest, FindsInstanceByListenIp) {
    auto& inst = world_.get_or_create_application(db).get_or_create_instance("db-0");
    inst.tcp_listens[listen{"10.1.0.5", "0", false}] = true;

    EXPECT_EQ(world_.find_instance_by_ip("10.1.0.5"), nullptr);
    world_.rebuild_indexes();
    EXPECT_EQ(world_.find_instance_by_ip("10.1.0.5"), &inst);
    EXPECT_EQ(world_.find_instance_by_ip("10.1.0.6"), nullptr);
}

TEST_F(WorldTest, ServiceForConnectionPrefersClusterIp) {
    world_.add_service(service{"db", "shop", "10.96.0.20", {}});
    auto& client = world_.get_or_create_application(api).get_or_create_instance("api-1");
    client.connections.push_back(connection{"10.96.0.20", "10.1.0.5", time_series(t0, 10, step)});
    world_.rebuild_indexes();

    ASSERT_EQ(world_.services().front().connections.size(), 1u);
    EXPECT_EQ(world_.services().front().connections.front().source, (instance_ref{api, "api-1"}));

    const auto* s = world_.get_service_for_connection(client.connections.front());
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->name, "db");
}

TEST_F(WorldTest, ServiceForConnectionFallsBackToActualAddress) {
    world_.add_service(service{"db", "shop", "10.96.0.20", {}});
    auto& client = world_.get_or_create_application(api).get_or_create_instance("api-1");
    client.connections.push_back(connection{"10.96.0.20", "10.1.0.5", time_series()});
    world_.rebuild_indexes();

    const auto* s = world_.get_service_for_connection(connection{"10.1.0.5", "10.1.0.5", time_series()});
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->name, "db");
    EXPECT_EQ(world_.get_service_for_connection(connection{"10.9.9.9", "10.9.9.9", time_series()}), nullptr);
}

TEST_F(WorldTest, RebuildIndexesIsIdempotent) {
    world_.add_service(service{"db", "shop", "10.96.0.20", {}});
    auto& client = world_.get_or_create_application(api).get_or_create_instance("api-1");
    client.connections.push_back(connection{"10.96.0.20", "", time_series()});
    world_.rebuild_indexes();
    world_.rebuild_indexes();
    EXPECT_EQ(world_.services().front().connections.size(), 1u);
}

// =============================================================================
// Application data
// =============================================================================

TEST(LatencySliTest, BucketsStaySortedAndMerge) {
    latency_sli sli;
    sli.add_bucket(0.5f, time_series(t0, step, {2, 2}));
    sli.add_bucket(0.1f, time_series(t0, step, {1, 1}));
    sli.add_bucket(0.5f, time_series(t0, step, {1, missing}));

    ASSERT_EQ(sli.histogram.size(), 2u);
    EXPECT_FLOAT_EQ(sli.histogram[0].le, 0.1f);
    EXPECT_FLOAT_EQ(sli.histogram[1].le, 0.5f);
    EXPECT_EQ(sli.histogram[1].requests.values(), (std::vector<float>{3, 2}));
}

TEST(InstanceTest, ClusterRoleTracksLatestObservation) {
    instance inst("db-0", db, "");
    inst.update_cluster_role("primary", time_series(t0, step, {1, 1, 0}));
    inst.update_cluster_role("replica", time_series(t0, step, {0, 0, 1}));
    inst.update_cluster_role("standby-leader", time_series(t0, step, {1, 1, 1}));

    const auto& role = inst.cluster_role.values();
    ASSERT_EQ(role.size(), 3u);
    EXPECT_FLOAT_EQ(role[0], cluster_role_code::primary);
    EXPECT_FLOAT_EQ(role[2], cluster_role_code::replica);
}

TEST(InstanceTest, ClusterNameNeedsDefinedPoint) {
    instance inst("db-0", db, "");
    inst.update_cluster_name("main", time_series(t0, step, {missing, missing}));
    EXPECT_TRUE(inst.cluster_name.empty());
    inst.update_cluster_name("main", time_series(t0, step, {missing, 1}));
    EXPECT_EQ(inst.cluster_name, "main");
}

} // namespace
} // namespace topology
} // namespace kcenon
