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
#include <kcenon/topology/adapters/memory_metrics_source.h>
#include <kcenon/topology/constructor/topology_constructor.h>
#include <kcenon/topology/ingest/metric_ingestor.h>

#include <cmath>
#include <memory>
#include <vector>

namespace kcenon {
namespace topology {
namespace {

const timestamp t0 = from_unix(1699999200);
const duration step{60};
constexpr std::size_t points = 4;

raw_series series(const std::string& query, label_set labels, std::vector<float> values) {
    return raw_series{query, std::move(labels), t0, step, std::move(values)};
}

raw_series ones(const std::string& query, label_set labels) {
    return series(query, std::move(labels), std::vector<float>(points, 1.0f));
}

class TopologyConstructorTest : public ::testing::Test {
  protected:
    void add(raw_series raw) { batch_.push_back(std::move(raw)); }

    void add_node(const std::string& name) {
        add(ones("kube_node_info", label_set{{"node", name}, {"internal_ip", "192.168.0.1"}}));
    }

    void add_pod(const std::string& ns,
                 const std::string& pod,
                 const std::string& uid,
                 const std::string& owner_kind,
                 const std::string& owner_name,
                 const std::string& node_name = "node-1",
                 const std::string& pod_ip = "") {
        add(ones("kube_pod_info", label_set{{"namespace", ns},
                                            {"pod", pod},
                                            {"uid", uid},
                                            {"created_by_kind", owner_kind},
                                            {"created_by_name", owner_name},
                                            {"node", node_name},
                                            {"pod_ip", pod_ip},
                                            {"host_ip", "192.168.0.1"}}));
    }

    std::shared_ptr<world> build() {
        metric_ingestor ingestor(t0, t0 + points * step, step);
        ingestor.add_all(batch_);
        return constructor_.build_world(t0, t0 + points * step, step, ingestor.metrics());
    }

    topology_constructor constructor_;
    std::vector<raw_series> batch_;
};

// =============================================================================
// Nodes and services
// =============================================================================

TEST_F(TopologyConstructorTest, LoadsNodesAndServices) {
    add_node("node-1");
    add(ones("kube_service_info", label_set{{"namespace", "default"}, {"service", "kubernetes"}, {"cluster_ip", "10.96.0.1"}}));
    add(ones("kube_service_info", label_set{{"namespace", "shop"}, {"service", "headless"}, {"cluster_ip", ""}}));

    auto w = build();
    ASSERT_EQ(w->nodes().size(), 1u);
    EXPECT_EQ(w->nodes().front().internal_ip, "192.168.0.1");
    ASSERT_EQ(w->services().size(), 1u);
    EXPECT_EQ(w->services().front().name, "kube-apiserver");
    EXPECT_EQ(w->points(), points);
}

// =============================================================================
// Pods
// =============================================================================

TEST_F(TopologyConstructorTest, StaticPodsTrimNodeSuffix) {
    add_node("node-1");
    add_pod("kube-system", "etcd-node-1", "u1", "Node", "node-1");
    add_pod("kube-system", "kube-proxy-abc", "u2", "", "");

    auto w = build();
    EXPECT_TRUE(w->integrations.kube_state_metrics);
    const auto* etcd = w->get_application(application_id{"kube-system", application_kind::static_pods, "etcd"});
    ASSERT_NE(etcd, nullptr);
    ASSERT_EQ(etcd->instances().size(), 1u);
    EXPECT_EQ(etcd->instances().front()->node_name(), "node-1");
    EXPECT_NE(w->get_application(application_id{"kube-system", application_kind::static_pods, "kube-proxy-abc"}), nullptr);
}

TEST_F(TopologyConstructorTest, DropsPodsWithUnsupportedOwner) {
    add_pod("shop", "api-1", "u1", "Rollout", "api");
    add_pod("shop", "api-2", "u2", "ReplicaSet", "");
    auto w = build();
    EXPECT_TRUE(w->applications().empty());
}

TEST_F(TopologyConstructorTest, UnknownNodeIsNotAttached) {
    add_pod("shop", "db-0", "u1", "StatefulSet", "db", "node-9");
    auto w = build();
    const auto* db = w->get_application(application_id{"shop", application_kind::stateful_set, "db"});
    ASSERT_NE(db, nullptr);
    EXPECT_TRUE(db->instances().front()->node_name().empty());
}

TEST_F(TopologyConstructorTest, RecordsPodListenAddress) {
    add_node("node-1");
    add_pod("shop", "db-0", "u1", "StatefulSet", "db", "node-1", "10.1.0.5");
    add_pod("shop", "db-1", "u2", "StatefulSet", "db", "node-1", "192.168.0.1");
    add_pod("shop", "db-2", "u3", "StatefulSet", "db", "node-1", "not-an-ip");

    auto w = build();
    const auto* db = w->get_application(application_id{"shop", application_kind::stateful_set, "db"});
    ASSERT_NE(db, nullptr);
    const auto* db0 = db->get_instance("db-0");
    ASSERT_NE(db0, nullptr);
    ASSERT_EQ(db0->tcp_listens.size(), 1u);
    EXPECT_TRUE(db0->tcp_listens.at(listen{"10.1.0.5", "0", false}));
    EXPECT_TRUE(db->get_instance("db-1")->tcp_listens.empty());
    EXPECT_TRUE(db->get_instance("db-2")->tcp_listens.empty());
    EXPECT_EQ(w->find_instance_by_ip("10.1.0.5"), db0);
}

TEST_F(TopologyConstructorTest, ReplicaSetPodsMoveToDeployment) {
    add_pod("shop", "api-5d9c-x1", "u1", "ReplicaSet", "api-5d9c");
    add(ones("kube_replicaset_owner", label_set{{"namespace", "shop"},
                                                {"replicaset", "api-5d9c"},
                                                {"owner_kind", "Deployment"},
                                                {"owner_name", "api"}}));
    add(series("kube_deployment_spec_replicas", label_set{{"namespace", "shop"}, {"deployment", "api"}}, {3, 3, 3, 3}));

    auto w = build();
    const application_id api{"shop", application_kind::deployment, "api"};
    EXPECT_EQ(w->get_application(application_id{"shop", application_kind::replica_set, "api-5d9c"}), nullptr);
    const auto* app = w->get_application(api);
    ASSERT_NE(app, nullptr);
    ASSERT_EQ(app->instances().size(), 1u);
    const auto& inst = *app->instances().front();
    EXPECT_EQ(inst.owner(), api);
    ASSERT_TRUE(inst.pod.has_value());
    EXPECT_EQ(inst.pod->replica_set, "api-5d9c");
    EXPECT_FLOAT_EQ(app->desired_instances.last(), 3.0f);
}

TEST_F(TopologyConstructorTest, StandaloneReplicaSetStays) {
    add_pod("shop", "worker-x1", "u1", "ReplicaSet", "worker");
    auto w = build();
    EXPECT_NE(w->get_application(application_id{"shop", application_kind::replica_set, "worker"}), nullptr);
}

// =============================================================================
// Pod and container status
// =============================================================================

TEST_F(TopologyConstructorTest, LoadsPodStatus) {
    add_pod("shop", "db-0", "u1", "StatefulSet", "db");
    label_set phase_running{{"uid", "u1"}, {"phase", "Running"}};
    label_set phase_pending{{"uid", "u1"}, {"phase", "Pending"}};
    add(series("kube_pod_status_phase", phase_pending, {1, 0, 0, 0}));
    add(series("kube_pod_status_phase", phase_running, {0, 1, 1, 1}));
    add(series("kube_pod_status_ready", label_set{{"uid", "u1"}, {"condition", "true"}}, {0, 0, 1, 1}));
    add(series("kube_pod_status_scheduled", label_set{{"uid", "u1"}, {"condition", "true"}}, {1, 1, 1, 1}));
    add(ones("kube_pod_status_phase", label_set{{"uid", "missing"}, {"phase", "Running"}}));

    auto w = build();
    const auto* inst = w->get_instance(instance_ref{{"shop", application_kind::stateful_set, "db"}, "db-0"});
    ASSERT_NE(inst, nullptr);
    ASSERT_TRUE(inst->pod.has_value());
    EXPECT_EQ(inst->pod->phase, "Running");
    EXPECT_TRUE(inst->pod->scheduled);
    EXPECT_EQ(inst->pod->running.values(), (std::vector<float>{0, 1, 1, 1}));
    EXPECT_EQ(inst->pod->ready.values(), (std::vector<float>{0, 0, 1, 1}));
    EXPECT_EQ(inst->pod->life_span.values(), (std::vector<float>{1, 1, 1, 1}));
}

TEST_F(TopologyConstructorTest, LoadsContainerStatus) {
    add_pod("shop", "db-0", "u1", "StatefulSet", "db");
    label_set app_container{{"uid", "u1"}, {"container", "postgres"}, {"image", "postgres:16"}};
    add(ones("kube_pod_container_info", app_container));
    add(ones("kube_pod_init_container_info", label_set{{"uid", "u1"}, {"container", "init"}, {"image", "busybox"}}));
    add(series("kube_pod_container_status_waiting_reason",
               label_set{{"uid", "u1"}, {"container", "postgres"}, {"reason", "CrashLoopBackOff"}}, {1, 1, 1, 1}));
    add(series("kube_pod_container_status_last_terminated_reason",
               label_set{{"uid", "u1"}, {"container", "postgres"}, {"reason", "OOMKilled"}}, {1, 1, 1, 1}));
    add(series("kube_pod_container_status_ready", label_set{{"uid", "u1"}, {"container", "postgres"}}, {0, 0, 0, 0}));

    auto w = build();
    const auto* inst = w->get_instance(instance_ref{{"shop", application_kind::stateful_set, "db"}, "db-0"});
    ASSERT_NE(inst, nullptr);
    const auto* c = inst->get_container("postgres");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->image, "postgres:16");
    EXPECT_EQ(c->status, container_status::waiting);
    EXPECT_EQ(c->reason, "CrashLoopBackOff");
    EXPECT_EQ(c->last_terminated_reason, "OOMKilled");
    EXPECT_FALSE(c->ready);
    EXPECT_FALSE(c->init_container);

    const auto* init = inst->get_container("init");
    ASSERT_NE(init, nullptr);
    EXPECT_TRUE(init->init_container);
    EXPECT_EQ(init->image, "busybox");
}

// =============================================================================
// Database cluster labels
// =============================================================================

TEST_F(TopologyConstructorTest, ReadsClusterRolesFromOperatorLabels) {
    add_pod("db", "pg-0", "u1", "StatefulSet", "pg");
    add_pod("db", "pg-1", "u2", "StatefulSet", "pg");
    add_pod("db", "pg-pooler", "u3", "Deployment", "pg-pooler");
    add(ones("kube_pod_labels", label_set{{"uid", "u1"},
                                          {"label_cluster_name", "main"},
                                          {"label_team", "acid"},
                                          {"label_application", "spilo"},
                                          {"label_spilo_role", "master"}}));
    add(ones("kube_pod_labels", label_set{{"uid", "u2"},
                                          {"label_postgres_operator_crunchydata_com_cluster", "main"},
                                          {"label_postgres_operator_crunchydata_com_role", "replica"}}));
    add(ones("kube_pod_labels", label_set{{"uid", "u3"},
                                          {"label_cluster_name", "main"},
                                          {"label_team", "acid"},
                                          {"label_application", "db-connection-pooler"}}));

    auto w = build();
    const application_id pg{"db", application_kind::stateful_set, "pg"};
    const auto* primary = w->get_instance(instance_ref{pg, "pg-0"});
    const auto* replica = w->get_instance(instance_ref{pg, "pg-1"});
    ASSERT_NE(primary, nullptr);
    ASSERT_NE(replica, nullptr);
    EXPECT_EQ(primary->cluster_name, "main");
    EXPECT_FLOAT_EQ(primary->cluster_role.last(), cluster_role_code::primary);
    EXPECT_FLOAT_EQ(replica->cluster_role.last(), cluster_role_code::replica);

    const auto* pooler = w->get_instance(instance_ref{{"db", application_kind::deployment, "pg-pooler"}, "pg-pooler"});
    ASSERT_NE(pooler, nullptr);
    EXPECT_EQ(pooler->cluster_name, "main");
    EXPECT_TRUE(pooler->cluster_role.empty());
}

TEST_F(TopologyConstructorTest, EnterpriseDbLabelsAndConventionPriority) {
    add_pod("db", "edb-1", "u1", "StatefulSet", "edb");
    add_pod("db", "edb-2", "u2", "StatefulSet", "edb");
    add_pod("db", "mixed-0", "u3", "StatefulSet", "mixed");
    add(ones("kube_pod_labels", label_set{{"uid", "u1"},
                                          {"label_k8s_enterprisedb_io_cluster", "orders"},
                                          {"label_role", "primary"}}));
    add(ones("kube_pod_labels", label_set{{"uid", "u2"},
                                          {"label_k8s_enterprisedb_io_cluster", "orders"},
                                          {"label_role", "replica"}}));
    // Crunchy labels take precedence over Zalando ones on the same pod
    add(ones("kube_pod_labels", label_set{{"uid", "u3"},
                                          {"label_postgres_operator_crunchydata_com_cluster", "crunchy"},
                                          {"label_postgres_operator_crunchydata_com_role", "replica"},
                                          {"label_cluster_name", "zalando"},
                                          {"label_team", "acid"},
                                          {"label_application", "spilo"},
                                          {"label_spilo_role", "master"}}));

    auto w = build();
    const application_id edb{"db", application_kind::stateful_set, "edb"};
    const auto* primary = w->get_instance(instance_ref{edb, "edb-1"});
    const auto* replica = w->get_instance(instance_ref{edb, "edb-2"});
    ASSERT_NE(primary, nullptr);
    ASSERT_NE(replica, nullptr);
    EXPECT_EQ(primary->cluster_name, "orders");
    EXPECT_EQ(replica->cluster_name, "orders");
    EXPECT_FLOAT_EQ(primary->cluster_role.last(), cluster_role_code::primary);
    EXPECT_FLOAT_EQ(replica->cluster_role.last(), cluster_role_code::replica);

    const auto* mixed = w->get_instance(instance_ref{{"db", application_kind::stateful_set, "mixed"}, "mixed-0"});
    ASSERT_NE(mixed, nullptr);
    EXPECT_EQ(mixed->cluster_name, "crunchy");
    EXPECT_FLOAT_EQ(mixed->cluster_role.last(), cluster_role_code::replica);
}

// =============================================================================
// Node agent metrics
// =============================================================================

TEST_F(TopologyConstructorTest, CountersBecomeDeltas) {
    add_pod("shop", "api-1", "u1", "Deployment", "api");
    add(series("kube_pod_status_phase", label_set{{"uid", "u1"}, {"phase", "Running"}}, {1, 1, 1, 1}));
    label_set restart_labels{{"uid", "u1"}, {"container", "app"}};
    add(series("kube_pod_container_status_restarts_total", restart_labels, {2, 2, 3, 5}));
    label_set oom_labels{{"namespace", "shop"}, {"pod", "api-1"}, {"container", "app"}};
    add(series("container_oom_kills_total", oom_labels, {0, 1, 1, 1}));
    add(series("container_log_messages_total",
               label_set{{"namespace", "shop"}, {"pod", "api-1"}, {"container", "app"}, {"level", "error"}}, {10, 12, 15, 15}));
    add(series("container_log_messages_total",
               label_set{{"namespace", "shop"}, {"pod", "api-1"}, {"container", "sidecar"}, {"level", "error"}}, {1, 2, 2, 2}));

    auto w = build();
    EXPECT_TRUE(w->integrations.node_agent);
    const auto* inst = w->get_instance(instance_ref{{"shop", application_kind::deployment, "api"}, "api-1"});
    ASSERT_NE(inst, nullptr);
    const auto* c = inst->get_container("app");
    ASSERT_NE(c, nullptr);

    ASSERT_EQ(c->restarts.size(), points);
    EXPECT_TRUE(is_missing(c->restarts.values()[0]));
    EXPECT_FLOAT_EQ(c->restarts.values()[1], 0.0f);
    EXPECT_FLOAT_EQ(c->restarts.values()[2], 1.0f);
    EXPECT_FLOAT_EQ(c->restarts.values()[3], 2.0f);
    EXPECT_FLOAT_EQ(c->oom_kills.reduce(series_ops::nan_sum), 1.0f);

    const auto& errors = inst->log_messages_by_level.at(message_level::error);
    EXPECT_EQ(errors.values()[1], 3.0f);
    EXPECT_FLOAT_EQ(errors.reduce(series_ops::nan_sum), 6.0f);
}

TEST_F(TopologyConstructorTest, LoadsUsageAndConnections) {
    add_pod("shop", "api-1", "u1", "Deployment", "api");
    add_pod("shop", "db-0", "u2", "StatefulSet", "db", "node-1", "10.1.0.5");
    add_node("node-1");
    add(ones("kube_service_info", label_set{{"namespace", "shop"}, {"service", "db"}, {"cluster_ip", "10.96.0.20"}}));
    label_set usage{{"namespace", "shop"}, {"pod", "api-1"}, {"container", "app"}};
    add(series("container_cpu_usage", usage, {0.5f, 0.25f, 0.5f, 1}));
    add(series("container_memory_rss", usage, {100, 110, 120, 130}));
    label_set conn{{"namespace", "shop"}, {"pod", "api-1"}, {"destination_ip", "10.96.0.20"}, {"actual_destination_ip", "10.1.0.5"}};
    add(series("container_net_tcp_active_connections", conn, {1, 1, 2, 2}));
    add(series("container_net_tcp_active_connections", conn, {1, missing, 1, 1}));

    auto w = build();
    const auto* inst = w->get_instance(instance_ref{{"shop", application_kind::deployment, "api"}, "api-1"});
    ASSERT_NE(inst, nullptr);
    const auto* c = inst->get_container("app");
    ASSERT_NE(c, nullptr);
    EXPECT_FLOAT_EQ(c->cpu_usage.last(), 1.0f);
    EXPECT_FLOAT_EQ(c->memory_rss.last(), 130.0f);

    ASSERT_EQ(inst->connections.size(), 1u);
    EXPECT_EQ(inst->connections.front().active.values(), (std::vector<float>{2, 1, 3, 3}));

    const auto* s = w->get_service_for_connection(inst->connections.front());
    ASSERT_NE(s, nullptr);
    EXPECT_EQ(s->name, "db");
    ASSERT_EQ(s->connections.size(), 1u);
    EXPECT_EQ(s->connections.front().actual_remote_ip, "10.1.0.5");
    EXPECT_EQ(w->find_instance_by_ip(inst->connections.front().actual_remote_ip)->name(), "db-0");
}

TEST_F(TopologyConstructorTest, MetricsOfUnknownPodsAreSkipped) {
    add(ones("container_cpu_usage", label_set{{"namespace", "shop"}, {"pod", "ghost"}, {"container", "app"}}));
    add(ones("kube_pod_container_info", label_set{{"uid", "ghost"}, {"container", "app"}}));
    auto w = build();
    EXPECT_TRUE(w->applications().empty());
    EXPECT_TRUE(w->integrations.node_agent);
    EXPECT_FALSE(w->integrations.kube_state_metrics);
}

// =============================================================================
// Application SLIs
// =============================================================================

TEST_F(TopologyConstructorTest, LoadsApplicationSlis) {
    add_pod("shop", "api-1", "u1", "Deployment", "api");
    label_set app_labels{{"namespace", "shop"}, {"kind", "Deployment"}, {"application", "api"}};
    add(series("application_requests_total", app_labels, {10, 10, 10, 10}));
    add(series("application_requests_failed", app_labels, {1, 0, 0, 0}));
    auto bucket = [&](const std::string& le, std::vector<float> v) {
        label_set labels{{"namespace", "shop"}, {"kind", "Deployment"}, {"application", "api"}, {"le", le}};
        add(series("application_latency_bucket", labels, std::move(v)));
    };
    bucket("0.5", {8, 8, 8, 8});
    bucket("0.1", {5, 5, 5, 5});
    bucket("+Inf", {10, 10, 10, 10});
    bucket("fast", {1, 1, 1, 1});
    add(ones("application_requests_total", label_set{{"namespace", "shop"}, {"kind", "Deployment"}, {"application", "gone"}}));

    auto w = build();
    const auto* app = w->get_application(application_id{"shop", application_kind::deployment, "api"});
    ASSERT_NE(app, nullptr);
    ASSERT_EQ(app->availability_slis.size(), 1u);
    EXPECT_FLOAT_EQ(app->availability_slis.front().total_requests.reduce(series_ops::nan_sum), 40.0f);
    EXPECT_FLOAT_EQ(app->availability_slis.front().failed_requests.reduce(series_ops::nan_sum), 1.0f);

    ASSERT_EQ(app->latency_slis.size(), 1u);
    const auto& histogram = app->latency_slis.front().histogram;
    ASSERT_EQ(histogram.size(), 3u);
    EXPECT_FLOAT_EQ(histogram[0].le, 0.1f);
    EXPECT_FLOAT_EQ(histogram[1].le, 0.5f);
    EXPECT_TRUE(std::isinf(histogram[2].le));
}

// =============================================================================
// Loading through a metrics source
// =============================================================================

TEST(TopologyLoadTest, FailsWithoutSource) {
    topology_constructor constructor;
    auto res = constructor.load_world(t0, t0 + points * step, step);
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(error_code_of(res.error()), topology_error_code::cache_unavailable);
}

TEST(TopologyLoadTest, PropagatesQueryFailure) {
    auto source = std::make_shared<memory_metrics_source>();
    source->fail_query("kube_pod_info");
    topology_constructor constructor(source);
    auto res = constructor.load_world(t0, t0 + points * step, step);
    ASSERT_TRUE(res.is_err());
    EXPECT_EQ(error_code_of(res.error()), topology_error_code::query_failed);
}

TEST(TopologyLoadTest, AppliesLabelFilters) {
    auto source = std::make_shared<memory_metrics_source>();
    source->add(ones("kube_pod_info", label_set{{"namespace", "shop"}, {"pod", "api-1"}, {"uid", "u1"},
                                               {"created_by_kind", "Deployment"}, {"created_by_name", "api"}}));
    source->add(ones("kube_pod_info", label_set{{"namespace", "ops"}, {"pod", "agent-1"}, {"uid", "u2"},
                                               {"created_by_kind", "DaemonSet"}, {"created_by_name", "agent"}}));
    topology_constructor constructor(source);

    auto all = constructor.load_world(t0, t0 + points * step, step);
    ASSERT_TRUE(all.is_ok());
    EXPECT_EQ(all.value()->applications().size(), 2u);

    auto filtered = constructor.load_world(t0, t0 + points * step, step, label_filters{{"namespace", "shop"}});
    ASSERT_TRUE(filtered.is_ok());
    ASSERT_EQ(filtered.value()->applications().size(), 1u);
    EXPECT_EQ(filtered.value()->applications().front()->id().name, "api");
}

} // namespace
} // namespace topology
} // namespace kcenon
