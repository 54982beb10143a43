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

/**
 * @file rollout_pipeline_test.cpp
 * @brief End-to-end runs of the deployment pipeline over a simulated cluster
 *
 * Metrics flow from the in-memory cache through the topology constructor
 * and the rollout detector into the store, and out through notifiers.
 */

#include "../framework/cluster_fixture.h"

#include <kcenon/topology/constructor/topology_constructor.h>
#include <kcenon/topology/deployments/deployment_notifiers.h>

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace integration_tests {

namespace {

class capturing_notifier : public deployment_notifier {
public:
    std::string name() const override { return "capture"; }
    bool is_ready() const override { return true; }

    result_void notify(const project&, const deployment_status& status, std::chrono::milliseconds) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(status);
        return make_void_success();
    }

    std::vector<deployment_status> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<deployment_status> sent_;
};

const application_deployment* find_deployment(const std::vector<application_deployment>& all,
                                              const std::string& name) {
    auto it = std::find_if(all.begin(), all.end(), [&](const auto& d) { return d.name == name; });
    return it == all.end() ? nullptr : &*it;
}

} // namespace

class RolloutPipelineTest : public ClusterFixture {
protected:
    void SetUp() override {
        ClusterFixture::SetUp();

        AddNode("node-1", "192.168.1.10");
        AddService("shop", "api", "10.96.0.20");

        // api: clean cut-over at 30m
        AddDeploymentPod("shop", "api", "api-a", "api-a-1", "api:1", step_series(30, 1, 0));
        AddDeploymentPod("shop", "api", "api-b", "api-b-1", "api:2", step_series(30, 0, 1));

        // web: web-b starts at 45m, web-a is gone at 50m
        AddDeploymentPod("shop", "web", "web-a", "web-a-1", "web:1", step_series(50, 1, 0));
        AddDeploymentPod("shop", "web", "web-b", "web-b-1", "web:2", step_series(45, 0, 1));

        // cart never changes
        AddDeploymentPod("shop", "cart", "cart-a", "cart-a-1", "cart:7", constant(1));

        // db is not a Deployment and never yields rollouts
        AddPod("shop", "db-0", "StatefulSet", "db", "postgres:16", constant(1));

        Emit("application_requests_total",
             label_set{{"namespace", "shop"}, {"kind", "Deployment"}, {"application", "api"}}, constant(5));
        Emit("application_requests_failed",
             label_set{{"namespace", "shop"}, {"kind", "Deployment"}, {"application", "api"}}, constant(1));
    }

    void RunAt(duration offset) {
        source_->set_to(origin() + offset);
        ASSERT_TRUE(watcher_->run_once().is_ok());
    }

    void CreatePipeline() {
        watcher_ = CreateWatcher();
        notifier_ = std::make_shared<capturing_notifier>();
        ASSERT_TRUE(watcher_->add_notifier(notifier_).is_ok());

        webhook_config hook;
        hook.url = "https://hooks.example.com/deployments";
        auto webhook = std::make_shared<webhook_deployment_notifier>(hook);
        webhook->set_http_sender([this](const std::string&, const std::string&,
                                        const std::unordered_map<std::string, std::string>&,
                                        const std::string& body, std::chrono::milliseconds) {
            std::lock_guard<std::mutex> lock(bodies_mutex_);
            bodies_.push_back(body);
            return make_void_success();
        });
        ASSERT_TRUE(watcher_->add_notifier(webhook).is_ok());
    }

    std::unique_ptr<deployment_watcher> watcher_;
    std::shared_ptr<capturing_notifier> notifier_;
    std::mutex bodies_mutex_;
    std::vector<std::string> bodies_;
};

/**
 * Test 1: The constructed world holds every workload of the cluster
 */
TEST_F(RolloutPipelineTest, WorldHoldsAllWorkloads) {
    topology_constructor constructor(source_);
    auto res = constructor.load_world(origin(), origin() + hour, step());
    ASSERT_TRUE(res.is_ok()) << res.error().message;
    auto w = res.value();

    EXPECT_NE(w->get_application(application_id{"shop", application_kind::deployment, "api"}), nullptr);
    EXPECT_NE(w->get_application(application_id{"shop", application_kind::deployment, "web"}), nullptr);
    EXPECT_NE(w->get_application(application_id{"shop", application_kind::deployment, "cart"}), nullptr);
    EXPECT_NE(w->get_application(application_id{"shop", application_kind::stateful_set, "db"}), nullptr);
    EXPECT_NE(w->get_node("node-1"), nullptr);
}

/**
 * Test 2: Rollouts are detected, stored and announced on every channel
 */
TEST_F(RolloutPipelineTest, RolloutsReachStoreAndChannels) {
    CreatePipeline();
    RunAt(hour);

    auto deployments = StoredDeployments();
    ASSERT_EQ(deployments.size(), 3u);

    const auto* api = find_deployment(deployments, "api-b");
    ASSERT_NE(api, nullptr);
    EXPECT_EQ(api->started_at, origin() + 30 * minute);
    EXPECT_EQ(api->finished_at, origin() + 30 * minute);

    const auto* web = find_deployment(deployments, "web-b");
    ASSERT_NE(web, nullptr);
    EXPECT_EQ(web->started_at, origin() + 45 * minute);
    EXPECT_EQ(web->finished_at, origin() + 50 * minute);
    ASSERT_TRUE(web->details.has_value());
    EXPECT_EQ(web->details->container_images, std::vector<std::string>{"web:2"});

    // cart is recorded as already running when first seen
    const auto* cart = find_deployment(deployments, "cart-a");
    ASSERT_NE(cart, nullptr);
    EXPECT_EQ(cart->started_at, origin() + hour);

    auto sent = notifier_->sent();
    ASSERT_EQ(sent.size(), 2u);
    for (const auto& status : sent) {
        EXPECT_EQ(status.state, deployment_state::deployed);
    }
    ASSERT_EQ(bodies_.size(), 2u);
    EXPECT_NE(bodies_.front().find("\"state\":\"deployed\""), std::string::npos);
}

/**
 * Test 3: Once the post-rollout window has passed, a summary follows
 */
TEST_F(RolloutPipelineTest, SummaryFollowsSnapshot) {
    CreatePipeline();
    RunAt(hour);
    RunAt(2 * hour);

    auto deployments = StoredDeployments();
    const auto* api = find_deployment(deployments, "api-b");
    ASSERT_NE(api, nullptr);
    ASSERT_TRUE(api->snapshot.has_value());
    EXPECT_EQ(api->snapshot->at, origin() + 61 * minute);
    EXPECT_GT(api->snapshot->requests, 0);
    EXPECT_GT(api->snapshot->errors, 0);

    const auto* web = find_deployment(deployments, "web-b");
    ASSERT_NE(web, nullptr);
    ASSERT_TRUE(web->snapshot.has_value());
    EXPECT_EQ(web->snapshot->at, origin() + 81 * minute);
    EXPECT_EQ(web->snapshot->requests, 0);

    std::map<std::string, std::vector<deployment_state>> by_name;
    for (const auto& status : notifier_->sent()) {
        by_name[status.deployment.name].push_back(status.state);
    }
    EXPECT_EQ(by_name["api-b"], (std::vector<deployment_state>{deployment_state::deployed, deployment_state::summary}));
    EXPECT_EQ(by_name["web-b"], (std::vector<deployment_state>{deployment_state::deployed, deployment_state::summary}));
    EXPECT_EQ(by_name.count("cart-a"), 0u);

    auto stats = watcher_->stats();
    EXPECT_EQ(stats.passes, 2u);
    EXPECT_EQ(stats.snapshots_saved, 2u);
    EXPECT_EQ(stats.notifications_failed, 0u);
}

/**
 * Test 4: Passes over unchanged data leave the store and channels alone
 */
TEST_F(RolloutPipelineTest, RepeatedPassesAreStable) {
    CreatePipeline();
    RunAt(2 * hour);
    const auto deployments = StoredDeployments();
    const auto sent = notifier_->sent().size();

    for (int i = 0; i < 3; ++i) {
        RunAt(2 * hour);
    }

    auto again = StoredDeployments();
    ASSERT_EQ(again.size(), deployments.size());
    for (std::size_t i = 0; i < again.size(); ++i) {
        EXPECT_EQ(again[i].key(), deployments[i].key());
        EXPECT_EQ(again[i].finished_at, deployments[i].finished_at);
        EXPECT_EQ(again[i].snapshot, deployments[i].snapshot);
        EXPECT_EQ(again[i].notifications, deployments[i].notifications);
    }
    EXPECT_EQ(notifier_->sent().size(), sent);
}

/**
 * Test 5: The background loop runs passes on its own
 */
TEST_F(RolloutPipelineTest, BackgroundLoopDetectsRollouts) {
    watcher_config config;
    config.interval = duration{1};
    watcher_ = CreateWatcher(config);
    source_->set_to(origin() + hour);

    ASSERT_TRUE(watcher_->start().is_ok());
    const bool detected = WaitForCondition([this] { return StoredDeployments().size() == 3; },
                                           std::chrono::seconds(10));
    ASSERT_TRUE(watcher_->stop().is_ok());

    EXPECT_TRUE(detected);
    EXPECT_FALSE(watcher_->is_running());
    EXPECT_GE(watcher_->stats().passes, 1u);
}

} // namespace integration_tests
