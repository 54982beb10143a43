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
 * @file deployment_watcher_example.cpp
 * @brief Detecting and announcing rollouts from a metrics cache
 *
 * This example demonstrates:
 * - Filling an in-memory metrics cache with kube-state-metrics style series
 * - Building the topology world and inspecting applications
 * - Configuring the deployment watcher from key=value settings
 * - Announcing rollouts through the log and webhook channels
 *
 * Settings may be overridden on the command line, e.g.
 *   ./deployment_watcher_example watcher.snapshot_window=15m
 */

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "kcenon/topology/adapters/console_logger.h"
#include "kcenon/topology/adapters/memory_metrics_source.h"
#include "kcenon/topology/config/watcher_config.h"
#include "kcenon/topology/constructor/topology_constructor.h"
#include "kcenon/topology/deployments/deployment_notifiers.h"
#include "kcenon/topology/deployments/deployment_store.h"
#include "kcenon/topology/deployments/deployment_watcher.h"

using namespace kcenon::topology;

namespace {

const timestamp origin = from_unix(1700006400);
const duration step{60};
constexpr std::size_t points = 120;

std::vector<float> running_between(std::size_t from, std::size_t to) {
    std::vector<float> values(points, 0.0f);
    for (std::size_t i = from; i < to && i < points; ++i) {
        values[i] = 1.0f;
    }
    return values;
}

void add_pod(memory_metrics_source& source,
             const std::string& rs,
             const std::string& pod,
             const std::string& image,
             std::vector<float> running) {
    const std::vector<float> ones(points, 1.0f);
    source.add(raw_series{"kube_pod_info",
                          label_set{{"namespace", "shop"}, {"pod", pod}, {"uid", pod},
                                    {"created_by_kind", "ReplicaSet"}, {"created_by_name", rs},
                                    {"node", "node-1"}},
                          origin, step, ones});
    source.add(raw_series{"kube_replicaset_owner",
                          label_set{{"namespace", "shop"}, {"replicaset", rs},
                                    {"owner_kind", "Deployment"}, {"owner_name", "checkout"}},
                          origin, step, ones});
    source.add(raw_series{"kube_pod_container_info",
                          label_set{{"uid", pod}, {"container", "app"}, {"image", image}},
                          origin, step, ones});
    source.add(raw_series{"kube_pod_status_phase",
                          label_set{{"uid", pod}, {"phase", "Running"}},
                          origin, step, std::move(running)});
}

std::shared_ptr<memory_metrics_source> make_cache() {
    auto source = std::make_shared<memory_metrics_source>();
    source->add(raw_series{"kube_node_info",
                           label_set{{"node", "node-1"}, {"internal_ip", "192.168.1.10"}},
                           origin, step, std::vector<float>(points, 1.0f)});

    // checkout-6d4f is replaced by checkout-7b9c between minute 40 and 43
    add_pod(*source, "checkout-6d4f", "checkout-6d4f-x1", "checkout:1.4", running_between(0, 43));
    add_pod(*source, "checkout-7b9c", "checkout-7b9c-k2", "checkout:1.5", running_between(40, points));

    const label_set app{{"namespace", "shop"}, {"kind", "Deployment"}, {"application", "checkout"}};
    source->add(raw_series{"application_requests_total", app, origin, step,
                           std::vector<float>(points, 12.0f)});
    source->add(raw_series{"application_requests_failed", app, origin, step,
                           std::vector<float>(points, 0.5f)});
    return source;
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "=== Deployment Watcher Example ===" << std::endl;

    auto logger = std::make_shared<console_logger>(log_level::info);
    auto source = make_cache();

    // =========================================================================
    // 1. Topology
    // =========================================================================
    std::cout << "1. Topology of the last hour" << std::endl;

    topology_constructor constructor(source, logger);
    auto loaded = constructor.load_world(origin, origin + hour, step);
    if (loaded.is_err()) {
        std::cerr << "   Failed to load world: " << loaded.error().message << std::endl;
        return 1;
    }
    for (const auto& a : loaded.value()->applications()) {
        std::cout << "   " << a->id().to_string() << ": " << a->instances().size() << " instances" << std::endl;
    }
    std::cout << std::endl;

    // =========================================================================
    // 2. Configuration
    // =========================================================================
    std::cout << "2. Watcher configuration" << std::endl;

    config_map settings;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto eq = arg.find('=');
        if (eq == std::string::npos) {
            std::cerr << "   Ignoring argument without '=': " << arg << std::endl;
            continue;
        }
        settings[arg.substr(0, eq)] = arg.substr(eq + 1);
    }
    auto config = watcher_config::from_config_map(settings);
    if (config.is_err()) {
        std::cerr << "   Invalid configuration: " << config.error().message;
        if (config.error().details) {
            std::cerr << " (" << *config.error().details << ")";
        }
        std::cerr << std::endl;
        return 1;
    }
    std::cout << "   snapshot window: " << config.value().snapshot_window.count() << "s" << std::endl;
    std::cout << std::endl;

    // =========================================================================
    // 3. Watch
    // =========================================================================
    std::cout << "3. Detecting rollouts" << std::endl;

    auto store = std::make_shared<memory_deployment_store>();
    project shop;
    shop.id = "shop";
    shop.name = "shop-production";
    shop.refresh_interval = step;
    store->add_project(shop);

    deployment_watcher watcher(
        store, [source](const project&) -> std::shared_ptr<metrics_source> { return source; },
        config.value(), logger);

    auto added = watcher.add_notifier(std::make_shared<log_deployment_notifier>(logger));
    if (added.is_err()) {
        std::cerr << "   " << added.error().message << std::endl;
        return 1;
    }

    webhook_config hook;
    hook.url = "https://hooks.example.com/deployments";
    auto webhook = std::make_shared<webhook_deployment_notifier>(hook);
    webhook->set_http_sender([](const std::string& url, const std::string& method,
                                const std::unordered_map<std::string, std::string>&,
                                const std::string& body, std::chrono::milliseconds) {
        std::cout << "   " << method << " " << url << " " << body << std::endl;
        return kcenon::common::ok();
    });
    added = watcher.add_notifier(webhook);
    if (added.is_err()) {
        std::cerr << "   " << added.error().message << std::endl;
        return 1;
    }

    // First pass sees the rollout, the second one the post-rollout window
    for (auto offset : {hour, 2 * hour}) {
        source->set_to(origin + offset);
        auto res = watcher.run_once();
        if (res.is_err()) {
            std::cerr << "   Pass failed: " << res.error().message << std::endl;
            return 1;
        }
    }
    std::cout << std::endl;

    // =========================================================================
    // 4. Stored deployments
    // =========================================================================
    std::cout << "4. Stored deployments" << std::endl;

    auto deployments = store->get_deployments(shop.id);
    if (deployments.is_err()) {
        std::cerr << "   " << deployments.error().message << std::endl;
        return 1;
    }
    for (const auto& d : deployments.value()) {
        std::cout << "   " << d.key() << " finished at " << to_string(d.finished_at) << std::endl;
        if (d.snapshot) {
            std::cout << "     requests: " << d.snapshot->requests << ", errors: " << d.snapshot->errors
                      << std::endl;
        }
    }

    const auto stats = watcher.stats();
    std::cout << std::endl;
    std::cout << "=== Deployment Watcher Example Completed ===" << std::endl;
    std::cout << "passes: " << stats.passes << ", deployments: " << stats.deployments_detected
              << ", notifications: " << stats.notifications_sent << std::endl;
    return 0;
}
