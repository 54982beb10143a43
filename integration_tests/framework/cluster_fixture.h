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

#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <kcenon/topology/adapters/memory_metrics_source.h>
#include <kcenon/topology/deployments/deployment_store.h>
#include <kcenon/topology/deployments/deployment_watcher.h>
#include <kcenon/topology/timeseries/time.h>

namespace integration_tests {

using namespace kcenon::topology;

/**
 * @class ClusterFixture
 * @brief Base fixture simulating the metrics of a small cluster
 *
 * Series start at origin() and carry points() samples of step(). Pods are
 * described by the per-step value of their Running phase; everything a
 * real exporter would emit alongside (pod info, ownership, container
 * image) is derived from it.
 */
class ClusterFixture : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = std::make_shared<memory_metrics_source>();
        store_ = std::make_shared<memory_deployment_store>();

        project_.id = "integration";
        project_.name = "integration";
        project_.refresh_interval = step();
        store_->add_project(project_);

        source_->set_to(origin() + static_cast<long>(points()) * step());
    }

    static timestamp origin() { return from_unix(1700006400); }
    static duration step() { return duration{60}; }
    static std::size_t points() { return 120; }

    /**
     * @brief Series equal to before for the first n points, after for the rest
     */
    static std::vector<float> step_series(std::size_t n, float before, float after) {
        std::vector<float> values(points(), after);
        for (std::size_t i = 0; i < n && i < values.size(); ++i) {
            values[i] = before;
        }
        return values;
    }

    static std::vector<float> constant(float v) { return std::vector<float>(points(), v); }

    void Emit(const std::string& query, label_set labels, std::vector<float> values) {
        source_->add(raw_series{query, std::move(labels), origin(), step(), std::move(values)});
    }

    void AddNode(const std::string& name, const std::string& ip) {
        Emit("kube_node_info", label_set{{"node", name}, {"internal_ip", ip}}, constant(1));
    }

    void AddService(const std::string& ns, const std::string& name, const std::string& cluster_ip) {
        Emit("kube_service_info", label_set{{"namespace", ns}, {"service", name}, {"cluster_ip", cluster_ip}},
             constant(1));
    }

    /**
     * @brief Pod of a Deployment, owned through the given ReplicaSet
     */
    void AddDeploymentPod(const std::string& ns,
                          const std::string& deployment,
                          const std::string& replica_set,
                          const std::string& pod,
                          const std::string& image,
                          std::vector<float> running) {
        AddPod(ns, pod, "ReplicaSet", replica_set, image, std::move(running));
        Emit("kube_replicaset_owner",
             label_set{{"namespace", ns}, {"replicaset", replica_set}, {"owner_kind", "Deployment"},
                       {"owner_name", deployment}},
             constant(1));
    }

    void AddPod(const std::string& ns,
                const std::string& pod,
                const std::string& owner_kind,
                const std::string& owner_name,
                const std::string& image,
                std::vector<float> running,
                const std::string& pod_ip = "") {
        const std::string uid = ns + "-" + pod;
        Emit("kube_pod_info",
             label_set{{"namespace", ns}, {"pod", pod}, {"uid", uid}, {"created_by_kind", owner_kind},
                       {"created_by_name", owner_name}, {"node", "node-1"}, {"pod_ip", pod_ip},
                       {"host_ip", "192.168.1.10"}},
             constant(1));
        Emit("kube_pod_container_info", label_set{{"uid", uid}, {"container", "app"}, {"image", image}},
             constant(1));
        Emit("kube_pod_status_phase", label_set{{"uid", uid}, {"phase", "Running"}}, std::move(running));
    }

    std::unique_ptr<deployment_watcher> CreateWatcher(const watcher_config& config = {}) {
        auto source = source_;
        return std::make_unique<deployment_watcher>(
            store_, [source](const project&) -> std::shared_ptr<metrics_source> { return source; }, config);
    }

    /**
     * @brief Poll pred until it holds or timeout expires
     */
    template <typename Predicate>
    bool WaitForCondition(Predicate pred,
                         std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        auto start = std::chrono::steady_clock::now();
        while (!pred()) {
            if (std::chrono::steady_clock::now() - start > timeout) {
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return true;
    }

    std::vector<application_deployment> StoredDeployments() {
        auto res = store_->get_deployments(project_.id);
        return res.is_ok() ? res.value() : std::vector<application_deployment>{};
    }

    std::shared_ptr<memory_metrics_source> source_;
    std::shared_ptr<memory_deployment_store> store_;
    project project_;
};

} // namespace integration_tests
