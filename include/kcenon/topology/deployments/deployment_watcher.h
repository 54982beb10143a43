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

/**
 * @file deployment_watcher.h
 * @brief Periodic discovery, summary and notification of rollouts
 *
 * Every pass walks the projects of the store one by one. For each project
 * the watcher:
 * - builds the world of the last lookback window ending at the cache head
 *   and saves new or changed deployments of Deployment applications;
 * - attaches a metrics snapshot to finished deployments whose snapshot
 *   window has fully elapsed;
 * - notifies the enabled channels of state changes of deployments that
 *   started within the freshness window.
 *
 * Failures of one project never affect the other projects.
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "deployment_notifiers.h"
#include "deployment_store.h"
#include "../config/project.h"
#include "../config/watcher_config.h"
#include "../constructor/metrics_source.h"
#include "../core/logging.h"
#include "../core/result_types.h"
#include "../model/world.h"

namespace kcenon::topology {

/**
 * @brief Resolves the metrics cache of a project, nullptr when it has none
 */
using metrics_source_factory = std::function<std::shared_ptr<metrics_source>(const project&)>;

/**
 * @struct watcher_stats
 * @brief Counters of watcher activity
 */
struct watcher_stats {
    std::uint64_t passes = 0;
    std::uint64_t projects_failed = 0;
    std::uint64_t deployments_detected = 0;
    std::uint64_t snapshots_saved = 0;
    std::uint64_t notifications_sent = 0;
    std::uint64_t notifications_failed = 0;
};

class deployment_watcher {
public:
    /**
     * @throws std::invalid_argument if config does not validate or store is null
     */
    deployment_watcher(std::shared_ptr<deployment_store> store,
                       metrics_source_factory sources,
                       const watcher_config& config = {},
                       logger_ptr logger = nullptr);

    ~deployment_watcher();

    deployment_watcher(const deployment_watcher&) = delete;
    deployment_watcher& operator=(const deployment_watcher&) = delete;

    /**
     * @brief Register a notification channel
     *
     * A project receives notifications from a channel only if the channel
     * is listed in its settings, or if it lists no channels at all.
     */
    result_void add_notifier(std::shared_ptr<deployment_notifier> notifier);

    /**
     * @brief Run passes in the background every config().interval
     */
    result_void start();

    result_void stop();

    bool is_running() const;

    /**
     * @brief Run one pass over all projects
     *
     * Fails only when the project list cannot be read.
     */
    result_void run_once();

    /**
     * @brief Run one pass over a single project
     */
    result_void process_project(const project& p);

    watcher_stats stats() const;

    const watcher_config& config() const { return config_; }

private:
    struct cache_head {
        std::shared_ptr<metrics_source> source;
        timestamp to{};
    };

    result<cache_head> open_cache(const project& p) const;

    /**
     * @return the world with recorded and newly detected deployments
     *         attached to its applications
     */
    result<std::shared_ptr<world>> discover_and_save(const project& p,
                                                     const cache_head& cache,
                                                     std::vector<application_id>& aborted);

    void snapshot_metrics(const project& p,
                          world& w,
                          const cache_head& cache,
                          const std::vector<application_id>& aborted);

    void send_notifications(const project& p,
                            world& w,
                            timestamp now,
                            const std::vector<application_id>& aborted);

    void watch_loop();

    std::shared_ptr<deployment_store> store_;
    metrics_source_factory sources_;
    watcher_config config_;
    logger_ptr logger_;

    mutable std::mutex notifiers_mutex_;
    std::vector<std::shared_ptr<deployment_notifier>> notifiers_;

    mutable std::mutex stats_mutex_;
    watcher_stats stats_;

    // Serializes passes started by run_once() and the background loop
    std::mutex pass_mutex_;

    std::atomic<bool> running_{false};
    std::thread watch_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
};

} // namespace kcenon::topology
