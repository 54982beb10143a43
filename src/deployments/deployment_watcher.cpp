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

#include "kcenon/topology/deployments/deployment_watcher.h"
#include "kcenon/topology/constructor/topology_constructor.h"
#include "kcenon/topology/deployments/deployment_detector.h"
#include "kcenon/topology/deployments/deployment_status.h"
#include "kcenon/topology/deployments/metrics_snapshot.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace kcenon::topology {

namespace {

bool contains(const std::vector<application_id>& ids, const application_id& id) {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

void sort_by_start(std::vector<application_deployment>& deployments) {
    std::stable_sort(deployments.begin(), deployments.end(), [](const auto& a, const auto& b) {
        return a.started_at < b.started_at;
    });
}

} // namespace

deployment_watcher::deployment_watcher(std::shared_ptr<deployment_store> store,
                                       metrics_source_factory sources,
                                       const watcher_config& config,
                                       logger_ptr logger)
    : store_(std::move(store))
    , sources_(std::move(sources))
    , config_(config)
    , logger_(std::move(logger)) {
    if (!store_) {
        throw std::invalid_argument("Deployment store must not be null");
    }
    auto validation = config_.validate();
    if (validation.is_err()) {
        throw std::invalid_argument("Invalid deployment watcher configuration: " +
                                    validation.error().message);
    }
}

deployment_watcher::~deployment_watcher() {
    if (running_.load()) {
        stop();
    }
}

result_void deployment_watcher::add_notifier(std::shared_ptr<deployment_notifier> notifier) {
    if (!notifier) {
        return make_void_error(topology_error_code::invalid_argument, "Notifier cannot be null");
    }
    std::lock_guard<std::mutex> lock(notifiers_mutex_);
    for (const auto& existing : notifiers_) {
        if (existing->name() == notifier->name()) {
            return make_void_error(topology_error_code::already_exists,
                                   "Notifier already registered: " + notifier->name());
        }
    }
    notifiers_.push_back(std::move(notifier));
    return make_void_success();
}

result_void deployment_watcher::start() {
    if (running_.load()) {
        return make_void_error(topology_error_code::already_started, "Deployment watcher is already running");
    }
    running_.store(true);
    watch_thread_ = std::thread(&deployment_watcher::watch_loop, this);
    return make_void_success();
}

result_void deployment_watcher::stop() {
    if (!running_.load()) {
        return make_void_success();
    }

    running_.store(false);

    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }

    if (watch_thread_.joinable()) {
        watch_thread_.join();
    }

    return make_void_success();
}

bool deployment_watcher::is_running() const {
    return running_.load();
}

watcher_stats deployment_watcher::stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
}

void deployment_watcher::watch_loop() {
    while (running_.load()) {
        auto res = run_once();
        if (res.is_err()) {
            log_error(logger_, "deployment pass failed: " + res.error().message);
        }

        std::unique_lock<std::mutex> lock(cv_mutex_);
        cv_.wait_for(lock, config_.interval, [this] { return !running_.load(); });
    }
}

result_void deployment_watcher::run_once() {
    std::lock_guard<std::mutex> pass_lock(pass_mutex_);

    auto projects = store_->get_projects();
    if (projects.is_err()) {
        log_error(logger_, "failed to get projects: " + projects.error().message);
        return make_void_error(topology_error_code::storage_read_failed, projects.error().message);
    }

    for (const auto& p : projects.value()) {
        auto res = process_project(p);
        if (res.is_err()) {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.projects_failed;
        }
    }

    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.passes;
    return make_void_success();
}

result_void deployment_watcher::process_project(const project& p) {
    const auto started = std::chrono::steady_clock::now();

    auto cache = open_cache(p);
    if (cache.is_err()) {
        log_error(logger_, p.id + ": " + cache.error().message);
        return make_void_error(error_code_of(cache.error()), cache.error().message);
    }

    std::vector<application_id> aborted;
    auto w = discover_and_save(p, cache.value(), aborted);
    if (w.is_err()) {
        return make_void_error(error_code_of(w.error()), w.error().message);
    }

    snapshot_metrics(p, *w.value(), cache.value(), aborted);
    send_notifications(p, *w.value(), cache.value().to, aborted);

    std::size_t apps = 0;
    for (const auto& app : w.value()->applications()) {
        if (app->id().kind == application_kind::deployment) {
            ++apps;
        }
    }
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    log_info(logger_, p.id + ": checked " + std::to_string(apps) + " apps in " +
                          std::to_string(elapsed.count()) + "ms");
    return make_void_success();
}

result<deployment_watcher::cache_head> deployment_watcher::open_cache(const project& p) const {
    auto source = sources_ ? sources_(p) : nullptr;
    if (!source) {
        return make_error<cache_head>(topology_error_code::cache_unavailable,
                                      "no metrics cache for project " + p.id);
    }
    auto to = source->get_to();
    if (to.is_err()) {
        return make_error<cache_head>(topology_error_code::cache_unavailable, to.error().message);
    }
    if (is_zero(to.value())) {
        return make_error<cache_head>(topology_error_code::cache_empty, "cache is empty");
    }
    return make_success(cache_head{source, to.value()});
}

result<std::shared_ptr<world>> deployment_watcher::discover_and_save(const project& p,
                                                                     const cache_head& cache,
                                                                     std::vector<application_id>& aborted) {
    topology_constructor constructor(cache.source, logger_);
    auto loaded = constructor.load_world(cache.to - config_.lookback, cache.to, p.refresh_interval);
    if (loaded.is_err()) {
        log_error(logger_, p.id + ": failed to load world: " + loaded.error().message);
        return loaded;
    }
    auto w = loaded.value();

    auto recorded = store_->get_deployments(p.id);
    if (recorded.is_err()) {
        log_error(logger_, p.id + ": failed to get deployments: " + recorded.error().message);
        return make_error<std::shared_ptr<world>>(topology_error_code::storage_read_failed,
                                                  recorded.error().message);
    }
    for (const auto& d : recorded.value()) {
        if (auto* app = w->get_application(d.application)) {
            app->deployments.push_back(d);
        }
    }

    for (const auto& app_ptr : w->applications()) {
        auto& app = *app_ptr;
        if (app.id().kind != application_kind::deployment) {
            continue;
        }
        sort_by_start(app.deployments);

        auto detected = calc_deployments(app);
        if (app.deployments.empty() && detected.empty()) {
            auto initial = calc_initial_deployment(app, cache.to);
            auto saved = store_->save_deployment(p.id, initial);
            if (saved.is_err()) {
                log_error(logger_, p.id + ": failed to save deployment: " + saved.error().message);
                aborted.push_back(app.id());
                continue;
            }
            app.deployments.push_back(std::move(initial));
            continue;
        }

        for (auto& change : plan_deployment_changes(app.deployments, detected)) {
            auto saved = store_->save_deployment(p.id, change.deployment);
            if (saved.is_err()) {
                log_error(logger_, p.id + ": failed to save deployment: " + saved.error().message);
                aborted.push_back(app.id());
                break;
            }
            if (change.is_new) {
                log_info(logger_, p.id + ": new deployment detected for " + app.id().to_string() + ": " +
                                      change.deployment.name);
                app.deployments.push_back(std::move(change.deployment));
                std::lock_guard<std::mutex> lock(stats_mutex_);
                ++stats_.deployments_detected;
                continue;
            }
            for (auto& d : app.deployments) {
                if (d.same_rollout(change.deployment)) {
                    d = std::move(change.deployment);
                    break;
                }
            }
        }
        sort_by_start(app.deployments);
    }
    return make_success(w);
}

void deployment_watcher::snapshot_metrics(const project& p,
                                          world& w,
                                          const cache_head& cache,
                                          const std::vector<application_id>& aborted) {
    const duration step = p.refresh_interval;
    for (const auto& app_ptr : w.applications()) {
        auto& app = *app_ptr;
        if (contains(aborted, app.id())) {
            continue;
        }
        for (std::size_t i = 0; i < app.deployments.size(); ++i) {
            auto window = due_snapshot_window(app, i, cache.to, config_.snapshot_shift,
                                              config_.snapshot_window, step);
            if (!window) {
                continue;
            }
            auto& d = app.deployments[i];

            topology_constructor constructor(cache.source, logger_);
            auto snapshot_world = constructor.load_world(window->from, window->to, step);
            if (snapshot_world.is_err()) {
                log_error(logger_, p.id + ": failed to load world: " + snapshot_world.error().message);
                continue;
            }
            const auto* a = snapshot_world.value()->get_application(d.application);
            if (!a) {
                log_warning(logger_, p.id + ": unknown application: " + d.application.to_string());
                continue;
            }

            d.snapshot = calc_metrics_snapshot(*a, window->from, window->to, step);
            auto saved = store_->save_metrics_snapshot(p.id, d);
            if (saved.is_err()) {
                log_error(logger_, p.id + ": failed to save metrics snapshot: " + saved.error().message);
                d.snapshot.reset();
                continue;
            }
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.snapshots_saved;
        }
    }
}

void deployment_watcher::send_notifications(const project& p,
                                            world& w,
                                            timestamp now,
                                            const std::vector<application_id>& aborted) {
    if (!p.notify_of_deployments) {
        return;
    }

    std::vector<std::shared_ptr<deployment_notifier>> notifiers;
    {
        std::lock_guard<std::mutex> lock(notifiers_mutex_);
        for (const auto& n : notifiers_) {
            if (n->is_ready() && (p.channels.empty() || p.channel_enabled(n->name()))) {
                notifiers.push_back(n);
            }
        }
    }
    if (notifiers.empty()) {
        return;
    }

    for (const auto& app_ptr : w.applications()) {
        auto& app = *app_ptr;
        if (contains(aborted, app.id())) {
            continue;
        }
        for (const auto& status : calc_deployment_statuses(app, now, config_.stuck_timeout)) {
            auto& d = app.deployments[status.index];
            if (now - d.started_at > config_.notification_freshness) {
                continue;
            }
            if (!d.notifications) {
                d.notifications = deployment_notifications{};
            }
            if (d.notifications->state >= status.state) {
                continue;
            }

            bool need_save = false;
            for (const auto& notifier : notifiers) {
                const auto channel = notifier->name();
                auto it = d.notifications->channels.find(channel);
                const auto sent = it == d.notifications->channels.end() ? deployment_state::unknown : it->second;
                if (sent >= status.state) {
                    continue;
                }
                auto res = notifier->notify(p, status, config_.send_timeout);
                if (res.is_err()) {
                    log_error(logger_, p.id + ": " + channel + " notification failed: " + res.error().message);
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    ++stats_.notifications_failed;
                    continue;
                }
                d.notifications->channels[channel] = status.state;
                need_save = true;
                {
                    std::lock_guard<std::mutex> lock(stats_mutex_);
                    ++stats_.notifications_sent;
                }
            }
            if (!need_save) {
                continue;
            }
            auto saved = store_->save_notifications(p.id, d);
            if (saved.is_err()) {
                log_error(logger_, p.id + ": failed to save notifications: " + saved.error().message);
            }
        }
    }
}

} // namespace kcenon::topology
