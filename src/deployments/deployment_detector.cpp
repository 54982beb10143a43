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

#include "kcenon/topology/deployments/deployment_detector.h"
#include "kcenon/topology/timeseries/aggregate.h"

#include <optional>
#include <set>

namespace kcenon::topology {

namespace {

struct active_step {
    timestamp time;
    std::vector<std::string> names;
};

std::vector<active_step> active_names_over_time(const std::map<std::string, time_series>& life_spans) {
    std::vector<active_step> steps;
    if (life_spans.empty()) {
        return steps;
    }

    std::vector<std::pair<const std::string*, series_iterator>> iters;
    iters.reserve(life_spans.size());
    for (const auto& [name, ts] : life_spans) {
        iters.emplace_back(&name, ts.iter());
    }

    for (;;) {
        active_step step;
        for (auto& [name, it] : iters) {
            if (!it.next()) {
                return steps;
            }
            step.time = it.time();
            if (it.value() > 0) {
                step.names.push_back(*name);
            }
        }
        if (!step.names.empty()) {
            steps.push_back(std::move(step));
        }
    }
}

} // namespace

rollout_walk detect_rollouts(const application_id& app,
                             const std::map<std::string, time_series>& life_spans) {
    rollout_walk walk;
    std::optional<std::size_t> in_progress;
    std::string& prev = walk.last_active;

    for (const auto& step : active_names_over_time(life_spans)) {
        if (step.names.size() == 1) {
            const std::string& curr = step.names.front();
            if (prev.empty()) {
                prev = curr;
                continue;
            }
            if (in_progress) {
                auto& d = walk.deployments[*in_progress];
                if (curr == d.name) {
                    d.finished_at = step.time;
                }
                in_progress.reset();
            }
            if (curr == prev) {
                continue;
            }
            application_deployment d;
            d.application = app;
            d.name = curr;
            d.started_at = step.time;
            d.finished_at = step.time;
            walk.deployments.push_back(std::move(d));
            prev = curr;
            continue;
        }

        if (prev.empty() || in_progress) {
            continue;
        }
        std::string next;
        for (const auto& name : step.names) {
            if (name != prev) {
                next = name;
                break;
            }
        }
        application_deployment d;
        d.application = app;
        d.name = next;
        d.started_at = step.time;
        walk.deployments.push_back(std::move(d));
        in_progress = walk.deployments.size() - 1;
        prev = next;
    }
    return walk;
}

std::vector<application_deployment> calc_deployments(const application& app) {
    if (app.id().kind != application_kind::deployment || app.instances().empty()) {
        return {};
    }

    std::map<std::string, aggregate> life_spans;
    std::map<std::string, std::set<std::string>> images;
    for (const auto& inst : app.instances()) {
        if (!inst->pod || inst->pod->replica_set.empty()) {
            continue;
        }
        const auto& rs = inst->pod->replica_set;
        life_spans[rs].add(inst->pod->life_span);
        auto& rs_images = images[rs];
        for (const auto& [name, c] : inst->containers()) {
            if (!c.image.empty()) {
                rs_images.insert(c.image);
            }
        }
    }

    std::map<std::string, time_series> series;
    for (const auto& [rs, agg] : life_spans) {
        if (!agg.empty()) {
            series.emplace(rs, agg.get());
        }
    }
    if (series.empty()) {
        return {};
    }

    auto walk = detect_rollouts(app.id(), series);
    for (auto& d : walk.deployments) {
        auto it = images.find(d.name);
        if (it != images.end() && !it->second.empty()) {
            d.details = deployment_details{{it->second.begin(), it->second.end()}};
        }
    }
    return std::move(walk.deployments);
}

application_deployment calc_initial_deployment(const application& app, timestamp now) {
    std::string name;
    std::set<std::string> images;
    for (const auto& inst : app.instances()) {
        if (inst->pod && !inst->pod->replica_set.empty()) {
            name = inst->pod->replica_set;
        }
        for (const auto& [container_name, c] : inst->containers()) {
            if (!c.image.empty()) {
                images.insert(c.image);
            }
        }
    }

    application_deployment d;
    d.application = app.id();
    d.name = name;
    d.started_at = now;
    d.finished_at = now;
    if (!images.empty()) {
        d.details = deployment_details{{images.begin(), images.end()}};
    }
    d.notifications = deployment_notifications{deployment_state::summary, {}};
    return d;
}

std::vector<deployment_change> plan_deployment_changes(const std::vector<application_deployment>& known,
                                                       const std::vector<application_deployment>& detected) {
    std::vector<deployment_change> changes;
    for (const auto& d : detected) {
        const application_deployment* match = nullptr;
        for (const auto& k : known) {
            if (k.name == d.name && k.started_at == d.started_at) {
                match = &k;
                break;
            }
        }
        if (!match) {
            changes.push_back(deployment_change{d, true});
        } else if (match->finished_at != d.finished_at) {
            application_deployment updated = *match;
            updated.finished_at = d.finished_at;
            if (d.details) {
                updated.details = d.details;
            }
            changes.push_back(deployment_change{std::move(updated), false});
        }
    }
    return changes;
}

} // namespace kcenon::topology
