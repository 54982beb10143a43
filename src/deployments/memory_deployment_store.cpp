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

#include "kcenon/topology/deployments/deployment_store.h"

#include <algorithm>

namespace kcenon::topology {

void memory_deployment_store::add_project(project p) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& existing : projects_) {
        if (existing.id == p.id) {
            existing = std::move(p);
            return;
        }
    }
    projects_.push_back(std::move(p));
}

result<std::vector<project>> memory_deployment_store::get_projects() {
    std::lock_guard<std::mutex> lock(mutex_);
    return make_success(projects_);
}

result<std::vector<application_deployment>> memory_deployment_store::get_deployments(const std::string& project_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<application_deployment> out;
    auto it = deployments_.find(project_id);
    if (it != deployments_.end()) {
        out.reserve(it->second.size());
        for (const auto& [key, d] : it->second) {
            out.push_back(d);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return a.started_at < b.started_at;
    });
    return make_success(std::move(out));
}

result_void memory_deployment_store::save_deployment(const std::string& project_id, const application_deployment& d) {
    if (project_id.empty()) {
        return make_void_error(topology_error_code::invalid_argument, "Empty project id");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto* existing = find_locked(project_id, d);
    if (!existing) {
        deployments_[project_id].emplace(d.key(), d);
        return make_void_success();
    }
    existing->finished_at = d.finished_at;
    if (d.details) {
        existing->details = d.details;
    }
    if (d.snapshot) {
        existing->snapshot = d.snapshot;
    }
    if (d.notifications) {
        existing->notifications = d.notifications;
    }
    return make_void_success();
}

result_void memory_deployment_store::save_metrics_snapshot(const std::string& project_id,
                                                           const application_deployment& d) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* existing = find_locked(project_id, d);
    if (!existing) {
        return make_void_error(topology_error_code::deployment_not_found, d.key());
    }
    existing->snapshot = d.snapshot;
    return make_void_success();
}

result_void memory_deployment_store::save_notifications(const std::string& project_id,
                                                        const application_deployment& d) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* existing = find_locked(project_id, d);
    if (!existing) {
        return make_void_error(topology_error_code::deployment_not_found, d.key());
    }
    existing->notifications = d.notifications;
    return make_void_success();
}

application_deployment* memory_deployment_store::find_locked(const std::string& project_id,
                                                             const application_deployment& d) {
    auto it = deployments_.find(project_id);
    if (it == deployments_.end()) {
        return nullptr;
    }
    auto record = it->second.find(d.key());
    return record == it->second.end() ? nullptr : &record->second;
}

} // namespace kcenon::topology
