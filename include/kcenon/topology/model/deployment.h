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
 * @file deployment.h
 * @brief Persisted rollout records and their attachments
 */

#include "application_id.h"
#include "../timeseries/time.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::topology {

/**
 * @enum deployment_state
 * @brief Lifecycle state of a rollout, ordered by progress
 *
 * Notification bookkeeping relies on the ordering: a channel is notified
 * again only when the state advances past the one already sent.
 */
enum class deployment_state {
    unknown = 0,
    in_progress,
    stuck,
    cancelled,
    deployed,
    summary,
};

inline const char* to_string(deployment_state state) {
    switch (state) {
        case deployment_state::in_progress: return "in_progress";
        case deployment_state::stuck: return "stuck";
        case deployment_state::cancelled: return "cancelled";
        case deployment_state::deployed: return "deployed";
        case deployment_state::summary: return "summary";
        default: return "unknown";
    }
}

struct deployment_details {
    std::vector<std::string> container_images;
};

/**
 * @struct metrics_snapshot
 * @brief Fixed-size summary of an application over a post-rollout window
 */
struct metrics_snapshot {
    timestamp at{};
    duration window{};

    std::int64_t requests = 0;
    std::int64_t errors = 0;
    // Bucket upper bound formatted with three decimals -> request count
    std::map<std::string, std::int64_t> latency;

    float cpu_usage = 0;
    std::int64_t memory_leak = 0;
    std::int64_t oom_kills = 0;
    std::int64_t restarts = 0;
    std::int64_t log_errors = 0;
    std::int64_t log_warnings = 0;

    bool operator==(const metrics_snapshot& other) const = default;
};

struct deployment_notifications {
    deployment_state state = deployment_state::unknown;
    std::map<std::string, deployment_state> channels;

    bool operator==(const deployment_notifications& other) const = default;
};

/**
 * @struct application_deployment
 * @brief One rollout of an application
 *
 * Identified within its application by (name, started_at). finished_at is
 * zero while the rollout is still in progress.
 */
struct application_deployment {
    application_id application;
    std::string name;
    timestamp started_at{};
    timestamp finished_at{};

    std::optional<deployment_details> details;
    std::optional<metrics_snapshot> snapshot;
    std::optional<deployment_notifications> notifications;

    bool finished() const noexcept { return !is_zero(finished_at); }

    bool same_rollout(const application_deployment& other) const {
        return application == other.application && name == other.name &&
               started_at == other.started_at;
    }

    std::string key() const {
        return application.to_string() + "@" + name + "@" + topology::to_string(started_at);
    }
};

} // namespace kcenon::topology
