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
 * @file application_id.h
 * @brief Workload identity: (namespace, kind, name)
 */

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::topology {

/**
 * @enum application_kind
 * @brief Closed set of workload kinds an application can have
 */
enum class application_kind {
    deployment,
    stateful_set,
    daemon_set,
    replica_set,
    static_pods,
    job,
    cron_job,
};

inline std::string_view to_string(application_kind kind) {
    switch (kind) {
        case application_kind::deployment: return "Deployment";
        case application_kind::stateful_set: return "StatefulSet";
        case application_kind::daemon_set: return "DaemonSet";
        case application_kind::replica_set: return "ReplicaSet";
        case application_kind::static_pods: return "StaticPods";
        case application_kind::job: return "Job";
        case application_kind::cron_job: return "CronJob";
    }
    return "Unknown";
}

/**
 * @brief Parse a Kubernetes owner kind, std::nullopt if not in the closed set
 */
inline std::optional<application_kind> parse_application_kind(std::string_view kind) {
    if (kind == "Deployment") return application_kind::deployment;
    if (kind == "StatefulSet") return application_kind::stateful_set;
    if (kind == "DaemonSet") return application_kind::daemon_set;
    if (kind == "ReplicaSet") return application_kind::replica_set;
    if (kind == "StaticPods") return application_kind::static_pods;
    if (kind == "Job") return application_kind::job;
    if (kind == "CronJob") return application_kind::cron_job;
    return std::nullopt;
}

/**
 * @struct application_id
 * @brief Value identity of a workload; equality compares all three fields
 */
struct application_id {
    std::string ns;
    application_kind kind = application_kind::deployment;
    std::string name;

    bool operator==(const application_id& other) const {
        return kind == other.kind && ns == other.ns && name == other.name;
    }

    bool operator!=(const application_id& other) const { return !(*this == other); }

    std::string to_string() const {
        return ns + ":" + std::string(topology::to_string(kind)) + ":" + name;
    }
};

} // namespace kcenon::topology

template <>
struct std::hash<kcenon::topology::application_id> {
    std::size_t operator()(const kcenon::topology::application_id& id) const noexcept {
        return std::hash<std::string>{}(id.to_string());
    }
};
