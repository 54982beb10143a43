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
 * @file query_catalog.h
 * @brief Closed catalog of the metric queries the constructor consumes
 */

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace kcenon::topology {

/**
 * @enum query_id
 * @brief Logical identity of one metric query
 */
enum class query_id {
    kube_node_info,
    kube_service_info,
    kube_pod_info,
    kube_pod_labels,

    kube_pod_status_phase,
    kube_pod_status_ready,
    kube_pod_status_scheduled,

    kube_pod_init_container_info,
    kube_pod_container_info,
    kube_pod_container_status_ready,
    kube_pod_container_status_waiting,
    kube_pod_container_status_running,
    kube_pod_container_status_terminated,
    kube_pod_container_status_waiting_reason,
    kube_pod_container_status_terminated_reason,
    kube_pod_container_status_last_terminated_reason,
    kube_pod_container_status_restarts_total,

    kube_replicaset_owner,
    kube_deployment_spec_replicas,
    kube_statefulset_replicas,
    kube_daemonset_status_desired_number_scheduled,

    container_cpu_usage,
    container_memory_rss,
    container_oom_kills_total,
    container_log_messages_total,
    container_net_tcp_active_connections,

    application_requests_total,
    application_requests_failed,
    application_latency_bucket,
};

/**
 * @enum query_family
 * @brief Handler group a query is routed to
 */
enum class query_family {
    node_info,
    service_info,
    pod_info,
    pod_labels,
    pod_status,
    container_status,
    replicaset_owner,
    desired_replicas,
    container_usage,
    container_counter,
    connections,
    application_sli,
};

struct query_descriptor {
    query_id id;
    std::string_view name;
    query_family family;
};

inline constexpr std::array<query_descriptor, 29> query_catalog{{
    {query_id::kube_node_info, "kube_node_info", query_family::node_info},
    {query_id::kube_service_info, "kube_service_info", query_family::service_info},
    {query_id::kube_pod_info, "kube_pod_info", query_family::pod_info},
    {query_id::kube_pod_labels, "kube_pod_labels", query_family::pod_labels},

    {query_id::kube_pod_status_phase, "kube_pod_status_phase", query_family::pod_status},
    {query_id::kube_pod_status_ready, "kube_pod_status_ready", query_family::pod_status},
    {query_id::kube_pod_status_scheduled, "kube_pod_status_scheduled", query_family::pod_status},

    {query_id::kube_pod_init_container_info, "kube_pod_init_container_info", query_family::container_status},
    {query_id::kube_pod_container_info, "kube_pod_container_info", query_family::container_status},
    {query_id::kube_pod_container_status_ready, "kube_pod_container_status_ready", query_family::container_status},
    {query_id::kube_pod_container_status_waiting, "kube_pod_container_status_waiting", query_family::container_status},
    {query_id::kube_pod_container_status_running, "kube_pod_container_status_running", query_family::container_status},
    {query_id::kube_pod_container_status_terminated, "kube_pod_container_status_terminated", query_family::container_status},
    {query_id::kube_pod_container_status_waiting_reason, "kube_pod_container_status_waiting_reason", query_family::container_status},
    {query_id::kube_pod_container_status_terminated_reason, "kube_pod_container_status_terminated_reason", query_family::container_status},
    {query_id::kube_pod_container_status_last_terminated_reason, "kube_pod_container_status_last_terminated_reason", query_family::container_status},
    {query_id::kube_pod_container_status_restarts_total, "kube_pod_container_status_restarts_total", query_family::container_counter},

    {query_id::kube_replicaset_owner, "kube_replicaset_owner", query_family::replicaset_owner},
    {query_id::kube_deployment_spec_replicas, "kube_deployment_spec_replicas", query_family::desired_replicas},
    {query_id::kube_statefulset_replicas, "kube_statefulset_replicas", query_family::desired_replicas},
    {query_id::kube_daemonset_status_desired_number_scheduled, "kube_daemonset_status_desired_number_scheduled", query_family::desired_replicas},

    {query_id::container_cpu_usage, "container_cpu_usage", query_family::container_usage},
    {query_id::container_memory_rss, "container_memory_rss", query_family::container_usage},
    {query_id::container_oom_kills_total, "container_oom_kills_total", query_family::container_counter},
    {query_id::container_log_messages_total, "container_log_messages_total", query_family::container_counter},
    {query_id::container_net_tcp_active_connections, "container_net_tcp_active_connections", query_family::connections},

    {query_id::application_requests_total, "application_requests_total", query_family::application_sli},
    {query_id::application_requests_failed, "application_requests_failed", query_family::application_sli},
    {query_id::application_latency_bucket, "application_latency_bucket", query_family::application_sli},
}};

constexpr const query_descriptor& describe(query_id id) {
    return query_catalog[static_cast<std::size_t>(id)];
}

constexpr std::string_view query_name(query_id id) {
    return describe(id).name;
}

/**
 * @brief Resolve a query name, std::nullopt for names outside the catalog
 */
std::optional<query_id> find_query(std::string_view name);

} // namespace kcenon::topology
