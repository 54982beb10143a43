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

#include "kcenon/topology/constructor/topology_constructor.h"
#include "kcenon/topology/ingest/metric_ingestor.h"
#include "kcenon/topology/timeseries/series_ops.h"

#include <arpa/inet.h>

#include <array>
#include <cmath>
#include <cstdlib>

namespace kcenon::topology {

namespace {

constexpr std::array<query_family, 12> build_order{
    query_family::node_info,
    query_family::service_info,
    query_family::pod_info,
    query_family::pod_labels,
    query_family::pod_status,
    query_family::container_status,
    query_family::replicaset_owner,
    query_family::desired_replicas,
    query_family::container_usage,
    query_family::container_counter,
    query_family::connections,
    query_family::application_sli,
};

bool is_valid_ip(const std::string& ip) {
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, ip.c_str(), buf) == 1 || inet_pton(AF_INET6, ip.c_str(), buf) == 1;
}

bool is_static_pod_owner(const std::string& owner_kind) {
    return owner_kind.empty() || owner_kind == "<none>" || owner_kind == "Node";
}

std::string static_pod_app_name(const std::string& pod, const std::string& node_name) {
    const std::string suffix = "-" + node_name;
    if (!node_name.empty() && pod.size() > suffix.size() &&
        pod.compare(pod.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return pod.substr(0, pod.size() - suffix.size());
    }
    return pod;
}

std::string pod_key(const std::string& ns, const std::string& pod) {
    return ns + "/" + pod;
}

std::string describe_pod(const label_set& labels) {
    return labels.uid() + " " + labels.pod() + " " + labels.namespace_name();
}

} // namespace

struct topology_constructor::build_context {
    explicit build_context(world& w) : w(w) {}

    world& w;
    std::unordered_map<std::string, instance*> pods_by_uid;
    std::unordered_map<std::string, instance*> pods_by_name;

    instance* pod_by_uid(const label_set& labels) const {
        auto it = pods_by_uid.find(labels.uid());
        return it == pods_by_uid.end() ? nullptr : it->second;
    }

    instance* pod_by_name(const label_set& labels) const {
        auto it = pods_by_name.find(pod_key(labels.namespace_name(), labels.pod()));
        return it == pods_by_name.end() ? nullptr : it->second;
    }
};

topology_constructor::topology_constructor(std::shared_ptr<metrics_source> source, logger_ptr logger)
    : source_(std::move(source)), logger_(std::move(logger)) {}

const std::unordered_map<query_family, topology_constructor::handler>& topology_constructor::handlers() {
    static const std::unordered_map<query_family, handler> table{
        {query_family::node_info, &topology_constructor::load_nodes},
        {query_family::service_info, &topology_constructor::load_services},
        {query_family::pod_info, &topology_constructor::load_pods},
        {query_family::pod_labels, &topology_constructor::load_pod_labels},
        {query_family::pod_status, &topology_constructor::load_pod_status},
        {query_family::container_status, &topology_constructor::load_container_status},
        {query_family::replicaset_owner, &topology_constructor::load_replicaset_owners},
        {query_family::desired_replicas, &topology_constructor::load_desired_replicas},
        {query_family::container_usage, &topology_constructor::load_container_usage},
        {query_family::container_counter, &topology_constructor::load_container_counters},
        {query_family::connections, &topology_constructor::load_connections},
        {query_family::application_sli, &topology_constructor::load_application_slis},
    };
    return table;
}

result<std::shared_ptr<world>> topology_constructor::load_world(timestamp from,
                                                                 timestamp to,
                                                                 duration step,
                                                                 const label_filters& filters) {
    if (!source_) {
        return make_error<std::shared_ptr<world>>(topology_error_code::cache_unavailable,
                                                  "No metrics source configured");
    }

    metric_ingestor ingestor(from, to, step);
    for (const auto& descriptor : query_catalog) {
        const std::string name(descriptor.name);
        auto res = source_->query(name, from, to, step, filters);
        if (res.is_err()) {
            log_error(logger_, "query " + name + " failed: " + res.error().message);
            return make_error_with_context<std::shared_ptr<world>>(
                topology_error_code::query_failed, res.error().message, name);
        }
        ingestor.add_all(res.value());
    }
    return make_success(build_world(from, to, step, ingestor.metrics()));
}

std::shared_ptr<world> topology_constructor::build_world(timestamp from,
                                                         timestamp to,
                                                         duration step,
                                                         const metric_set& metrics) const {
    auto w = std::make_shared<world>(from, to, step);
    build_context ctx(*w);

    for (auto family : build_order) {
        const handler h = handlers().at(family);
        for (const auto& descriptor : query_catalog) {
            if (descriptor.family != family) {
                continue;
            }
            const auto& values = metrics.get(descriptor.id);
            if (!values.empty()) {
                (this->*h)(ctx, descriptor.id, values);
            }
        }
    }

    w->rebuild_indexes();
    log_debug(logger_, "world built: " + std::to_string(w->nodes().size()) + " nodes, " +
                           std::to_string(w->services().size()) + " services, " +
                           std::to_string(w->applications().size()) + " applications");
    return w;
}

void topology_constructor::load_nodes(build_context& ctx, query_id, const std::vector<metric_values>& values) const {
    for (const auto& m : values) {
        if (m.labels.node().empty()) {
            continue;
        }
        ctx.w.add_node(node{m.labels.node(), m.labels.internal_ip()});
    }
}

void topology_constructor::load_services(build_context& ctx, query_id, const std::vector<metric_values>& values) const {
    for (const auto& m : values) {
        const auto& cluster_ip = m.labels.cluster_ip();
        if (cluster_ip.empty()) {
            continue;
        }
        std::string name = m.labels.service();
        if (name == "kubernetes") {
            name = "kube-apiserver";
        }
        ctx.w.add_service(service{name, m.labels.namespace_name(), cluster_ip, {}});
    }
}

void topology_constructor::load_pods(build_context& ctx, query_id, const std::vector<metric_values>& values) const {
    for (const auto& m : values) {
        ctx.w.integrations.kube_state_metrics = true;

        const auto& pod_name = m.labels.pod();
        const auto& ns = m.labels.namespace_name();
        const auto& owner_kind = m.labels.created_by_kind();
        const auto& owner_name = m.labels.created_by_name();
        const auto& node_name = m.labels.node();

        application_id app_id;
        std::optional<application_kind> kind;
        if (is_static_pod_owner(owner_kind)) {
            app_id = application_id{ns, application_kind::static_pods, static_pod_app_name(pod_name, node_name)};
        } else if (!owner_name.empty()) {
            kind = parse_application_kind(owner_kind);
            if (!kind) {
                log_warning(logger_, "pod " + pod_key(ns, pod_name) + " has unsupported owner kind: " + owner_kind);
                continue;
            }
            app_id = application_id{ns, *kind, owner_name};
        } else {
            continue;
        }

        const std::string resolved_node = ctx.w.get_node(node_name) ? node_name : std::string();
        auto& inst = ctx.w.get_or_create_application(app_id).get_or_create_instance(pod_name, resolved_node);

        const auto& pod_ip = m.labels.pod_ip();
        if (!pod_ip.empty() && pod_ip != m.labels.host_ip() && is_valid_ip(pod_ip)) {
            inst.tcp_listens[listen{pod_ip, "0", false}] = m.values.last() == 1;
        }

        if (!inst.pod) {
            inst.pod = pod{};
        }
        if (kind == application_kind::replica_set) {
            inst.pod->replica_set = owner_name;
        }

        ctx.pods_by_uid[m.labels.uid()] = &inst;
        ctx.pods_by_name[pod_key(ns, pod_name)] = &inst;
    }
}

void topology_constructor::load_pod_labels(build_context& ctx, query_id, const std::vector<metric_values>& values) const {
    for (const auto& m : values) {
        auto* inst = ctx.pod_by_uid(m.labels);
        if (!inst) {
            log_warning(logger_, "unknown pod: " + describe_pod(m.labels));
            continue;
        }

        std::string cluster;
        std::string role;
        if (!m.labels.get("label_postgres_operator_crunchydata_com_cluster").empty()) {
            cluster = m.labels.get("label_postgres_operator_crunchydata_com_cluster");
            role = m.labels.get("label_postgres_operator_crunchydata_com_role");
        } else if (!m.labels.get("label_cluster_name").empty() && !m.labels.get("label_team").empty()) {
            cluster = m.labels.get("label_cluster_name");
            // Poolers of the same cluster carry no role.
            if (m.labels.get("label_application") == "spilo") {
                role = m.labels.get("label_spilo_role");
            }
        } else if (!m.labels.get("label_k8s_enterprisedb_io_cluster").empty()) {
            cluster = m.labels.get("label_k8s_enterprisedb_io_cluster");
            role = m.labels.get("label_role");
        } else {
            continue;
        }

        inst->update_cluster_name(cluster, m.values);
        if (role == "master") {
            role = "primary";
        }
        inst->update_cluster_role(role, m.values);
    }
}

void topology_constructor::load_pod_status(build_context& ctx, query_id id, const std::vector<metric_values>& values) const {
    for (const auto& m : values) {
        auto* inst = ctx.pod_by_uid(m.labels);
        if (!inst || !inst->pod) {
            log_warning(logger_, "unknown pod: " + describe_pod(m.labels));
            continue;
        }
        auto& p = *inst->pod;

        switch (id) {
            case query_id::kube_pod_status_phase:
                p.life_span = series_ops::merge(p.life_span, m.values, series_ops::nan_sum);
                if (m.values.last() > 0) {
                    p.phase = m.labels.phase();
                }
                if (m.labels.phase() == "Running") {
                    p.running = series_ops::merge(p.running, m.values, series_ops::any);
                }
                break;
            case query_id::kube_pod_status_ready:
                if (m.labels.condition() == "true") {
                    p.ready = series_ops::merge(p.ready, m.values, series_ops::any);
                }
                break;
            case query_id::kube_pod_status_scheduled:
                if (m.values.last() > 0 && m.labels.condition() == "true") {
                    p.scheduled = true;
                }
                break;
            default:
                break;
        }
    }
}

void topology_constructor::load_container_status(build_context& ctx, query_id id, const std::vector<metric_values>& values) const {
    for (const auto& m : values) {
        auto* inst = ctx.pod_by_uid(m.labels);
        if (!inst) {
            log_warning(logger_, "unknown pod: " + describe_pod(m.labels));
            continue;
        }
        auto& c = inst->get_or_create_container(m.labels.container());
        const bool active = m.values.last() > 0;

        switch (id) {
            case query_id::kube_pod_init_container_info:
                c.init_container = true;
                if (!m.labels.image().empty()) {
                    c.image = m.labels.image();
                }
                break;
            case query_id::kube_pod_container_info:
                if (!m.labels.image().empty()) {
                    c.image = m.labels.image();
                }
                break;
            case query_id::kube_pod_container_status_ready:
                c.ready = active;
                break;
            case query_id::kube_pod_container_status_waiting:
                if (active) {
                    c.status = container_status::waiting;
                }
                break;
            case query_id::kube_pod_container_status_running:
                if (active) {
                    c.status = container_status::running;
                    c.reason.clear();
                }
                break;
            case query_id::kube_pod_container_status_terminated:
                if (active) {
                    c.status = container_status::terminated;
                }
                break;
            case query_id::kube_pod_container_status_waiting_reason:
                if (active) {
                    c.status = container_status::waiting;
                    c.reason = m.labels.reason();
                }
                break;
            case query_id::kube_pod_container_status_terminated_reason:
                if (active) {
                    c.status = container_status::terminated;
                    c.reason = m.labels.reason();
                }
                break;
            case query_id::kube_pod_container_status_last_terminated_reason:
                if (active) {
                    c.last_terminated_reason = m.labels.reason();
                }
                break;
            default:
                break;
        }
    }
}

void topology_constructor::load_replicaset_owners(build_context& ctx, query_id, const std::vector<metric_values>& values) const {
    for (const auto& m : values) {
        const auto owner_kind = parse_application_kind(m.labels.owner_kind());
        if (owner_kind != application_kind::deployment || m.labels.owner_name().empty()) {
            continue;
        }
        const application_id rs_id{m.labels.namespace_name(), application_kind::replica_set, m.labels.replicaset()};
        auto* rs_app = ctx.w.get_application(rs_id);
        if (!rs_app) {
            continue;
        }
        auto& owner = ctx.w.get_or_create_application(
            application_id{m.labels.namespace_name(), application_kind::deployment, m.labels.owner_name()});
        owner.adopt_instances(*rs_app);
        ctx.w.remove_application(rs_id);
    }
}

void topology_constructor::load_desired_replicas(build_context& ctx, query_id id, const std::vector<metric_values>& values) const {
    application_kind kind = application_kind::deployment;
    std::string name_label;
    switch (id) {
        case query_id::kube_deployment_spec_replicas:
            kind = application_kind::deployment;
            name_label = "deployment";
            break;
        case query_id::kube_statefulset_replicas:
            kind = application_kind::stateful_set;
            name_label = "statefulset";
            break;
        case query_id::kube_daemonset_status_desired_number_scheduled:
            kind = application_kind::daemon_set;
            name_label = "daemonset";
            break;
        default:
            return;
    }

    for (const auto& m : values) {
        auto* app = ctx.w.get_application(application_id{m.labels.namespace_name(), kind, m.labels.get(name_label)});
        if (!app) {
            continue;
        }
        app->desired_instances = series_ops::merge(app->desired_instances, m.values, series_ops::any);
    }
}

void topology_constructor::load_container_usage(build_context& ctx, query_id id, const std::vector<metric_values>& values) const {
    for (const auto& m : values) {
        ctx.w.integrations.node_agent = true;
        auto* inst = ctx.pod_by_name(m.labels);
        if (!inst) {
            log_warning(logger_, "unknown pod: " + describe_pod(m.labels));
            continue;
        }
        auto& c = inst->get_or_create_container(m.labels.container());
        if (id == query_id::container_cpu_usage) {
            c.cpu_usage = series_ops::merge(c.cpu_usage, m.values, series_ops::any);
        } else if (id == query_id::container_memory_rss) {
            c.memory_rss = series_ops::merge(c.memory_rss, m.values, series_ops::any);
        }
    }
}

void topology_constructor::load_container_counters(build_context& ctx, query_id id, const std::vector<metric_values>& values) const {
    for (const auto& m : values) {
        auto* inst = id == query_id::kube_pod_container_status_restarts_total ? ctx.pod_by_uid(m.labels)
                                                                               : ctx.pod_by_name(m.labels);
        if (!inst) {
            log_warning(logger_, "unknown pod: " + describe_pod(m.labels));
            continue;
        }

        // Without pod status a counter is considered live wherever it reports.
        const time_series status = inst->pod && !inst->pod->running.empty()
                                       ? inst->pod->running
                                       : m.values.map(series_ops::defined);
        const auto delta = increase(m.values, status);

        switch (id) {
            case query_id::kube_pod_container_status_restarts_total: {
                auto& c = inst->get_or_create_container(m.labels.container());
                c.restarts = series_ops::merge(c.restarts, delta, series_ops::nan_sum);
                break;
            }
            case query_id::container_oom_kills_total: {
                ctx.w.integrations.node_agent = true;
                auto& c = inst->get_or_create_container(m.labels.container());
                c.oom_kills = series_ops::merge(c.oom_kills, delta, series_ops::nan_sum);
                break;
            }
            case query_id::container_log_messages_total: {
                ctx.w.integrations.node_agent = true;
                auto& by_level = inst->log_messages_by_level[parse_message_level(m.labels.level())];
                by_level = series_ops::merge(by_level, delta, series_ops::nan_sum);
                break;
            }
            default:
                break;
        }
    }
}

void topology_constructor::load_connections(build_context& ctx, query_id, const std::vector<metric_values>& values) const {
    for (const auto& m : values) {
        ctx.w.integrations.node_agent = true;
        const auto& remote = m.labels.destination_ip();
        if (remote.empty()) {
            continue;
        }
        auto* inst = ctx.pod_by_name(m.labels);
        if (!inst) {
            log_warning(logger_, "unknown pod: " + describe_pod(m.labels));
            continue;
        }
        const auto& actual = m.labels.actual_destination_ip();

        connection* existing = nullptr;
        for (auto& c : inst->connections) {
            if (c.service_remote_ip == remote && c.actual_remote_ip == actual) {
                existing = &c;
                break;
            }
        }
        if (existing) {
            existing->active = series_ops::merge(existing->active, m.values, series_ops::nan_sum);
        } else {
            inst->connections.push_back(connection{remote, actual, m.values});
        }
    }
}

void topology_constructor::load_application_slis(build_context& ctx, query_id id, const std::vector<metric_values>& values) const {
    for (const auto& m : values) {
        const auto kind = parse_application_kind(m.labels.kind());
        application* app = nullptr;
        if (kind) {
            app = ctx.w.get_application(application_id{m.labels.namespace_name(), *kind, m.labels.application()});
        }
        if (!app) {
            log_warning(logger_, "unknown application: " + m.labels.namespace_name() + ":" + m.labels.kind() + ":" +
                                     m.labels.application());
            continue;
        }

        switch (id) {
            case query_id::application_requests_total: {
                if (app->availability_slis.empty()) {
                    app->availability_slis.emplace_back();
                }
                auto& sli = app->availability_slis.front();
                sli.total_requests = series_ops::merge(sli.total_requests, m.values, series_ops::nan_sum);
                break;
            }
            case query_id::application_requests_failed: {
                if (app->availability_slis.empty()) {
                    app->availability_slis.emplace_back();
                }
                auto& sli = app->availability_slis.front();
                sli.failed_requests = series_ops::merge(sli.failed_requests, m.values, series_ops::nan_sum);
                break;
            }
            case query_id::application_latency_bucket: {
                const auto& raw_le = m.labels.le();
                char* end = nullptr;
                const float le = std::strtof(raw_le.c_str(), &end);
                if (raw_le.empty() || end == raw_le.c_str() || *end != '\0' || std::isnan(le)) {
                    log_warning(logger_, "invalid histogram bucket bound: " + raw_le);
                    continue;
                }
                if (app->latency_slis.empty()) {
                    app->latency_slis.emplace_back();
                }
                app->latency_slis.front().add_bucket(le, m.values);
                break;
            }
            default:
                break;
        }
    }
}

} // namespace kcenon::topology
