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
 * @file instance.h
 * @brief Application instances (pods), their containers and network facts
 */

#include "application_id.h"
#include "../timeseries/time_series.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::topology {

enum class container_status {
    unknown,
    waiting,
    running,
    terminated,
};

inline const char* to_string(container_status status) {
    switch (status) {
        case container_status::waiting: return "waiting";
        case container_status::running: return "running";
        case container_status::terminated: return "terminated";
        default: return "unknown";
    }
}

/**
 * @enum message_level
 * @brief Severity of application log messages counted per instance
 */
enum class message_level {
    unknown,
    debug,
    info,
    warning,
    error,
    critical,
};

message_level parse_message_level(const std::string& level);

struct container {
    std::string name;
    container_status status = container_status::unknown;
    std::string reason;
    std::string last_terminated_reason;
    bool init_container = false;
    bool ready = false;
    std::string image;

    // Per-step usage and counter deltas
    time_series cpu_usage;
    time_series memory_rss;
    time_series restarts;
    time_series oom_kills;
};

/**
 * @struct pod
 * @brief Kubernetes pod metadata attached to an instance
 */
struct pod {
    std::string phase;
    bool scheduled = false;
    time_series running;
    time_series ready;
    time_series life_span;
    std::string replica_set;
};

/**
 * @struct listen
 * @brief A TCP listen address of an instance
 */
struct listen {
    std::string ip;
    std::string port;
    bool proxied = false;

    bool operator<(const listen& other) const {
        if (ip != other.ip) return ip < other.ip;
        if (port != other.port) return port < other.port;
        return proxied < other.proxied;
    }

    bool operator==(const listen& other) const {
        return ip == other.ip && port == other.port && proxied == other.proxied;
    }
};

/**
 * @struct connection
 * @brief Outbound TCP connection of an instance
 *
 * service_remote_ip is the address the instance dialed (possibly a
 * service cluster IP); actual_remote_ip is where the connection landed.
 */
struct connection {
    std::string service_remote_ip;
    std::string actual_remote_ip;
    time_series active;
};

/**
 * @struct cluster_role_code
 * @brief Numeric encoding of database roles in the role series
 */
struct cluster_role_code {
    static constexpr float none = 0;
    static constexpr float primary = 1;
    static constexpr float replica = 2;
};

/**
 * @class instance
 * @brief One running unit of an application
 */
class instance {
public:
    instance(std::string name, application_id owner, std::string node_name)
        : name_(std::move(name)), owner_(std::move(owner)), node_name_(std::move(node_name)) {}

    const std::string& name() const noexcept { return name_; }
    const application_id& owner() const noexcept { return owner_; }
    const std::string& node_name() const noexcept { return node_name_; }

    void set_owner(application_id owner) { owner_ = std::move(owner); }

    std::optional<topology::pod> pod;
    std::map<listen, bool> tcp_listens;
    std::vector<connection> connections;
    std::string cluster_name;
    time_series cluster_role;
    std::map<message_level, time_series> log_messages_by_level;

    /**
     * @brief Container by name, created on first access
     */
    container& get_or_create_container(const std::string& container_name);

    const container* get_container(const std::string& container_name) const;

    const std::map<std::string, container>& containers() const noexcept { return containers_; }
    std::map<std::string, container>& containers() noexcept { return containers_; }

    /**
     * @brief Merge a role observation into the role series
     *
     * Points where values is positive take the role code; unknown roles are
     * ignored.
     */
    void update_cluster_role(const std::string& role, const time_series& values);

    /**
     * @brief Remember the cluster name if the series has any defined point
     */
    void update_cluster_name(const std::string& cluster, const time_series& values);

private:
    std::string name_;
    application_id owner_;
    std::string node_name_;
    std::map<std::string, container> containers_;
};

} // namespace kcenon::topology
