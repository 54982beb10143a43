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
 * @file world.h
 * @brief Topology graph for one time window
 *
 * A world is rebuilt from scratch for every query window. Applications and
 * their instances are owned by the world; services refer to instances by
 * key and connections are resolved through an IP index.
 */

#include "application.h"
#include "node.h"
#include "service.h"
#include "../timeseries/time.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace kcenon::topology {

struct integration_status {
    bool kube_state_metrics = false;
    bool node_agent = false;
};

class world {
public:
    world(timestamp from, timestamp to, duration step) : from_(from), to_(to), step_(step) {}

    world(const world&) = delete;
    world& operator=(const world&) = delete;
    world(world&&) = default;
    world& operator=(world&&) = default;

    timestamp from() const noexcept { return from_; }
    timestamp to() const noexcept { return to_; }
    duration step() const noexcept { return step_; }

    /**
     * @brief Number of grid points of every series in this world
     */
    std::size_t points() const noexcept {
        return step_.count() > 0 && to_ > from_ ? static_cast<std::size_t>((to_ - from_) / step_) : 0;
    }

    const std::vector<node>& nodes() const noexcept { return nodes_; }
    const std::vector<service>& services() const noexcept { return services_; }
    const std::vector<std::unique_ptr<application>>& applications() const noexcept {
        return applications_;
    }

    node& add_node(node n);
    service& add_service(service s);

    node* get_node(const std::string& name);
    const node* get_node(const std::string& name) const;

    application* get_application(const application_id& id);
    const application* get_application(const application_id& id) const;

    /**
     * @brief Application by value identity, created on first access
     *
     * Never duplicates an application already in the world.
     */
    application& get_or_create_application(const application_id& id);

    /**
     * @brief Drop an application and everything it owns
     * @return false if no such application exists
     */
    bool remove_application(const application_id& id);

    instance* get_instance(const instance_ref& ref);
    const instance* get_instance(const instance_ref& ref) const;

    /**
     * @brief Instance listening on an IP, nullptr if none is known
     */
    const instance* find_instance_by_ip(const std::string& ip) const;

    /**
     * @brief Rebuild the IP index and service connection lists
     *
     * Indexes every instance listen address by IP and attaches every
     * instance connection to the service whose cluster IP it dialed.
     * Must be called again after instances were added or re-parented.
     */
    void rebuild_indexes();

    /**
     * @brief Service a connection went through
     *
     * Matches the dialed address against service cluster IPs first, then
     * falls back to the actual remote address recorded on any service's
     * connections.
     */
    const service* get_service_for_connection(const connection& c) const;

    integration_status integrations;

private:
    timestamp from_;
    timestamp to_;
    duration step_;

    std::vector<node> nodes_;
    std::vector<service> services_;
    std::vector<std::unique_ptr<application>> applications_;

    std::unordered_map<std::string, instance_ref> ip_index_;
};

} // namespace kcenon::topology
