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

#include "kcenon/topology/model/world.h"

#include <algorithm>

namespace kcenon::topology {

node& world::add_node(node n) {
    if (auto* existing = get_node(n.name)) {
        *existing = std::move(n);
        return *existing;
    }
    nodes_.push_back(std::move(n));
    return nodes_.back();
}

service& world::add_service(service s) {
    for (auto& existing : services_) {
        if (existing.ns == s.ns && existing.name == s.name) {
            existing.cluster_ip = s.cluster_ip;
            return existing;
        }
    }
    services_.push_back(std::move(s));
    return services_.back();
}

node* world::get_node(const std::string& name) {
    for (auto& n : nodes_) {
        if (n.name == name) {
            return &n;
        }
    }
    return nullptr;
}

const node* world::get_node(const std::string& name) const {
    return const_cast<world*>(this)->get_node(name);
}

application* world::get_application(const application_id& id) {
    for (auto& app : applications_) {
        if (app->id() == id) {
            return app.get();
        }
    }
    return nullptr;
}

const application* world::get_application(const application_id& id) const {
    return const_cast<world*>(this)->get_application(id);
}

application& world::get_or_create_application(const application_id& id) {
    if (auto* existing = get_application(id)) {
        return *existing;
    }
    applications_.push_back(std::make_unique<application>(id));
    return *applications_.back();
}

bool world::remove_application(const application_id& id) {
    auto it = std::find_if(applications_.begin(), applications_.end(),
                           [&id](const auto& app) { return app->id() == id; });
    if (it == applications_.end()) {
        return false;
    }
    applications_.erase(it);
    return true;
}

instance* world::get_instance(const instance_ref& ref) {
    auto* app = get_application(ref.app);
    return app ? app->get_instance(ref.instance) : nullptr;
}

const instance* world::get_instance(const instance_ref& ref) const {
    return const_cast<world*>(this)->get_instance(ref);
}

const instance* world::find_instance_by_ip(const std::string& ip) const {
    auto it = ip_index_.find(ip);
    if (it == ip_index_.end()) {
        return nullptr;
    }
    return get_instance(it->second);
}

void world::rebuild_indexes() {
    ip_index_.clear();
    for (auto& s : services_) {
        s.connections.clear();
    }

    std::unordered_map<std::string, service*> by_cluster_ip;
    for (auto& s : services_) {
        if (!s.cluster_ip.empty()) {
            by_cluster_ip.emplace(s.cluster_ip, &s);
        }
    }

    for (const auto& app : applications_) {
        for (const auto& inst : app->instances()) {
            instance_ref ref{app->id(), inst->name()};
            for (const auto& [l, active] : inst->tcp_listens) {
                ip_index_.insert_or_assign(l.ip, ref);
            }
            for (const auto& c : inst->connections) {
                auto it = by_cluster_ip.find(c.service_remote_ip);
                if (it != by_cluster_ip.end()) {
                    it->second->connections.push_back(service_connection{ref, c.actual_remote_ip});
                }
            }
        }
    }
}

const service* world::get_service_for_connection(const connection& c) const {
    if (!c.service_remote_ip.empty()) {
        for (const auto& s : services_) {
            if (s.cluster_ip == c.service_remote_ip) {
                return &s;
            }
        }
    }
    if (!c.actual_remote_ip.empty()) {
        for (const auto& s : services_) {
            for (const auto& sc : s.connections) {
                if (sc.actual_remote_ip == c.actual_remote_ip) {
                    return &s;
                }
            }
        }
    }
    return nullptr;
}

} // namespace kcenon::topology
