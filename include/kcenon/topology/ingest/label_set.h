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
 * @file label_set.h
 * @brief Immutable view over the labels of one metric series
 *
 * Entity resolution reads labels only through the typed accessors below,
 * so the set of keys each rule depends on stays visible in one place.
 * Absent keys read as an empty string.
 */

#include <initializer_list>
#include <map>
#include <string>
#include <utility>

namespace kcenon::topology {

class label_set {
public:
    using container_type = std::map<std::string, std::string>;

    label_set() = default;

    explicit label_set(container_type labels) : labels_(std::move(labels)) {}

    label_set(std::initializer_list<container_type::value_type> labels) : labels_(labels) {}

    /**
     * @brief Value of an arbitrary key, empty when absent
     */
    const std::string& get(const std::string& key) const {
        auto it = labels_.find(key);
        return it == labels_.end() ? empty_value() : it->second;
    }

    bool has(const std::string& key) const {
        return !get(key).empty();
    }

    std::size_t size() const noexcept { return labels_.size(); }
    const container_type& items() const noexcept { return labels_; }

    // Kubernetes object identity
    const std::string& namespace_name() const { return get("namespace"); }
    const std::string& pod() const { return get("pod"); }
    const std::string& uid() const { return get("uid"); }
    const std::string& container() const { return get("container"); }
    const std::string& node() const { return get("node"); }
    const std::string& service() const { return get("service"); }
    const std::string& cluster_ip() const { return get("cluster_ip"); }
    const std::string& internal_ip() const { return get("internal_ip"); }

    // Pod ownership and addressing
    const std::string& created_by_kind() const { return get("created_by_kind"); }
    const std::string& created_by_name() const { return get("created_by_name"); }
    const std::string& pod_ip() const { return get("pod_ip"); }
    const std::string& host_ip() const { return get("host_ip"); }

    // Workload objects
    const std::string& deployment() const { return get("deployment"); }
    const std::string& statefulset() const { return get("statefulset"); }
    const std::string& daemonset() const { return get("daemonset"); }
    const std::string& replicaset() const { return get("replicaset"); }
    const std::string& owner_kind() const { return get("owner_kind"); }
    const std::string& owner_name() const { return get("owner_name"); }

    // Status details
    const std::string& phase() const { return get("phase"); }
    const std::string& condition() const { return get("condition"); }
    const std::string& reason() const { return get("reason"); }
    const std::string& image() const { return get("image"); }

    // Node agent and SLI series
    const std::string& level() const { return get("level"); }
    const std::string& le() const { return get("le"); }
    const std::string& destination_ip() const { return get("destination_ip"); }
    const std::string& actual_destination_ip() const { return get("actual_destination_ip"); }
    const std::string& application() const { return get("application"); }
    const std::string& kind() const { return get("kind"); }

    bool operator==(const label_set& other) const { return labels_ == other.labels_; }

private:
    static const std::string& empty_value() {
        static const std::string empty;
        return empty;
    }

    container_type labels_;
};

} // namespace kcenon::topology
