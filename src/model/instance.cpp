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

#include "kcenon/topology/model/instance.h"
#include "kcenon/topology/timeseries/series_ops.h"

#include <algorithm>
#include <cctype>

namespace kcenon::topology {

message_level parse_message_level(const std::string& level) {
    std::string lower(level);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return message_level::debug;
    if (lower == "info") return message_level::info;
    if (lower == "warning" || lower == "warn") return message_level::warning;
    if (lower == "error") return message_level::error;
    if (lower == "critical" || lower == "fatal") return message_level::critical;
    return message_level::unknown;
}

container& instance::get_or_create_container(const std::string& container_name) {
    auto it = containers_.find(container_name);
    if (it == containers_.end()) {
        container c;
        c.name = container_name;
        it = containers_.emplace(container_name, std::move(c)).first;
    }
    return it->second;
}

const container* instance::get_container(const std::string& container_name) const {
    auto it = containers_.find(container_name);
    return it == containers_.end() ? nullptr : &it->second;
}

void instance::update_cluster_role(const std::string& role, const time_series& values) {
    float code = cluster_role_code::none;
    if (role == "primary" || role == "master") {
        code = cluster_role_code::primary;
    } else if (role == "replica") {
        code = cluster_role_code::replica;
    } else {
        return;
    }

    auto observed = values.map([code](timestamp, float v) { return v > 0 ? code : missing; });
    // The newest observation wins where both are defined.
    cluster_role = series_ops::merge(observed, cluster_role, series_ops::any);
}

void instance::update_cluster_name(const std::string& cluster, const time_series& values) {
    if (cluster.empty()) {
        return;
    }
    auto [t, v] = values.last_not_null();
    if (!is_missing(v)) {
        cluster_name = cluster;
    }
}

} // namespace kcenon::topology
