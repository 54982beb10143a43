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
 * @file metric_values.h
 * @brief Ingestion units: raw cache series and grid-aligned metric values
 */

#include "label_set.h"
#include "query_catalog.h"
#include "../timeseries/time_series.h"

#include <string>
#include <unordered_map>
#include <vector>

namespace kcenon::topology {

/**
 * @struct raw_series
 * @brief One labeled series as returned by the metrics cache
 */
struct raw_series {
    std::string query;
    label_set labels;
    timestamp from{};
    duration step{};
    std::vector<float> values;
};

/**
 * @struct metric_values
 * @brief One label set plus its series on the world grid
 */
struct metric_values {
    label_set labels;
    time_series values;
};

/**
 * @class metric_set
 * @brief Metric values grouped by query
 */
class metric_set {
public:
    void add(query_id id, metric_values mv) {
        groups_[id].push_back(std::move(mv));
    }

    /**
     * @brief Values for one query, empty when nothing was ingested
     */
    const std::vector<metric_values>& get(query_id id) const {
        static const std::vector<metric_values> none;
        auto it = groups_.find(id);
        return it == groups_.end() ? none : it->second;
    }

    std::size_t query_count() const noexcept { return groups_.size(); }

private:
    std::unordered_map<query_id, std::vector<metric_values>> groups_;
};

} // namespace kcenon::topology
