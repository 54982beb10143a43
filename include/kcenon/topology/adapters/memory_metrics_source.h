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
 * @file memory_metrics_source.h
 * @brief metrics_source serving series held in memory
 */

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "../constructor/metrics_source.h"

namespace kcenon::topology {

/**
 * @class memory_metrics_source
 * @brief In-memory metrics cache
 *
 * Series are returned as stored; projecting them onto the query window is
 * left to the ingestor. A series matches the filters when it carries every
 * filter label with the same value.
 */
class memory_metrics_source : public metrics_source {
public:
    void set_to(timestamp to) {
        std::lock_guard<std::mutex> lock(mutex_);
        to_ = to;
    }

    void add(raw_series series) {
        std::lock_guard<std::mutex> lock(mutex_);
        series_[series.query].push_back(std::move(series));
    }

    /**
     * @brief Make every query of the given name fail
     */
    void fail_query(const std::string& query_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_.insert(query_name);
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        series_.clear();
        failing_.clear();
    }

    result<timestamp> get_to() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return make_success(to_);
    }

    result<std::vector<raw_series>> query(const std::string& query_name,
                                          timestamp,
                                          timestamp,
                                          duration,
                                          const label_filters& filters) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failing_.count(query_name) > 0) {
            return make_error<std::vector<raw_series>>(topology_error_code::query_failed,
                                                       "query failed: " + query_name);
        }
        std::vector<raw_series> out;
        auto it = series_.find(query_name);
        if (it == series_.end()) {
            return make_success(std::move(out));
        }
        for (const auto& s : it->second) {
            bool matches = true;
            for (const auto& [key, value] : filters) {
                if (s.labels.get(key) != value) {
                    matches = false;
                    break;
                }
            }
            if (matches) {
                out.push_back(s);
            }
        }
        return make_success(std::move(out));
    }

private:
    std::mutex mutex_;
    timestamp to_{};
    std::map<std::string, std::vector<raw_series>> series_;
    std::set<std::string> failing_;
};

} // namespace kcenon::topology
