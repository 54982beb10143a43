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
 * @file metrics_source.h
 * @brief Interface of the metrics cache the constructor reads from
 */

#include "../core/result_types.h"
#include "../ingest/metric_values.h"
#include "../timeseries/time.h"

#include <map>
#include <string>
#include <vector>

namespace kcenon::topology {

/**
 * @brief Extra label matchers appended to every query, e.g. {"namespace", "prod"}
 */
using label_filters = std::map<std::string, std::string>;

/**
 * @class metrics_source
 * @brief Abstract metrics cache of one project
 */
class metrics_source {
public:
    virtual ~metrics_source() = default;

    /**
     * @brief Latest timestamp the cache holds data for
     *
     * A zero timestamp means the cache is empty or not initialized yet.
     */
    virtual result<timestamp> get_to() = 0;

    /**
     * @brief Fetch every series of one query over [from, to) at step
     */
    virtual result<std::vector<raw_series>> query(const std::string& query_name,
                                                  timestamp from,
                                                  timestamp to,
                                                  duration step,
                                                  const label_filters& filters) = 0;
};

} // namespace kcenon::topology
