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
 * @file metric_ingestor.h
 * @brief Projects raw cache series onto the world grid, grouped by query
 */

#include "metric_values.h"

#include <cstddef>
#include <vector>

namespace kcenon::topology {

/**
 * @class metric_ingestor
 * @brief Groups raw series by query onto the [from, to) grid at step
 *
 * Every accepted raw series becomes a metric_values whose series has
 * (to - from) / step points. Series whose query name is not in the
 * catalog are ignored.
 */
class metric_ingestor {
public:
    metric_ingestor(timestamp from, timestamp to, duration step);

    /**
     * @brief Ingest one raw series
     * @return false if the query name is unknown
     */
    bool add(const raw_series& raw);

    /**
     * @brief Ingest a batch, returns how many series were accepted
     */
    std::size_t add_all(const std::vector<raw_series>& batch);

    /**
     * @brief Number of grid points of every produced series
     */
    std::size_t points() const noexcept { return points_; }

    const metric_set& metrics() const noexcept { return metrics_; }

    metric_set take() { return std::move(metrics_); }

private:
    timestamp from_;
    duration step_;
    std::size_t points_;
    metric_set metrics_;
};

} // namespace kcenon::topology
