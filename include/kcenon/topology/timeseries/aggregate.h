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
 * @file aggregate.h
 * @brief Running pointwise fold over an open-ended set of series
 */

#include "series_ops.h"
#include "time_series.h"

#include <functional>
#include <vector>

namespace kcenon::topology {

/**
 * @class aggregate
 * @brief Folds every added series into one running series
 *
 * The first non-empty series fixes the shape (start, step, length).
 * Later series with a different shape are ignored. get() materializes the
 * running values lazily and returns an empty series when nothing was added.
 *
 * Not thread-safe.
 *
 * @code
 * aggregate cpu(series_ops::nan_sum);
 * for (const auto& c : containers) {
 *     cpu.add(c.cpu_usage);
 * }
 * const time_series& total = cpu.get();
 * @endcode
 */
class aggregate {
public:
    using combine_func = std::function<float(timestamp, float, float)>;

    explicit aggregate(combine_func f = series_ops::nan_sum);

    /**
     * @brief Fold a series into the running result
     * @return false if the series was empty or had a different shape
     */
    bool add(const time_series& ts);

    bool empty() const noexcept { return running_.empty(); }

    const time_series& get() const;

private:
    combine_func f_;
    timestamp from_{};
    duration step_{};
    std::vector<float> running_;

    mutable time_series materialized_;
    mutable bool dirty_ = false;
};

} // namespace kcenon::topology
