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
 * @file series_ops.h
 * @brief Reduction and mapping functions over series points
 *
 * Reducers have the signature f(time, accumulator, value) and are used
 * with time_series::reduce() and aggregate. Mappers have the signature
 * f(time, value) and are used with time_series::map().
 */

#include "time.h"
#include "time_series.h"

namespace kcenon::topology::series_ops {

/**
 * @brief Prefer the first defined operand
 */
inline float any(timestamp, float v1, float v2) noexcept {
    return is_missing(v1) ? v2 : v1;
}

/**
 * @brief Sum treating missing as zero; missing only when both are missing
 */
inline float nan_sum(timestamp, float sum, float v) noexcept {
    if (is_missing(sum)) {
        return v;
    }
    if (is_missing(v)) {
        return sum;
    }
    return sum + v;
}

inline float max(timestamp, float max, float v) noexcept {
    if (is_missing(max)) {
        return v;
    }
    if (is_missing(v)) {
        return max;
    }
    return v > max ? v : max;
}

inline float min(timestamp, float min, float v) noexcept {
    if (is_missing(min)) {
        return v;
    }
    if (is_missing(v)) {
        return min;
    }
    return v < min ? v : min;
}

/**
 * @brief 1 where data exists, 0 where it is missing
 */
inline float defined(timestamp, float v) noexcept {
    return is_missing(v) ? 0.0f : 1.0f;
}

inline float nan_to_zero(timestamp, float v) noexcept {
    return is_missing(v) ? 0.0f : v;
}

/**
 * @brief Fold v into an accumulator series with a combinator
 *
 * An empty accumulator takes v as is. A shape mismatch leaves the
 * accumulator unchanged.
 */
template <typename F>
time_series merge(const time_series& acc, const time_series& v, F&& f) {
    if (acc.empty()) {
        return v;
    }
    auto merged = aggregate2(acc, v, [&f](float a, float b) { return f(timestamp{}, a, b); });
    return merged.empty() ? acc : merged;
}

} // namespace kcenon::topology::series_ops
