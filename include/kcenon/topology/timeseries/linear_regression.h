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
 * @file linear_regression.h
 * @brief Ordinary least squares fit over the defined points of a series
 */

#include "time_series.h"

#include <optional>

namespace kcenon::topology {

/**
 * @class linear_regression
 * @brief value(t) = intercept + slope * (t - origin)
 *
 * Time is measured in seconds relative to the series start to keep the
 * fit numerically stable.
 */
class linear_regression {
public:
    /**
     * @brief Fit a line through the defined points of ts
     * @return std::nullopt when fewer than two points are defined
     */
    static std::optional<linear_regression> fit(const time_series& ts);

    /**
     * @brief Evaluate (or extrapolate) the fitted line at t
     */
    float calc(timestamp t) const noexcept;

    /**
     * @brief Change of value per second
     */
    double slope() const noexcept { return slope_; }

    double intercept() const noexcept { return intercept_; }

private:
    linear_regression(timestamp origin, double slope, double intercept)
        : origin_(origin), slope_(slope), intercept_(intercept) {}

    timestamp origin_;
    double slope_;
    double intercept_;
};

} // namespace kcenon::topology
