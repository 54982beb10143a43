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
 * @file time_series.h
 * @brief Dense fixed-step numeric series with explicit missing values
 *
 * A time_series is anchored at a start timestamp and a step. Index i holds
 * the sample for from + i * step. The length is fixed at construction;
 * set() and fill() mutate samples in place and never grow the series.
 *
 * A default-constructed series is empty. Every operation accepts an empty
 * series: reductions return missing and binary operations return empty.
 */

#include "time.h"

#include <cstddef>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::topology {

/**
 * @brief The missing-value sentinel ("no data", distinct from zero)
 */
inline constexpr float missing = std::numeric_limits<float>::quiet_NaN();

inline bool is_missing(float v) noexcept {
    return v != v;
}

/**
 * @class series_iterator
 * @brief Single-pass cursor over (time, value) pairs of a series
 *
 * Missing values are yielded, not skipped. The iterator borrows the
 * series' storage and must not outlive it. A fresh iterator can always be
 * obtained from time_series::iter().
 *
 * @code
 * auto it = series.iter();
 * while (it.next()) {
 *     use(it.time(), it.value());
 * }
 * @endcode
 */
class series_iterator {
public:
    series_iterator() = default;

    series_iterator(const std::vector<float>* data, timestamp from, duration step)
        : data_(data), from_(from), step_(step) {}

    /**
     * @brief Advance to the next point
     * @return false once the series is exhausted
     */
    bool next() noexcept {
        if (data_ == nullptr) {
            return false;
        }
        if (idx_ + 1 >= data_->size()) {
            idx_ = data_->size();
            return false;
        }
        ++idx_;
        return true;
    }

    timestamp time() const noexcept {
        return from_ + step_ * static_cast<duration::rep>(idx_);
    }

    float value() const noexcept {
        return (*data_)[idx_];
    }

private:
    const std::vector<float>* data_ = nullptr;
    timestamp from_{};
    duration step_{};
    // Wraps to zero on the first next().
    std::size_t idx_ = static_cast<std::size_t>(-1);
};

/**
 * @class time_series
 * @brief Immutable-length dense series of float samples
 */
class time_series {
public:
    time_series() = default;

    /**
     * @brief Create a series of count points, all missing
     */
    time_series(timestamp from, std::size_t count, duration step);

    /**
     * @brief Wrap existing samples
     */
    time_series(timestamp from, duration step, std::vector<float> data);

    bool empty() const noexcept { return data_.empty(); }
    std::size_t size() const noexcept { return data_.size(); }
    timestamp from() const noexcept { return from_; }
    duration step() const noexcept { return step_; }

    /**
     * @brief End of the window (exclusive)
     */
    timestamp to() const noexcept {
        return from_ + step_ * static_cast<duration::rep>(data_.size());
    }

    const std::vector<float>& values() const noexcept { return data_; }

    /**
     * @brief True when both series share start, step and length
     */
    bool same_shape(const time_series& other) const noexcept {
        return from_ == other.from_ && step_ == other.step_ && data_.size() == other.data_.size();
    }

    /**
     * @brief Value at t (truncated to step), missing outside the window
     */
    float get(timestamp t) const;

    /**
     * @brief Store v at t (truncated to step)
     *
     * A no-op when t precedes the series or falls past its end.
     */
    void set(timestamp t, float v);

    /**
     * @brief Merge an external series into the overlapping part of this one
     *
     * Sample k of data belongs to from + k * step and lands in the slot of
     * this series containing that time. The first defined sample of a slot
     * wins; later samples for the same or an earlier slot are ignored.
     * Missing samples never overwrite anything. Samples outside this
     * series' window are dropped.
     *
     * @return true if at least one defined value was written
     */
    bool fill(timestamp from, duration step, const std::vector<float>& data);

    series_iterator iter() const {
        if (empty()) {
            return {};
        }
        return series_iterator(&data_, from_, step_);
    }

    /**
     * @brief Last sample, missing for an empty series
     */
    float last() const noexcept {
        return empty() ? missing : data_.back();
    }

    /**
     * @brief Last n samples, left-padded with missing
     */
    std::vector<float> last_n(std::size_t n) const;

    /**
     * @brief Time and value of the last defined sample
     *
     * Returns a zero timestamp and missing when nothing is defined.
     */
    std::pair<timestamp, float> last_not_null() const;

    /**
     * @brief Left fold f(time, accumulator, value) starting from missing
     */
    template <typename F>
    float reduce(F&& f) const {
        float accumulator = missing;
        auto it = iter();
        while (it.next()) {
            accumulator = f(it.time(), accumulator, it.value());
        }
        return accumulator;
    }

    /**
     * @brief Pointwise transform f(time, value)
     */
    template <typename F>
    time_series map(F&& f) const {
        if (empty()) {
            return {};
        }
        std::vector<float> data;
        data.reserve(data_.size());
        auto it = iter();
        while (it.next()) {
            data.push_back(f(it.time(), it.value()));
        }
        return time_series(from_, step_, std::move(data));
    }

    /**
     * @brief Same shape, every point set to value
     */
    time_series with_new_value(float value) const;

    /**
     * @brief JSON array with null for missing values; null when empty
     */
    std::string to_json() const;

    std::string to_string() const;

private:
    timestamp from_{};
    duration step_{};
    std::vector<float> data_;
};

/**
 * @brief Per-step delta of a monotonic counter gated by a status series
 *
 * - both points present: curr - prev, or curr when the counter went down
 *   (a reset is assumed to restart from zero);
 * - previous point missing but status was 1 at the previous step: curr;
 * - otherwise missing.
 */
time_series increase(const time_series& x, const time_series& status);

/**
 * @brief Pointwise binary combination of two equally shaped series
 *
 * Returns an empty series when either input is empty or the step or
 * length differ.
 */
template <typename F>
time_series aggregate2(const time_series& x, const time_series& y, F&& f) {
    if (x.empty() || y.empty() || x.step() != y.step() || x.size() != y.size()) {
        return {};
    }
    std::vector<float> data;
    data.reserve(x.size());
    const auto& xs = x.values();
    const auto& ys = y.values();
    for (std::size_t i = 0; i < xs.size(); ++i) {
        data.push_back(f(xs[i], ys[i]));
    }
    return time_series(x.from(), x.step(), std::move(data));
}

time_series mul(const time_series& x, const time_series& y);
time_series div(const time_series& x, const time_series& y);
time_series sub(const time_series& x, const time_series& y);
time_series sum(const time_series& x, const time_series& y);

} // namespace kcenon::topology
