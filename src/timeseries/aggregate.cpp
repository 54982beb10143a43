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

#include "kcenon/topology/timeseries/aggregate.h"

#include <utility>

namespace kcenon::topology {

aggregate::aggregate(combine_func f)
    : f_(f ? std::move(f) : combine_func(series_ops::nan_sum)) {}

bool aggregate::add(const time_series& ts) {
    if (ts.empty()) {
        return false;
    }
    const auto& values = ts.values();
    if (running_.empty()) {
        from_ = ts.from();
        step_ = ts.step();
        running_.assign(values.size(), missing);
    } else if (ts.from() != from_ || ts.step() != step_ || values.size() != running_.size()) {
        return false;
    }
    timestamp t = from_;
    for (std::size_t i = 0; i < running_.size(); ++i, t += step_) {
        running_[i] = f_(t, running_[i], values[i]);
    }
    dirty_ = true;
    return true;
}

const time_series& aggregate::get() const {
    if (dirty_) {
        materialized_ = time_series(from_, step_, running_);
        dirty_ = false;
    }
    return materialized_;
}

} // namespace kcenon::topology
