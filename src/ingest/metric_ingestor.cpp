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

#include "kcenon/topology/ingest/metric_ingestor.h"

namespace kcenon::topology {

metric_ingestor::metric_ingestor(timestamp from, timestamp to, duration step)
    : from_(from)
    , step_(step)
    , points_(step.count() > 0 && to > from ? static_cast<std::size_t>((to - from) / step) : 0) {}

bool metric_ingestor::add(const raw_series& raw) {
    auto id = find_query(raw.query);
    if (!id) {
        return false;
    }
    time_series ts(from_, points_, step_);
    ts.fill(raw.from, raw.step, raw.values);
    metrics_.add(*id, metric_values{raw.labels, std::move(ts)});
    return true;
}

std::size_t metric_ingestor::add_all(const std::vector<raw_series>& batch) {
    std::size_t accepted = 0;
    for (const auto& raw : batch) {
        if (add(raw)) {
            ++accepted;
        }
    }
    return accepted;
}

} // namespace kcenon::topology
