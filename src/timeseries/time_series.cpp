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

#include "kcenon/topology/timeseries/time_series.h"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <sstream>

namespace kcenon::topology {

namespace {

bool index_of(timestamp from, duration step, std::size_t size, timestamp t, std::size_t& idx) {
    if (size == 0 || step.count() <= 0) {
        return false;
    }
    t = truncate(t, step);
    if (t < from) {
        return false;
    }
    auto i = static_cast<std::size_t>((t - from) / step);
    if (i >= size) {
        return false;
    }
    idx = i;
    return true;
}

void write_number(std::string& out, float v) {
    if (!std::isfinite(v)) {
        out += "null";
        return;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec != std::errc()) {
        out += "null";
        return;
    }
    out.append(buf, ptr);
}

} // namespace

time_series::time_series(timestamp from, std::size_t count, duration step)
    : from_(from), step_(step), data_(count, missing) {}

time_series::time_series(timestamp from, duration step, std::vector<float> data)
    : from_(from), step_(step), data_(std::move(data)) {}

float time_series::get(timestamp t) const {
    std::size_t idx = 0;
    if (!index_of(from_, step_, data_.size(), t, idx)) {
        return missing;
    }
    return data_[idx];
}

void time_series::set(timestamp t, float v) {
    std::size_t idx = 0;
    if (!index_of(from_, step_, data_.size(), t, idx)) {
        return;
    }
    data_[idx] = v;
}

bool time_series::fill(timestamp from, duration step, const std::vector<float>& data) {
    if (empty() || step.count() <= 0 || step_.count() <= 0) {
        return false;
    }
    bool changed = false;
    // Lowest slot still writable; only moves forward.
    std::size_t next_idx = 0;
    timestamp t = from - step;
    for (float v : data) {
        t += step;
        if (t < from_) {
            continue;
        }
        const auto idx = static_cast<std::size_t>((t - from_) / step_);
        if (idx >= data_.size()) {
            break;
        }
        if (idx < next_idx || is_missing(v)) {
            continue;
        }
        data_[idx] = v;
        changed = true;
        next_idx = idx + 1;
    }
    return changed;
}

std::vector<float> time_series::last_n(std::size_t n) const {
    std::vector<float> res(n, missing);
    if (empty() || n == 0) {
        return res;
    }
    if (data_.size() < n) {
        std::copy(data_.begin(), data_.end(), res.begin() + (n - data_.size()));
    } else {
        std::copy(data_.end() - static_cast<std::ptrdiff_t>(n), data_.end(), res.begin());
    }
    return res;
}

std::pair<timestamp, float> time_series::last_not_null() const {
    std::pair<timestamp, float> res{timestamp{}, missing};
    auto it = iter();
    while (it.next()) {
        if (!is_missing(it.value())) {
            res = {it.time(), it.value()};
        }
    }
    return res;
}

time_series time_series::with_new_value(float value) const {
    if (empty()) {
        return {};
    }
    return time_series(from_, step_, std::vector<float>(data_.size(), value));
}

std::string time_series::to_json() const {
    if (empty()) {
        return "null";
    }
    std::string out;
    out.reserve(data_.size() * 6 + 2);
    out += '[';
    for (std::size_t i = 0; i < data_.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        write_number(out, data_[i]);
    }
    out += ']';
    return out;
}

std::string time_series::to_string() const {
    if (empty()) {
        return "TimeSeries(nil)";
    }
    std::ostringstream oss;
    oss << "TimeSeries(" << to_unix(from_) << ", " << data_.size() << ", " << step_.count() << ", [";
    for (std::size_t i = 0; i < data_.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        if (is_missing(data_[i])) {
            oss << '.';
        } else {
            oss << data_[i];
        }
    }
    oss << "])";
    return oss.str();
}

time_series increase(const time_series& x, const time_series& status) {
    if (x.empty() || status.empty()) {
        return {};
    }
    std::vector<float> data;
    data.reserve(x.size());
    float prev = missing;
    float prev_status = missing;
    auto it = x.iter();
    auto status_it = status.iter();
    while (it.next() && status_it.next()) {
        const float v = it.value();
        float d = missing;
        if (!is_missing(v) && !is_missing(prev)) {
            d = (v - prev >= 0) ? v - prev : v;
        } else if (is_missing(prev) && prev_status == 1) {
            d = v;
        }
        prev = v;
        prev_status = status_it.value();
        data.push_back(d);
    }
    return time_series(x.from(), x.step(), std::move(data));
}

time_series mul(const time_series& x, const time_series& y) {
    return aggregate2(x, y, [](float a, float b) { return a * b; });
}

time_series div(const time_series& x, const time_series& y) {
    return aggregate2(x, y, [](float a, float b) { return b == 0 ? missing : a / b; });
}

time_series sub(const time_series& x, const time_series& y) {
    return aggregate2(x, y, [](float a, float b) { return a - b; });
}

time_series sum(const time_series& x, const time_series& y) {
    return aggregate2(x, y, [](float a, float b) { return a + b; });
}

} // namespace kcenon::topology
