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

#include "kcenon/topology/deployments/metrics_snapshot.h"
#include "kcenon/topology/timeseries/aggregate.h"
#include "kcenon/topology/timeseries/linear_regression.h"
#include "kcenon/topology/timeseries/series_ops.h"

#include <cmath>
#include <cstdio>

namespace kcenon::topology {

namespace {

float sum_f(const time_series& ts) {
    const float v = ts.reduce(series_ops::nan_sum);
    return is_missing(v) ? 0.0f : v;
}

float sum_rate_f(const time_series& ts, duration step) {
    return sum_f(ts) * static_cast<float>(step.count());
}

std::int64_t sum_rate(const time_series& ts, duration step) {
    return static_cast<std::int64_t>(sum_rate_f(ts, step));
}

std::int64_t sum(const time_series& ts) {
    return static_cast<std::int64_t>(sum_f(ts));
}

std::string format_le(float le) {
    if (std::isinf(le)) {
        return le > 0 ? "+Inf" : "-Inf";
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.3f", static_cast<double>(le));
    return buf;
}

} // namespace

snapshot_window snapshot_window_for(const application_deployment& d, duration shift, duration window, duration step) {
    const timestamp from = truncate(d.finished_at + shift, step);
    const timestamp to = truncate(from + window, step);
    return snapshot_window{from, to};
}

std::optional<snapshot_window> due_snapshot_window(const application& app,
                                                   std::size_t index,
                                                   timestamp now,
                                                   duration shift,
                                                   duration window,
                                                   duration step) {
    if (index >= app.deployments.size()) {
        return std::nullopt;
    }
    const auto& d = app.deployments[index];
    if (d.snapshot || !d.finished()) {
        return std::nullopt;
    }
    const auto w = snapshot_window_for(d, shift, window, step);
    const timestamp next_or_now =
        index + 1 < app.deployments.size() ? app.deployments[index + 1].started_at : now;
    if (w.to > next_or_now) {
        return std::nullopt;
    }
    return w;
}

metrics_snapshot calc_metrics_snapshot(const application& app, timestamp from, timestamp to, duration step) {
    metrics_snapshot ms;
    ms.at = to;
    ms.window = to - from;

    if (!app.availability_slis.empty()) {
        const auto& sli = app.availability_slis.front();
        ms.requests = sum_rate(sli.total_requests, step);
        ms.errors = sum_rate(sli.failed_requests, step);
    }
    if (!app.latency_slis.empty()) {
        for (const auto& bucket : app.latency_slis.front().histogram) {
            ms.latency[format_le(bucket.le)] = sum_rate(bucket.requests, step);
        }
    }

    aggregate cpu_usage;
    aggregate memory_usage;
    aggregate oom_kills;
    aggregate restarts;
    aggregate log_errors;
    aggregate log_warnings;
    for (const auto& inst : app.instances()) {
        for (const auto& [name, c] : inst->containers()) {
            cpu_usage.add(c.cpu_usage);
            memory_usage.add(c.memory_rss);
            restarts.add(c.restarts);
            oom_kills.add(c.oom_kills);
        }
        for (const auto& [level, ts] : inst->log_messages_by_level) {
            switch (level) {
                case message_level::critical:
                case message_level::error:
                    log_errors.add(ts);
                    break;
                case message_level::warning:
                    log_warnings.add(ts);
                    break;
                default:
                    break;
            }
        }
    }

    ms.cpu_usage = sum_rate_f(cpu_usage.get(), step);
    if (auto lr = linear_regression::fit(memory_usage.get())) {
        ms.memory_leak = static_cast<std::int64_t>(lr->calc(from + hour) - lr->calc(from));
    }
    ms.oom_kills = sum(oom_kills.get());
    ms.restarts = sum(restarts.get());
    ms.log_errors = sum(log_errors.get());
    ms.log_warnings = sum(log_warnings.get());
    return ms;
}

} // namespace kcenon::topology
