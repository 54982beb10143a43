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
 * @file metrics_snapshot.h
 * @brief Post-rollout metrics summary
 */

#include "../model/application.h"
#include "../model/deployment.h"
#include "../timeseries/time.h"

#include <cstddef>
#include <optional>

namespace kcenon::topology {

struct snapshot_window {
    timestamp from;
    timestamp to;
};

/**
 * @brief Window a deployment's snapshot covers
 *
 * Starts shift after finished_at and lasts window, both ends truncated to
 * step.
 */
snapshot_window snapshot_window_for(const application_deployment& d, duration shift, duration window, duration step);

/**
 * @brief Window of the deployment at index if its snapshot is due
 *
 * Returns nothing when the deployment already has a snapshot, is not
 * finished, or its window ends after the next deployment's start (now for
 * the last deployment).
 */
std::optional<snapshot_window> due_snapshot_window(const application& app,
                                                   std::size_t index,
                                                   timestamp now,
                                                   duration shift,
                                                   duration window,
                                                   duration step);

/**
 * @brief Summarize an application over [from, to)
 *
 * Request, error and latency bucket rates are integrated over the window
 * (summed and multiplied by the step in seconds); only the first SLI of
 * each kind is used. Container counters are summed across instances.
 * memory_leak is the one-hour growth of a linear fit of total memory.
 */
metrics_snapshot calc_metrics_snapshot(const application& app, timestamp from, timestamp to, duration step);

} // namespace kcenon::topology
