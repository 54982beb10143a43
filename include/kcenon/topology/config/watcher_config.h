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
 * @file watcher_config.h
 * @brief Settings of the deployment watcher
 */

#include "../core/result_types.h"
#include "../timeseries/time.h"
#include "../utils/config_parser.h"

#include <chrono>

namespace kcenon::topology {

/**
 * @struct watcher_config
 * @brief Timing of the periodic deployment pass
 *
 * Recognized keys of from_config_map(), all durations:
 * watcher.interval, watcher.lookback, watcher.snapshot_shift,
 * watcher.snapshot_window, watcher.send_timeout,
 * watcher.notification_freshness, watcher.stuck_timeout.
 */
struct watcher_config {
    duration interval{60};                           ///< Period of the background pass
    duration lookback = hour;                        ///< World window ending at the cache head
    duration snapshot_shift = minute;                ///< Delay of the snapshot window after a rollout
    duration snapshot_window = 30 * minute;          ///< Length of the snapshot window
    std::chrono::milliseconds send_timeout{30000};   ///< Budget of one notification send
    duration notification_freshness = day;           ///< Older deployments are never notified
    duration stuck_timeout = 30 * minute;            ///< Unfinished rollouts older than this are stuck

    result_void validate() const;

    /**
     * @brief Defaults overridden by the keys present in config
     *
     * Fails on an unparsable value or when the result does not validate.
     */
    static result<watcher_config> from_config_map(const config_map& config);
};

} // namespace kcenon::topology
