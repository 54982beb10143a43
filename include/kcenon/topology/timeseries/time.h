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
 * @file time.h
 * @brief Time and duration types of the fixed-step series engine
 *
 * Timestamps are whole seconds on the system clock. All series in one
 * computation share a step, and every timestamp stored in a series is
 * truncated to that step.
 */

#include <chrono>
#include <cstdint>
#include <string>

namespace kcenon::topology {

using duration = std::chrono::seconds;
using timestamp = std::chrono::sys_seconds;

inline constexpr duration second{1};
inline constexpr duration minute{60};
inline constexpr duration hour{3600};
inline constexpr duration day{86400};

/**
 * @brief Build a timestamp from unix seconds
 */
constexpr timestamp from_unix(std::int64_t seconds) noexcept {
    return timestamp{duration{seconds}};
}

constexpr std::int64_t to_unix(timestamp t) noexcept {
    return t.time_since_epoch().count();
}

/**
 * @brief The zero timestamp marks "unset" (e.g. an unfinished deployment)
 */
constexpr bool is_zero(timestamp t) noexcept {
    return t.time_since_epoch().count() == 0;
}

/**
 * @brief Round a timestamp down to a multiple of step
 */
constexpr timestamp truncate(timestamp t, duration step) noexcept {
    if (step.count() <= 0) {
        return t;
    }
    return t - (t.time_since_epoch() % step);
}

inline std::string to_string(timestamp t) {
    return std::to_string(to_unix(t));
}

} // namespace kcenon::topology
