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
 * @file logging.h
 * @brief Optional logger plumbing shared by topology components
 *
 * Components receive a common_system ILogger through dependency injection.
 * When no logger is injected every call here is a no-op.
 */

#include <memory>
#include <string>

#include <kcenon/common/interfaces/logger_interface.h>

namespace kcenon::topology {

using logger_ptr = std::shared_ptr<common::interfaces::ILogger>;
using common::interfaces::log_level;

namespace detail {

inline void log(const logger_ptr& logger, log_level level, const std::string& message) {
    if (!logger || !logger->is_enabled(level)) {
        return;
    }
    auto res = logger->log(level, message);
    // A failing logger has nowhere else to report to.
    (void)res;
}

} // namespace detail

inline void log_info(const logger_ptr& logger, const std::string& message) {
    detail::log(logger, log_level::info, message);
}

inline void log_warning(const logger_ptr& logger, const std::string& message) {
    detail::log(logger, log_level::warning, message);
}

inline void log_error(const logger_ptr& logger, const std::string& message) {
    detail::log(logger, log_level::error, message);
}

inline void log_debug(const logger_ptr& logger, const std::string& message) {
    detail::log(logger, log_level::debug, message);
}

} // namespace kcenon::topology
