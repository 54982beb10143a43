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
 * @file console_logger.h
 * @brief ILogger writing timestamped lines to a stream
 */

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

#include <kcenon/common/interfaces/logger_interface.h>

namespace kcenon::topology {

/**
 * @class console_logger
 * @brief Minimal common_system logger for daemons without logger_system
 */
class console_logger : public common::interfaces::ILogger {
public:
    using log_level = common::interfaces::log_level;
    using log_entry = common::interfaces::log_entry;

    explicit console_logger(log_level min = log_level::info, std::ostream& out = std::clog)
        : min_level_(min), out_(out) {}

    common::VoidResult log(log_level level, const std::string& message) override {
        if (!is_enabled(level)) {
            return common::ok();
        }

        auto time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm_buf;
        gmtime_r(&time, &tm_buf);

        std::lock_guard<std::mutex> lock(mutex_);
        out_ << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%SZ") << " [" << to_string(level)
             << "] " << message << '\n';
        return common::ok();
    }

    common::VoidResult log(log_level level, const std::string& message,
                           const std::string& file, int line, const std::string& function) override {
        return log(level, message + " [" + file + ":" + std::to_string(line) + " " + function + "]");
    }

    common::VoidResult log(const log_entry& entry) override {
        return log(entry.level, entry.message, entry.file, entry.line, entry.function);
    }

    bool is_enabled(log_level level) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int>(level) >= static_cast<int>(min_level_);
    }

    common::VoidResult set_level(log_level level) override {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
        return common::ok();
    }

    log_level get_level() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    common::VoidResult flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        out_.flush();
        return common::ok();
    }

private:
    mutable std::mutex mutex_;
    log_level min_level_;
    std::ostream& out_;
};

} // namespace kcenon::topology
