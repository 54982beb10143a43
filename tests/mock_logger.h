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

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <kcenon/common/interfaces/logger_interface.h>

namespace kcenon {
namespace topology {

/**
 * @brief ILogger that records every message it receives
 */
class mock_logger : public common::interfaces::ILogger {
public:
    using log_level = common::interfaces::log_level;

    common::VoidResult log(log_level level, const std::string& message) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            levels_.push_back(level);
            messages_.push_back(message);
        }
        if (on_log) {
            on_log(message);
        }
        return common::ok();
    }

    common::VoidResult log(log_level level, const std::string& message,
                           [[maybe_unused]] const std::string& file,
                           [[maybe_unused]] int line,
                           [[maybe_unused]] const std::string& function) override {
        return log(level, message);
    }

    common::VoidResult log(const common::interfaces::log_entry& entry) override {
        return log(entry.level, entry.message);
    }

    bool is_enabled([[maybe_unused]] log_level level) const override { return true; }
    common::VoidResult set_level([[maybe_unused]] log_level level) override { return common::ok(); }
    log_level get_level() const override { return log_level::debug; }
    common::VoidResult flush() override { return common::ok(); }

    std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    std::vector<log_level> levels() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return levels_;
    }

    bool contains(const std::string& fragment) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& m : messages_) {
            if (m.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    // Called after recording, outside the logger's lock
    std::function<void(const std::string&)> on_log;

private:
    mutable std::mutex mutex_;
    std::vector<log_level> levels_;
    std::vector<std::string> messages_;
};

} // namespace topology
} // namespace kcenon
