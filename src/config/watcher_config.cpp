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

#include "kcenon/topology/config/watcher_config.h"

namespace kcenon::topology {

namespace {

template <typename Duration>
bool read_duration(const config_map& config, const std::string& key, Duration& out) {
    if (!config_parser::has_key(config, key)) {
        return true;
    }
    auto value = config_parser::get_duration_optional<Duration>(config, key);
    if (!value) {
        return false;
    }
    out = *value;
    return true;
}

} // namespace

result_void watcher_config::validate() const {
    if (interval.count() <= 0) {
        return make_void_error(topology_error_code::invalid_interval, "Interval must be positive");
    }
    if (lookback.count() <= 0) {
        return make_void_error(topology_error_code::invalid_configuration, "Lookback must be positive");
    }
    if (snapshot_shift.count() < 0) {
        return make_void_error(topology_error_code::invalid_configuration,
                               "Snapshot shift must not be negative");
    }
    if (snapshot_window.count() <= 0) {
        return make_void_error(topology_error_code::invalid_configuration,
                               "Snapshot window must be positive");
    }
    if (send_timeout.count() <= 0) {
        return make_void_error(topology_error_code::invalid_configuration, "Send timeout must be positive");
    }
    if (notification_freshness.count() <= 0) {
        return make_void_error(topology_error_code::invalid_configuration,
                               "Notification freshness must be positive");
    }
    if (stuck_timeout.count() <= 0) {
        return make_void_error(topology_error_code::invalid_configuration, "Stuck timeout must be positive");
    }
    return make_void_success();
}

result<watcher_config> watcher_config::from_config_map(const config_map& config) {
    watcher_config cfg;
    const std::pair<const char*, duration*> durations[] = {
        {"watcher.interval", &cfg.interval},
        {"watcher.lookback", &cfg.lookback},
        {"watcher.snapshot_shift", &cfg.snapshot_shift},
        {"watcher.snapshot_window", &cfg.snapshot_window},
        {"watcher.notification_freshness", &cfg.notification_freshness},
        {"watcher.stuck_timeout", &cfg.stuck_timeout},
    };
    for (const auto& [key, field] : durations) {
        if (!read_duration(config, key, *field)) {
            return make_error_with_context<watcher_config>(topology_error_code::invalid_configuration,
                                                           "Invalid duration", key);
        }
    }
    if (!read_duration(config, "watcher.send_timeout", cfg.send_timeout)) {
        return make_error_with_context<watcher_config>(topology_error_code::invalid_configuration,
                                                       "Invalid duration", "watcher.send_timeout");
    }

    auto valid = cfg.validate();
    if (valid.is_err()) {
        return common::Result<watcher_config>::err(valid.error());
    }
    return make_success(std::move(cfg));
}

} // namespace kcenon::topology
