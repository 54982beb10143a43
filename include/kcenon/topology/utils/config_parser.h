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
 * @file config_parser.h
 * @brief Typed lookups over string key/value configuration
 *
 * Usage:
 * @code
 * using kcenon::topology::config_parser;
 *
 * config_map config = {{"watcher.interval", "30s"}, {"watcher.channels", "webhook,log"}};
 *
 * auto interval = config_parser::get_duration(config, "watcher.interval", std::chrono::seconds(60));
 * auto channels = config_parser::get_list<std::string>(config, "watcher.channels", {});
 * @endcode
 */

#include <cctype>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace kcenon::topology {

using config_map = std::unordered_map<std::string, std::string>;

/**
 * @class config_parser
 * @brief Parses configuration values with default fallback
 *
 * Absent keys yield the default. Values that fail to parse yield the
 * default for get() and std::nullopt for get_optional() and
 * get_duration_optional().
 */
class config_parser {
   public:
    template <typename T>
    static T get(const config_map& config, const std::string& key, const T& default_value) {
        return get_optional<T>(config, key).value_or(default_value);
    }

    template <typename T>
    static std::optional<T> get_optional(const config_map& config, const std::string& key) {
        auto it = config.find(key);
        if (it == config.end()) {
            return std::nullopt;
        }
        return parse_value<T>(it->second);
    }

    static bool has_key(const config_map& config, const std::string& key) {
        return config.find(key) != config.end();
    }

    /**
     * @brief Duration value, e.g. "1500ms", "30s", "5m", "1h", "1d"
     *
     * A plain number is read in the unit of Duration.
     */
    template <typename Duration>
    static Duration get_duration(const config_map& config, const std::string& key,
                                 const Duration& default_value) {
        return get_duration_optional<Duration>(config, key).value_or(default_value);
    }

    template <typename Duration>
    static std::optional<Duration> get_duration_optional(const config_map& config, const std::string& key) {
        auto it = config.find(key);
        if (it == config.end()) {
            return std::nullopt;
        }
        return parse_duration<Duration>(it->second);
    }

    /**
     * @brief Comma-separated list, surrounding spaces trimmed, empty items skipped
     */
    template <typename T>
    static std::vector<T> get_list(const config_map& config, const std::string& key,
                                   const std::vector<T>& default_values) {
        auto it = config.find(key);
        if (it == config.end()) {
            return default_values;
        }
        std::vector<T> result;
        std::size_t start = 0;
        const std::string& str = it->second;
        while (start <= str.size()) {
            std::size_t end = str.find(',', start);
            if (end == std::string::npos) {
                end = str.size();
            }
            std::string item = trim(str.substr(start, end - start));
            if (!item.empty()) {
                auto parsed = parse_value<T>(item);
                if (!parsed) {
                    return default_values;
                }
                result.push_back(std::move(*parsed));
            }
            start = end + 1;
        }
        return result;
    }

   private:
    template <typename T>
    static std::optional<T> parse_value(const std::string& str) {
        try {
            if constexpr (std::is_same_v<T, bool>) {
                return parse_bool(str);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return str;
            } else if constexpr (std::is_integral_v<T>) {
                if constexpr (std::is_signed_v<T>) {
                    return static_cast<T>(std::stoll(str));
                } else {
                    return static_cast<T>(std::stoull(str));
                }
            } else if constexpr (std::is_floating_point_v<T>) {
                return static_cast<T>(std::stod(str));
            } else {
                return std::nullopt;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    static std::optional<bool> parse_bool(const std::string& str) {
        const std::string lower = to_lower(str);
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
            return true;
        }
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
            return false;
        }
        return std::nullopt;
    }

    template <typename Duration>
    static std::optional<Duration> parse_duration(const std::string& str) {
        const std::string value_str = trim(str);
        if (value_str.empty()) {
            return std::nullopt;
        }
        const std::size_t suffix_start = value_str.find_first_not_of("0123456789-");
        long long value = 0;
        try {
            value = std::stoll(value_str.substr(0, suffix_start));
        } catch (const std::exception&) {
            return std::nullopt;
        }
        if (suffix_start == std::string::npos) {
            return Duration(value);
        }

        const std::string suffix = to_lower(trim(value_str.substr(suffix_start)));
        if (suffix == "ms") {
            return std::chrono::duration_cast<Duration>(std::chrono::milliseconds(value));
        }
        if (suffix == "s") {
            return std::chrono::duration_cast<Duration>(std::chrono::seconds(value));
        }
        if (suffix == "m") {
            return std::chrono::duration_cast<Duration>(std::chrono::minutes(value));
        }
        if (suffix == "h") {
            return std::chrono::duration_cast<Duration>(std::chrono::hours(value));
        }
        if (suffix == "d") {
            return std::chrono::duration_cast<Duration>(std::chrono::hours(24 * value));
        }
        return std::nullopt;
    }

    static std::string trim(const std::string& str) {
        std::size_t begin = 0;
        std::size_t end = str.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(str[begin]))) {
            ++begin;
        }
        while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1]))) {
            --end;
        }
        return str.substr(begin, end - begin);
    }

    static std::string to_lower(std::string str) {
        for (auto& c : str) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return str;
    }
};

} // namespace kcenon::topology
