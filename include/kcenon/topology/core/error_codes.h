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
 * @file error_codes.h
 * @brief Topology system specific error codes
 *
 * This file defines error codes used throughout the topology system,
 * following the pattern established by the other kcenon systems.
 */

#include <cstdint>
#include <string>

namespace kcenon::topology {

/**
 * @enum topology_error_code
 * @brief Error codes for topology construction and deployment tracking
 */
enum class topology_error_code : std::uint32_t {
    // Success
    success = 0,

    // Metrics cache errors (1000-1999)
    cache_empty = 1000,
    cache_unavailable = 1001,
    query_failed = 1002,

    // Project errors (2000-2999)
    project_not_found = 2000,

    // Storage errors (3000-3999)
    storage_write_failed = 3000,
    storage_read_failed = 3001,
    deployment_not_found = 3002,

    // Configuration errors (4000-4999)
    invalid_configuration = 4000,
    invalid_interval = 4001,

    // Notification errors (5000-5999)
    notification_failed = 5000,
    notification_timeout = 5001,
    notifier_not_ready = 5002,

    // State errors (6000-6999)
    already_started = 6000,
    invalid_argument = 6001,
    already_exists = 6002,
    not_found = 6003,

    // Unknown error
    unknown_error = 9999
};

/**
 * @brief Convert error code to string representation
 * @param code The error code to convert
 * @return String representation of the error code
 */
inline std::string error_code_to_string(topology_error_code code) {
    switch (code) {
        case topology_error_code::success:
            return "Success";

        case topology_error_code::cache_empty:
            return "Metrics cache is empty";
        case topology_error_code::cache_unavailable:
            return "Metrics cache unavailable";
        case topology_error_code::query_failed:
            return "Metrics query failed";

        case topology_error_code::project_not_found:
            return "Project not found";

        case topology_error_code::storage_write_failed:
            return "Storage write failed";
        case topology_error_code::storage_read_failed:
            return "Storage read failed";
        case topology_error_code::deployment_not_found:
            return "Deployment not found";

        case topology_error_code::invalid_configuration:
            return "Invalid configuration";
        case topology_error_code::invalid_interval:
            return "Invalid interval";

        case topology_error_code::notification_failed:
            return "Notification failed";
        case topology_error_code::notification_timeout:
            return "Notification timeout";
        case topology_error_code::notifier_not_ready:
            return "Notifier not ready";

        case topology_error_code::already_started:
            return "Already started";
        case topology_error_code::invalid_argument:
            return "Invalid argument";
        case topology_error_code::already_exists:
            return "Already exists";
        case topology_error_code::not_found:
            return "Not found";

        case topology_error_code::unknown_error:
        default:
            return "Unknown error";
    }
}

} // namespace kcenon::topology
