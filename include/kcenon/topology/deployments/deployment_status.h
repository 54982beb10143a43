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
 * @file deployment_status.h
 * @brief Current lifecycle state of an application's deployments
 */

#include "../model/application.h"
#include "../model/deployment.h"
#include "../timeseries/time.h"

#include <cstddef>
#include <vector>

namespace kcenon::topology {

struct deployment_status {
    // Position of the deployment in application::deployments
    std::size_t index = 0;
    application_deployment deployment;
    deployment_state state = deployment_state::unknown;
};

/**
 * @brief State of a single deployment
 * @param has_successor true when a later deployment of the same application exists
 */
deployment_state calc_deployment_state(const application_deployment& d,
                                       bool has_successor,
                                       timestamp now,
                                       duration stuck_timeout);

/**
 * @brief States of all deployments of an application, in start order
 */
std::vector<deployment_status> calc_deployment_statuses(const application& app,
                                                        timestamp now,
                                                        duration stuck_timeout);

} // namespace kcenon::topology
