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

#include "kcenon/topology/deployments/deployment_status.h"

namespace kcenon::topology {

deployment_state calc_deployment_state(const application_deployment& d,
                                       bool has_successor,
                                       timestamp now,
                                       duration stuck_timeout) {
    if (!d.finished()) {
        if (has_successor) {
            return deployment_state::cancelled;
        }
        if (now - d.started_at > stuck_timeout) {
            return deployment_state::stuck;
        }
        return deployment_state::in_progress;
    }
    return d.snapshot ? deployment_state::summary : deployment_state::deployed;
}

std::vector<deployment_status> calc_deployment_statuses(const application& app,
                                                        timestamp now,
                                                        duration stuck_timeout) {
    std::vector<deployment_status> statuses;
    statuses.reserve(app.deployments.size());
    for (std::size_t i = 0; i < app.deployments.size(); ++i) {
        const auto& d = app.deployments[i];
        const bool has_successor = i + 1 < app.deployments.size();
        statuses.push_back(deployment_status{i, d, calc_deployment_state(d, has_successor, now, stuck_timeout)});
    }
    return statuses;
}

} // namespace kcenon::topology
