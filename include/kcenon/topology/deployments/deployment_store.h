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
 * @file deployment_store.h
 * @brief Durable storage of projects and deployment records
 */

#include "../config/project.h"
#include "../core/result_types.h"
#include "../model/deployment.h"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::topology {

/**
 * @class deployment_store
 * @brief Abstract store of deployment records
 *
 * Records are keyed by (application, name, started_at). Every write
 * replaces the state of one record atomically and is idempotent.
 */
class deployment_store {
public:
    virtual ~deployment_store() = default;

    virtual result<std::vector<project>> get_projects() = 0;

    /**
     * @brief All deployments of a project ordered by start time
     */
    virtual result<std::vector<application_deployment>> get_deployments(const std::string& project_id) = 0;

    /**
     * @brief Insert a deployment or update its finished_at and details
     *
     * Attachments already stored are kept unless d carries its own.
     */
    virtual result_void save_deployment(const std::string& project_id, const application_deployment& d) = 0;

    /**
     * @brief Attach d.snapshot to the stored record
     */
    virtual result_void save_metrics_snapshot(const std::string& project_id, const application_deployment& d) = 0;

    /**
     * @brief Attach d.notifications to the stored record
     */
    virtual result_void save_notifications(const std::string& project_id, const application_deployment& d) = 0;
};

/**
 * @class memory_deployment_store
 * @brief In-memory deployment store guarded by a single mutex
 */
class memory_deployment_store : public deployment_store {
public:
    void add_project(project p);

    result<std::vector<project>> get_projects() override;
    result<std::vector<application_deployment>> get_deployments(const std::string& project_id) override;
    result_void save_deployment(const std::string& project_id, const application_deployment& d) override;
    result_void save_metrics_snapshot(const std::string& project_id, const application_deployment& d) override;
    result_void save_notifications(const std::string& project_id, const application_deployment& d) override;

private:
    application_deployment* find_locked(const std::string& project_id, const application_deployment& d);

    std::mutex mutex_;
    std::vector<project> projects_;
    std::map<std::string, std::map<std::string, application_deployment>> deployments_;
};

} // namespace kcenon::topology
