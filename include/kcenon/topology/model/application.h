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
 * @file application.h
 * @brief Workload with its instances, desired replica count and SLIs
 */

#include "application_id.h"
#include "deployment.h"
#include "instance.h"
#include "../timeseries/time_series.h"

#include <memory>
#include <string>
#include <vector>

namespace kcenon::topology {

struct availability_sli {
    time_series total_requests;
    time_series failed_requests;
};

struct histogram_bucket {
    float le = 0;
    time_series requests;
};

/**
 * @struct latency_sli
 * @brief Cumulative latency histogram, buckets ordered by upper bound
 */
struct latency_sli {
    std::vector<histogram_bucket> histogram;

    /**
     * @brief Insert a bucket, summing into an existing one with the same bound
     */
    void add_bucket(float le, const time_series& requests);
};

/**
 * @class application
 * @brief A workload identified by application_id
 *
 * Instances are owned by the application and keep their address for as
 * long as the application lives.
 */
class application {
public:
    explicit application(application_id id) : id_(std::move(id)) {}

    const application_id& id() const noexcept { return id_; }

    const std::vector<std::unique_ptr<instance>>& instances() const noexcept { return instances_; }

    instance* get_instance(const std::string& name);
    const instance* get_instance(const std::string& name) const;

    /**
     * @brief Instance by name, created on first access
     */
    instance& get_or_create_instance(const std::string& name, const std::string& node_name = "");

    /**
     * @brief Move another application's instances into this one
     *
     * Instances keep their address; their owner is rewritten.
     */
    void adopt_instances(application& other);

    time_series desired_instances;
    std::vector<application_deployment> deployments;
    std::vector<availability_sli> availability_slis;
    std::vector<latency_sli> latency_slis;

private:
    application_id id_;
    std::vector<std::unique_ptr<instance>> instances_;
};

} // namespace kcenon::topology
