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
 * @file topology_constructor.h
 * @brief Builds the World graph from ingested metric values
 *
 * Metric values are routed to handlers through a table keyed by query
 * family. Families are processed in a fixed order: infrastructure first,
 * then pods and their status, then ownership fix-ups, container facts,
 * connections and SLIs.
 *
 * Construction is best-effort. Samples that reference an unknown pod or
 * application are logged and dropped; the rest of the window is still
 * ingested.
 */

#include "metrics_source.h"
#include "../core/logging.h"
#include "../core/result_types.h"
#include "../ingest/metric_values.h"
#include "../model/world.h"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace kcenon::topology {

class topology_constructor {
public:
    explicit topology_constructor(std::shared_ptr<metrics_source> source = nullptr,
                                  logger_ptr logger = nullptr);

    /**
     * @brief Query every catalog metric from the source and build a world
     *
     * Fails on the first transport or parse error reported by the source.
     */
    result<std::shared_ptr<world>> load_world(timestamp from,
                                              timestamp to,
                                              duration step,
                                              const label_filters& filters = {});

    /**
     * @brief Build a world from already ingested metric values
     */
    std::shared_ptr<world> build_world(timestamp from,
                                       timestamp to,
                                       duration step,
                                       const metric_set& metrics) const;

private:
    struct build_context;

    using handler = void (topology_constructor::*)(build_context&,
                                                   query_id,
                                                   const std::vector<metric_values>&) const;

    void load_nodes(build_context& ctx, query_id id, const std::vector<metric_values>& values) const;
    void load_services(build_context& ctx, query_id id, const std::vector<metric_values>& values) const;
    void load_pods(build_context& ctx, query_id id, const std::vector<metric_values>& values) const;
    void load_pod_labels(build_context& ctx, query_id id, const std::vector<metric_values>& values) const;
    void load_pod_status(build_context& ctx, query_id id, const std::vector<metric_values>& values) const;
    void load_container_status(build_context& ctx, query_id id, const std::vector<metric_values>& values) const;
    void load_replicaset_owners(build_context& ctx, query_id id, const std::vector<metric_values>& values) const;
    void load_desired_replicas(build_context& ctx, query_id id, const std::vector<metric_values>& values) const;
    void load_container_usage(build_context& ctx, query_id id, const std::vector<metric_values>& values) const;
    void load_container_counters(build_context& ctx, query_id id, const std::vector<metric_values>& values) const;
    void load_connections(build_context& ctx, query_id id, const std::vector<metric_values>& values) const;
    void load_application_slis(build_context& ctx, query_id id, const std::vector<metric_values>& values) const;

    static const std::unordered_map<query_family, handler>& handlers();

    std::shared_ptr<metrics_source> source_;
    logger_ptr logger_;
};

} // namespace kcenon::topology
