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
 * @file deployment_detector.h
 * @brief Rollout detection from per-replica-set life-span series
 *
 * A Deployment rolls out by creating a new ReplicaSet that replaces the
 * old one. Summing the pod life-span of every ReplicaSet and walking the
 * sums in lockstep shows when a different ReplicaSet took over.
 */

#include "../model/application.h"
#include "../model/deployment.h"
#include "../timeseries/time_series.h"

#include <map>
#include <string>
#include <vector>

namespace kcenon::topology {

/**
 * @struct rollout_walk
 * @brief Outcome of walking a set of life-span series
 */
struct rollout_walk {
    std::vector<application_deployment> deployments;
    // ReplicaSet considered current at the end of the walk, empty if none
    std::string last_active;
};

/**
 * @brief Detect rollouts in life-span series keyed by ReplicaSet name
 *
 * At every step the ReplicaSets with a positive value are active.
 * - exactly one active: a change of the single active name is a rollout
 *   that starts and finishes at that step, and it closes any rollout in
 *   progress (extending it when the names match);
 * - several active: opens a rollout towards the lexicographically first
 *   active name that differs from the current one, unless one is already
 *   in progress;
 * - none active: the step is skipped.
 *
 * The walk stops at the end of the shortest series. Returned deployments
 * carry no details.
 */
rollout_walk detect_rollouts(const application_id& app,
                             const std::map<std::string, time_series>& life_spans);

/**
 * @brief Rollouts of a Deployment application
 *
 * Groups instance life-spans by ReplicaSet, runs detect_rollouts and
 * attaches the container images seen for each ReplicaSet. Returns nothing
 * for other kinds or applications without ReplicaSet pods.
 */
std::vector<application_deployment> calc_deployments(const application& app);

/**
 * @brief Synthesize the first deployment record of an application
 *
 * Used when no rollout was recorded or detected yet. The record starts
 * and finishes at now and is marked as already summarized, so it never
 * triggers a notification.
 */
application_deployment calc_initial_deployment(const application& app, timestamp now);

/**
 * @struct deployment_change
 * @brief A detected deployment that has to be persisted
 */
struct deployment_change {
    application_deployment deployment;
    bool is_new = false;
};

/**
 * @brief Compare detected deployments with the recorded ones
 *
 * Records are matched by (name, started_at). Unknown detections become new
 * records; known ones are reported only when finished_at changed, carrying
 * the detected finished_at over the recorded attachments.
 */
std::vector<deployment_change> plan_deployment_changes(const std::vector<application_deployment>& known,
                                                       const std::vector<application_deployment>& detected);

} // namespace kcenon::topology
