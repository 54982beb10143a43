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

#include "kcenon/topology/model/application.h"
#include "kcenon/topology/timeseries/series_ops.h"

#include <algorithm>

namespace kcenon::topology {

void latency_sli::add_bucket(float le, const time_series& requests) {
    auto pos = std::lower_bound(histogram.begin(), histogram.end(), le,
                                [](const histogram_bucket& b, float v) { return b.le < v; });
    if (pos != histogram.end() && pos->le == le) {
        pos->requests = series_ops::merge(pos->requests, requests, series_ops::nan_sum);
        return;
    }
    histogram.insert(pos, histogram_bucket{le, requests});
}

instance* application::get_instance(const std::string& name) {
    for (auto& i : instances_) {
        if (i->name() == name) {
            return i.get();
        }
    }
    return nullptr;
}

const instance* application::get_instance(const std::string& name) const {
    for (const auto& i : instances_) {
        if (i->name() == name) {
            return i.get();
        }
    }
    return nullptr;
}

instance& application::get_or_create_instance(const std::string& name, const std::string& node_name) {
    if (auto* existing = get_instance(name)) {
        return *existing;
    }
    instances_.push_back(std::make_unique<instance>(name, id_, node_name));
    return *instances_.back();
}

void application::adopt_instances(application& other) {
    for (auto& i : other.instances_) {
        i->set_owner(id_);
        instances_.push_back(std::move(i));
    }
    other.instances_.clear();
}

} // namespace kcenon::topology
