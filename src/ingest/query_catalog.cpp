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

#include "kcenon/topology/ingest/query_catalog.h"

#include <unordered_map>

namespace kcenon::topology {

namespace {

// Catalog entries are laid out in enum order; describe() relies on it.
constexpr bool catalog_is_ordered() {
    for (std::size_t i = 0; i < query_catalog.size(); ++i) {
        if (static_cast<std::size_t>(query_catalog[i].id) != i) {
            return false;
        }
    }
    return true;
}
static_assert(catalog_is_ordered(), "query_catalog must follow query_id order");

const std::unordered_map<std::string_view, query_id>& name_index() {
    static const auto index = [] {
        std::unordered_map<std::string_view, query_id> m;
        for (const auto& d : query_catalog) {
            m.emplace(d.name, d.id);
        }
        return m;
    }();
    return index;
}

} // namespace

std::optional<query_id> find_query(std::string_view name) {
    const auto& index = name_index();
    auto it = index.find(name);
    if (it == index.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace kcenon::topology
