// Copyright 2026 The Distgen Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef THIRD_PARTY_DISTGEN_DEFS_H_
#define THIRD_PARTY_DISTGEN_DEFS_H_

// Only simple definitions here. Minimal code, no dependencies.

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace distgen {

// Index of a node inside one Graph. Indices are dense, [0, num_nodes).
using NodeIndex = uint32_t;

// One row of a distance file: {node name, distance}.
// A distance is non-negative; targets have distance 0.
using DistanceRow = std::pair<std::string, double>;

// Rows in output order. A node with undefined distance has no row.
using DistanceRows = std::vector<DistanceRow>;

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_DEFS_H_
