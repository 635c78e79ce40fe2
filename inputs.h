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

// Plain-text files exchanged with the instrumentation pass and the fuzzer:
// name lists (Fnames.txt, Ftargets.txt, BBnames.txt, BBtargets.txt,
// instrumented_funcs.txt), block-to-callee rows (BBcalls.txt), and distance
// files (distance.callgraph.txt, distance.cfg.txt).

#ifndef THIRD_PARTY_DISTGEN_INPUTS_H_
#define THIRD_PARTY_DISTGEN_INPUTS_H_

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/statusor.h"
#include "./defs.h"

namespace distgen {

// One line per name. Lines are trimmed, empty lines are skipped, and a
// repeated name keeps its first position.
std::vector<std::string> ParseNameList(absl::string_view text);

// Reads a required name list. Returns NotFoundError if `path` is missing.
absl::StatusOr<std::vector<std::string>> ReadNameList(absl::string_view path);

// Reads an optional name set, e.g. instrumented_funcs.txt.
// Returns std::nullopt if `path` does not exist.
std::optional<absl::flat_hash_set<std::string>> ReadOptionalNameSet(
    absl::string_view path);

// A BBcalls.txt row: basic block `block` calls function `callee`.
struct BlockCall {
  std::string block;
  std::string callee;
};

struct BlockCalls {
  std::vector<BlockCall> calls;
  // Rows that did not have exactly 2 or 3 comma-separated fields.
  size_t num_malformed = 0;
};

// Parses BBcalls.txt: "block,callee[,extra]" per line. The optional third
// field is ignored. Other rows are counted as malformed and dropped.
BlockCalls ParseBlockCalls(absl::string_view text);

// Name => distance, as read back from a distance file.
using DistanceMap = absl::flat_hash_map<std::string, double>;

// Formats `rows` as "name,distance" lines.
std::string FormatDistanceRows(const DistanceRows &rows);

// Parses "name,distance" lines. A name may contain commas; the distance is
// everything after the last one. Returns InvalidArgumentError on a row
// without a comma or with a distance that is not a non-negative number.
absl::StatusOr<DistanceMap> ParseDistanceFile(absl::string_view text);

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_INPUTS_H_
