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


// Chooses the functions worth instrumenting for a directed run: the ones on
// the way from the entry function to the targets, and the ones that have to
// run before a target is called. The result, instrumented_funcs.txt, limits
// which CFGs get block distances.

#ifndef THIRD_PARTY_DISTGEN_INSTRUMENTATION_SET_H_
#define THIRD_PARTY_DISTGEN_INSTRUMENTATION_SET_H_

#include <cstddef>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"

namespace distgen {

// `callee` is called from source line `line` of the caller.
struct CallSite {
  std::string callee;
  int line;
};

// Caller => call sites, in file order.
struct CallSiteTable {
  absl::flat_hash_map<std::string, std::vector<CallSite>> call_sites;
  // Callers in first-seen order.
  std::vector<std::string> callers;
  size_t num_malformed = 0;

  const std::vector<CallSite> &CallSitesOf(absl::string_view caller) const;
};

// Parses call_graph.txt: one "caller,callee:line" per line. Other lines are
// logged and counted as malformed.
CallSiteTable ParseCallSites(absl::string_view text);

// Returns the first call path from `entry` to `target` found by a depth-first
// search that tries callees in file order, both ends included.
// Returns an empty path if `target` is not reachable.
std::vector<std::string> FindCallPath(const CallSiteTable &table,
                                      absl::string_view entry,
                                      absl::string_view target);

// Returns the callees that any caller of `target` calls on a line before one
// of its calls to `target`.
absl::flat_hash_set<std::string> PrecedingCallees(const CallSiteTable &table,
                                                  absl::string_view target);

// Returns `functions` and everything they call, directly or transitively.
absl::flat_hash_set<std::string> TransitiveCallees(
    const CallSiteTable &table, const absl::flat_hash_set<std::string> &functions);

// Returns the sorted union, over `targets`, of the call path from `entry`,
// the preceding callees and their transitive callees.
std::vector<std::string> ComputeInstrumentationSet(
    const CallSiteTable &table, absl::string_view entry,
    const std::vector<std::string> &targets);

// Reads call_graph.txt, target_funcs.txt and entry_func.txt from `temp_dir`,
// writes instrumented_funcs.txt there.
// Returns NotFoundError if an input file is missing,
// InvalidArgumentError if entry_func.txt names no function.
absl::Status WriteInstrumentationSet(absl::string_view temp_dir);

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_INSTRUMENTATION_SET_H_
