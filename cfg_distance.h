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

// Basic-block level distances, one control-flow graph at a time.
//
// Inside a function, a block is close to the targets if it is close to a
// target block of the same function, or close to a block that calls a
// function which is close to the targets on the call graph. The latter blocks
// are "call sites": they act as extra targets whose own distance is the
// distance of the callee plus the cost of the call.

#ifndef THIRD_PARTY_DISTGEN_CFG_DISTANCE_H_
#define THIRD_PARTY_DISTGEN_CFG_DISTANCE_H_

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "./defs.h"
#include "./distance.h"
#include "./graph.h"
#include "./inputs.h"

namespace distgen {

struct CfgDistanceOptions {
  Reachability reachability = Reachability::kUndirected;
  // Added to the callee distance at every call site.
  double call_site_offset = 1.0;
};

// Computes distances for any number of CFGs, sharing the per-run inputs.
// `aggregator` must outlive the object.
class CfgDistanceCalculator {
 public:
  // `block_names`: all instrumented blocks, in output order.
  // `block_targets`: target blocks.
  // `block_calls`: which blocks call which functions.
  // `function_distances`: call graph distances.
  CfgDistanceCalculator(const std::vector<std::string> &block_names,
                        const std::vector<std::string> &block_targets,
                        const std::vector<BlockCall> &block_calls,
                        const DistanceMap &function_distances,
                        const CfgDistanceOptions &options,
                        const DistanceAggregator &aggregator);

  // Returns one row per block of `cfg` that is in `block_names`, ordered as
  // in `block_names`. Target blocks get 0. Other blocks aggregate their hop
  // count to every reachable target block and, for every reachable call
  // site, the hop count plus the call site offset. Blocks with nothing
  // reachable get no row.
  DistanceRows Compute(const Graph &cfg) const;

  // Returns the call site offset of `block`, if it calls any function with
  // a known distance.
  std::optional<double> CallSiteOffset(absl::string_view block) const;

  size_t num_call_sites() const { return call_site_offsets_.size(); }

 private:
  // Position of a block in `block_names`.
  absl::flat_hash_map<std::string, size_t> block_order_;
  absl::flat_hash_set<std::string> block_targets_;
  // min(callee distance) + call_site_offset, per calling block.
  absl::flat_hash_map<std::string, double> call_site_offsets_;
  Reachability reachability_;
  const DistanceAggregator &aggregator_;
};

// Returns the function name of a CFG dump file "cfg.<function>.dot",
// or "" if `file_name` does not have this form.
std::string FunctionNameOfCfgFile(absl::string_view file_name);

struct CfgDistanceStats {
  size_t num_functions = 0;  // CFG files found.
  size_t num_skipped = 0;    // Not in the whitelist.
  size_t num_failed = 0;     // Could not be parsed.
  size_t num_rows = 0;       // Rows written to the output file.
};

// Processes every "cfg.<function>.dot" in `dot_files_dir`, in sorted file
// name order:
//   * skips the function if `whitelist` is set and does not contain it;
//   * writes the rows of the function to "<cfg file>.distances.txt";
//   * a CFG that fails to parse is reported to `log` and skipped.
// Then writes all rows, in the same order, to `output_path`.
CfgDistanceStats ComputeCfgDistanceFiles(
    absl::string_view dot_files_dir, const CfgDistanceCalculator &calculator,
    const std::optional<absl::flat_hash_set<std::string>> &whitelist,
    absl::string_view output_path, std::ostream &log);

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_CFG_DISTANCE_H_
