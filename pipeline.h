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


// The two-step distance generation pipeline:
//   Step 1, "callgraph-distance": extract and merge the call graphs, then
//     compute function distances into distance.callgraph.txt.
//   Step 2, "cfg-distance": compute basic block distances for every
//     dot-files/cfg.<function>.dot into distance.cfg.txt.
// Completed steps are checkpointed in <temp-dir>/state, so that a failed run
// can be resumed with the same command line.

#ifndef THIRD_PARTY_DISTGEN_PIPELINE_H_
#define THIRD_PARTY_DISTGEN_PIPELINE_H_

#include <fstream>
#include <ostream>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "./call_graph_merger.h"
#include "./environment.h"

namespace distgen {

inline constexpr absl::string_view kUsage =
    "Usage: distgen [flags] <binaries-directory> <temporary-directory> "
    "[fuzzer-name]";

// The diagnostics of one step, in <temp-dir>/step<N>.log.
// The file is truncated when the StepLog is created.
class StepLog {
 public:
  explicit StepLog(absl::string_view path);
  std::ostream &stream() { return file_; }

 private:
  std::ofstream file_;
};

// Returns the graph source selected by the positional arguments of `env`.
GraphSource GraphSourceOf(const Environment &env);

// Returns a hash of everything a run's output depends on: the graph source,
// `modules` and their bitcode, the input lists in env.temp_dir, the CFG dumps
// and the distance flags.
std::string HashRunInputs(const Environment &env, const GraphSource &source,
                          const std::vector<Module> &modules);

// Step 1. Writes env.MakeCallGraphDistancePath().
absl::Status ComputeCallGraphDistanceStep(const Environment &env,
                                          const std::vector<Module> &modules,
                                          std::ostream &log);

// Step 2. Reads the output of step 1, writes env.MakeCfgDistancePath().
absl::Status ComputeCfgDistanceStep(const Environment &env, std::ostream &log);

// Runs the pipeline for `env`, resuming after the last checkpointed step.
// Prints the progress, the failure report or the final instructions to
// `out`. Returns EXIT_SUCCESS on success, EXIT_FAILURE otherwise.
int RunPipeline(const Environment &env, std::ostream &out);

// The main entry point: installs the SIGINT handler and calls RunPipeline()
// with std::cout.
int DistgenMain(const Environment &env);

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_PIPELINE_H_
