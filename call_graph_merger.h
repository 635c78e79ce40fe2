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


// Builds the whole-program call graph from the per-module bitcode files that
// the instrumenting compiler left in the binaries directory.

#ifndef THIRD_PARTY_DISTGEN_CALL_GRAPH_MERGER_H_
#define THIRD_PARTY_DISTGEN_CALL_GRAPH_MERGER_H_

#include <ostream>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <variant>
#include <vector>

#include "absl/status/statusor.h"
#include "./environment.h"
#include "./graph.h"

namespace distgen {

// One bitcode file "<name>.0.0.<anything>.bc".
struct Module {
  std::string name;
  std::string bitcode_path;
};

// Returns the modules found directly in `binaries_dir`, sorted by name.
// Returns NotFoundError if `binaries_dir` is not a directory,
// InvalidArgumentError if it has no bitcode files.
absl::StatusOr<std::vector<Module>> FindModules(absl::string_view binaries_dir);

// Which modules make up the program.
struct WholeProgram {};
struct SingleFuzzer {
  std::string name;
};
using GraphSource = std::variant<WholeProgram, SingleFuzzer>;

// "all modules" or "fuzzer <name>".
std::string GraphSourceToString(const GraphSource &source);

// Returns the modules of `source`: all of `modules` for WholeProgram, the one
// module called `name` for SingleFuzzer. Returns InvalidArgumentError if a
// fuzzer name matches zero or several modules, or if two modules share a
// name.
absl::StatusOr<std::vector<Module>> SelectModules(
    const std::vector<Module> &modules, const GraphSource &source);

// Returns the union of `graphs`: nodes with the same name are one node,
// edges present in several graphs are one edge.
Graph MergeCallGraphs(const std::vector<Graph> &graphs);

// Dumps the call graph of `module` with `env.opt_path`, retrying per
// `env.extraction_retry_policy()`, and canonicalizes it. Writes the canonical
// graph to env.MakeModuleCallGraphPath() and removes the raw dump.
// The tool's diagnostics are copied to `log`.
absl::StatusOr<Graph> ExtractCallGraph(const Module &module,
                                       const Environment &env,
                                       std::ostream &log);

// Extracts the call graphs of `modules`, in order, merges them and writes the
// result to env.MakeCallGraphPath().
absl::StatusOr<Graph> BuildProgramCallGraph(const std::vector<Module> &modules,
                                            const Environment &env,
                                            std::ostream &log);

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_CALL_GRAPH_MERGER_H_
