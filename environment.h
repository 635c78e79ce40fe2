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


#ifndef THIRD_PARTY_DISTGEN_ENVIRONMENT_H_
#define THIRD_PARTY_DISTGEN_ENVIRONMENT_H_

#include <cstddef>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <vector>

#include "./command.h"
#include "./distance.h"

namespace distgen {

// Run configuration that is initialized at startup and doesn't change.
// Data fields are copied from the FLAGS defined in environment.cc,
// or derived from them. See FLAGS descriptions for comments.
// Users or tests can override any of the non-const fields after the object
// is constructed, but before it is passed to DistgenMain.
struct Environment {
  // `argv` are the positional arguments left after flag parsing, starting
  // with the program name: <binaries-dir> <temp-dir> [fuzzer-name].
  explicit Environment(const std::vector<std::string> &argv = {});

  std::string opt_path;
  size_t extraction_attempts;
  size_t extraction_backoff_ms;
  std::string aggregation;
  bool directed_callgraph;
  bool directed_cfg;
  double call_site_offset;
  size_t log_tail_lines;

  std::string exec_name;          // copied from argv[0]
  std::vector<std::string> args;  // copied from argv[1:].

  // Positional arguments, from `args`.
  std::string binaries_dir;
  std::string temp_dir;
  std::string fuzzer_name;  // Empty: all modules.

  // The command line that restarts this run, printed on failure.
  // Defaults to `exec_name` and `args`; main() sets it to the full argv.
  std::string command_line;

  RetryPolicy extraction_retry_policy() const;
  Reachability callgraph_reachability() const {
    return directed_callgraph ? Reachability::kDirected
                              : Reachability::kUndirected;
  }
  Reachability cfg_reachability() const {
    return directed_cfg ? Reachability::kDirected : Reachability::kUndirected;
  }

  // Paths inside `temp_dir`.
  std::string MakeTempFilePath(absl::string_view file_name) const;
  // The directory with the graph dumps.
  std::string MakeDotFilesDirPath() const;
  // Where `opt` writes the call graph of `module`, minus ".callgraph.dot".
  std::string MakeCallGraphDumpPrefix(absl::string_view module) const;
  // The canonical call graph of `module`.
  std::string MakeModuleCallGraphPath(absl::string_view module) const;
  // The canonical whole-program call graph.
  std::string MakeCallGraphPath() const;
  std::string MakeCallGraphDistancePath() const;
  std::string MakeCfgDistancePath() const;
  std::string MakeStatePath() const;
  std::string MakeStepLogPath(int step) const;
};

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_ENVIRONMENT_H_
