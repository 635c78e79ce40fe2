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


#include "./environment.h"

#include <cstddef>
#include <filesystem>  // NOLINT
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <vector>

#include "absl/flags/flag.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/time/time.h"
#include "./command.h"
#include "./logging.h"

ABSL_FLAG(std::string, opt_path, "opt",
          "The LLVM `opt` binary used to dump call graphs. "
          "Looked up in $PATH unless it contains a '/'.");
ABSL_FLAG(size_t, extraction_attempts, 5,
          "How many times call graph extraction is attempted for a module "
          "before the step fails. Must be >= 1.");
ABSL_FLAG(size_t, extraction_backoff_ms, 500,
          "Wait this many milliseconds before retrying a failed extraction. "
          "Doubles after every failed attempt.");
ABSL_FLAG(std::string, aggregation, "harmonic",
          "How distances to several targets are combined: "
          "'harmonic' (harmonic mean) or 'min' (nearest target).");
ABSL_FLAG(bool, directed_callgraph, false,
          "If true, a function only reaches the targets it can call, "
          "directly or transitively. If false, call edges are followed in "
          "both directions.");
ABSL_FLAG(bool, directed_cfg, false,
          "If true, a basic block only reaches the blocks that can execute "
          "after it. If false, control-flow edges are followed in both "
          "directions.");
ABSL_FLAG(double, call_site_offset, 1.0,
          "Cost of a call: a block that calls a function at call graph "
          "distance d is at distance d + call_site_offset. Must be >= 0.");
ABSL_FLAG(size_t, log_tail_lines, 30,
          "How many lines of the step log are printed when a step fails.");

namespace distgen {

Environment::Environment(const std::vector<std::string> &argv)
    : opt_path(absl::GetFlag(FLAGS_opt_path)),
      extraction_attempts(absl::GetFlag(FLAGS_extraction_attempts)),
      extraction_backoff_ms(absl::GetFlag(FLAGS_extraction_backoff_ms)),
      aggregation(absl::GetFlag(FLAGS_aggregation)),
      directed_callgraph(absl::GetFlag(FLAGS_directed_callgraph)),
      directed_cfg(absl::GetFlag(FLAGS_directed_cfg)),
      call_site_offset(absl::GetFlag(FLAGS_call_site_offset)),
      log_tail_lines(absl::GetFlag(FLAGS_log_tail_lines)),
      exec_name(argv.empty() ? "distgen" : argv[0]),
      args(argv.size() > 1 ? argv.begin() + 1 : argv.end(), argv.end()) {
  if (args.size() > 0) binaries_dir = args[0];
  if (args.size() > 1) temp_dir = args[1];
  if (args.size() > 2) fuzzer_name = args[2];
  std::vector<std::string> words{ShellQuote(exec_name)};
  for (const auto &arg : args) words.push_back(ShellQuote(arg));
  command_line = absl::StrJoin(words, " ");
}

RetryPolicy Environment::extraction_retry_policy() const {
  CHECK_GE(extraction_attempts, 1);
  return {static_cast<int>(extraction_attempts),
          absl::Milliseconds(extraction_backoff_ms)};
}

std::string Environment::MakeTempFilePath(absl::string_view file_name) const {
  return std::filesystem::path(temp_dir).append(std::string{file_name});
}

std::string Environment::MakeDotFilesDirPath() const {
  return MakeTempFilePath("dot-files");
}

std::string Environment::MakeCallGraphDumpPrefix(
    absl::string_view module) const {
  return std::filesystem::path(MakeDotFilesDirPath()).append(std::string{module});
}

std::string Environment::MakeModuleCallGraphPath(
    absl::string_view module) const {
  return std::filesystem::path(MakeDotFilesDirPath())
      .append(absl::StrCat("callgraph.", module, ".dot"));
}

std::string Environment::MakeCallGraphPath() const {
  return std::filesystem::path(MakeDotFilesDirPath()).append("callgraph.dot");
}

std::string Environment::MakeCallGraphDistancePath() const {
  return MakeTempFilePath("distance.callgraph.txt");
}

std::string Environment::MakeCfgDistancePath() const {
  return MakeTempFilePath("distance.cfg.txt");
}

std::string Environment::MakeStatePath() const {
  return MakeTempFilePath("state");
}

std::string Environment::MakeStepLogPath(int step) const {
  return MakeTempFilePath(absl::StrCat("step", step, ".log"));
}

}  // namespace distgen
