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


#include "./pipeline.h"

#include <signal.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>  // NOLINT
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <system_error>  // NOLINT
#include <vector>

#include "absl/base/internal/raw_logging.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "./call_graph_merger.h"
#include "./cfg_distance.h"
#include "./checkpoint.h"
#include "./defs.h"
#include "./distance.h"
#include "./environment.h"
#include "./inputs.h"
#include "./logging.h"
#include "./util.h"

namespace distgen {

namespace {

// Sets signal handler for SIGINT.
void SetSignalHandlers() {
  struct sigaction sigact = {};
  sigact.sa_handler = [](int) {
    ABSL_RAW_LOG(INFO, "SIGINT caught; cleaning up\n");
    RequestEarlyExit(EXIT_FAILURE);
  };
  sigaction(SIGINT, &sigact, nullptr);
}

// Input lists in the temp dir.
inline constexpr absl::string_view kFunctionNames = "Fnames.txt";
inline constexpr absl::string_view kFunctionTargets = "Ftargets.txt";
inline constexpr absl::string_view kBlockNames = "BBnames.txt";
inline constexpr absl::string_view kBlockTargets = "BBtargets.txt";
inline constexpr absl::string_view kBlockCalls = "BBcalls.txt";
inline constexpr absl::string_view kInstrumentedFuncs = "instrumented_funcs.txt";

struct Step {
  int number;
  absl::string_view name;
};
inline constexpr Step kCallGraphStep = {1, "callgraph-distance"};
inline constexpr Step kCfgStep = {2, "cfg-distance"};

int UsageError(std::ostream &out, absl::string_view message) {
  out << message << "\n" << kUsage << "\n";
  return EXIT_FAILURE;
}

// Prints the failure report of `step` and returns the exit code.
int ReportStepFailure(const Environment &env, const Step &step,
                      std::ostream &out) {
  out << TailOfLocalFile(env.MakeStepLogPath(step.number),
                         env.log_tail_lines)
      << "\n";
  out << "-- Problem in Step " << step.number
      << " of generating distance info!\n";
  out << "-- You can resume by executing:\n";
  out << "$ " << env.command_line << "\n";
  return EXIT_FAILURE;
}

// Runs `step` with `body` unless the checkpoint says it is done and its
// output is still there. Returns false if the step failed.
// Once a step runs, the steps after it run too.
template <typename Body>
bool RunStep(const Environment &env, const Step &step, int &resume_step,
             absl::string_view inputs_hash, absl::string_view output_path,
             std::ostream &out, Body body) {
  if (resume_step >= step.number && LocalFileIsNonEmpty(output_path)) {
    out << "(" << step.number << ") Skipping " << step.name
        << ": already done\n";
    return true;
  }
  out << "(" << step.number << ") Running " << step.name << "\n";
  absl::Status status;
  {
    StepLog log(env.MakeStepLogPath(step.number));
    status = body(log.stream());
    if (status.ok() && EarlyExitRequested()) {
      status = absl::CancelledError("Early exit requested");
    }
    if (!status.ok()) log.stream() << status << "\n";
  }
  if (!status.ok()) {
    LOG(ERROR) << "Step " << step.number << " (" << step.name
               << ") failed: " << status;
    return false;
  }
  SaveCheckpoint(env.MakeStatePath(),
                 {step.number, std::string(step.name),
                  std::string(inputs_hash)});
  resume_step = step.number;
  return true;
}

}  // namespace

StepLog::StepLog(absl::string_view path)
    : file_(std::string(path), std::ios::out | std::ios::trunc) {
  CHECK(file_.good()) << "Can not open step log " << path;
}

GraphSource GraphSourceOf(const Environment &env) {
  if (env.fuzzer_name.empty()) return WholeProgram{};
  return SingleFuzzer{env.fuzzer_name};
}

std::string HashRunInputs(const Environment &env, const GraphSource &source,
                          const std::vector<Module> &modules) {
  std::string inputs = absl::StrCat(
      "source=", GraphSourceToString(source), "\n",
      "aggregation=", env.aggregation, "\n",
      "directed_callgraph=", env.directed_callgraph ? "1" : "0", "\n",
      "directed_cfg=", env.directed_cfg ? "1" : "0", "\n",
      "call_site_offset=", env.call_site_offset, "\n");
  for (const auto &module : modules) {
    absl::StrAppend(&inputs, "module=", module.name, ",",
                    HashOfFileContents(module.bitcode_path), "\n");
  }
  // CFG dumps, by file name.
  std::vector<std::filesystem::path> cfg_paths;
  std::error_code error;
  for (const auto &entry : std::filesystem::directory_iterator(
           env.MakeDotFilesDirPath(), error)) {
    if (entry.is_regular_file() &&
        !FunctionNameOfCfgFile(entry.path().filename().string()).empty()) {
      cfg_paths.push_back(entry.path());
    }
  }
  std::sort(cfg_paths.begin(), cfg_paths.end());
  for (const auto &cfg_path : cfg_paths) {
    absl::StrAppend(&inputs, "cfg=", cfg_path.filename().string(), ",",
                    HashOfFileContents(cfg_path.string()), "\n");
  }
  for (absl::string_view list : {kFunctionNames, kFunctionTargets, kBlockNames,
                                kBlockTargets, kBlockCalls,
                                kInstrumentedFuncs}) {
    const std::string path = env.MakeTempFilePath(list);
    absl::StrAppend(&inputs, list, "=",
                    std::filesystem::exists(path) ? HashOfFileContents(path)
                                                  : "none",
                    "\n");
  }
  return Hash(inputs);
}

absl::Status ComputeCallGraphDistanceStep(const Environment &env,
                                          const std::vector<Module> &modules,
                                          std::ostream &log) {
  const auto function_names =
      ReadNameList(env.MakeTempFilePath(kFunctionNames));
  if (!function_names.ok()) return function_names.status();
  const auto function_targets =
      ReadNameList(env.MakeTempFilePath(kFunctionTargets));
  if (!function_targets.ok()) return function_targets.status();
  auto aggregator = CreateDistanceAggregator(env.aggregation);
  if (!aggregator.ok()) return aggregator.status();

  const auto call_graph = BuildProgramCallGraph(modules, env, log);
  if (!call_graph.ok()) return call_graph.status();

  log << "Computing distance for call graph: " << function_names->size()
      << " functions, " << function_targets->size() << " targets\n";
  const auto rows = ComputeCallGraphDistances(
      *call_graph, *function_names, *function_targets,
      env.callgraph_reachability(), **aggregator);
  if (!rows.ok()) return rows.status();
  WriteToLocalFile(env.MakeCallGraphDistancePath(), FormatDistanceRows(*rows));
  log << "Wrote " << rows->size() << " function distances to "
      << env.MakeCallGraphDistancePath() << "\n";
  if (!LocalFileIsNonEmpty(env.MakeCallGraphDistancePath())) {
    return absl::InternalError(
        absl::StrCat("Empty output: ", env.MakeCallGraphDistancePath()));
  }
  return absl::OkStatus();
}

absl::Status ComputeCfgDistanceStep(const Environment &env,
                                    std::ostream &log) {
  std::string text;
  ReadFromLocalFile(env.MakeCallGraphDistancePath(), text);
  const auto function_distances = ParseDistanceFile(text);
  if (!function_distances.ok()) return function_distances.status();
  if (function_distances->empty()) {
    return absl::FailedPreconditionError(
        absl::StrCat("No function distances in ",
                     env.MakeCallGraphDistancePath()));
  }
  const auto block_names = ReadNameList(env.MakeTempFilePath(kBlockNames));
  if (!block_names.ok()) return block_names.status();
  const auto block_targets = ReadNameList(env.MakeTempFilePath(kBlockTargets));
  if (!block_targets.ok()) return block_targets.status();
  const std::string block_calls_path = env.MakeTempFilePath(kBlockCalls);
  if (!std::filesystem::exists(block_calls_path)) {
    return absl::NotFoundError(absl::StrCat("No such file: ", block_calls_path));
  }
  ReadFromLocalFile(block_calls_path, text);
  const BlockCalls block_calls = ParseBlockCalls(text);
  if (block_calls.num_malformed != 0) {
    log << "Ignored " << block_calls.num_malformed << " malformed rows in "
        << block_calls_path << "\n";
    LOG(WARNING) << "Ignored " << block_calls.num_malformed
                 << " malformed rows in " << block_calls_path;
  }
  const auto whitelist =
      ReadOptionalNameSet(env.MakeTempFilePath(kInstrumentedFuncs));
  if (whitelist.has_value()) {
    log << "Restricting to the " << whitelist->size() << " functions in "
        << kInstrumentedFuncs << "\n";
  }
  auto aggregator = CreateDistanceAggregator(env.aggregation);
  if (!aggregator.ok()) return aggregator.status();

  const CfgDistanceCalculator calculator(
      *block_names, *block_targets, block_calls.calls, *function_distances,
      {env.cfg_reachability(), env.call_site_offset}, **aggregator);
  log << "Computing distance for control-flow graphs: "
      << calculator.num_call_sites() << " call sites\n";
  const CfgDistanceStats stats =
      ComputeCfgDistanceFiles(env.MakeDotFilesDirPath(), calculator, whitelist,
                              env.MakeCfgDistancePath(), log);
  log << "Processed " << stats.num_functions << " CFGs: " << stats.num_skipped
      << " skipped, " << stats.num_failed << " failed, " << stats.num_rows
      << " block distances\n";
  if (stats.num_functions == 0) {
    LOG(WARNING) << "No CFG dumps in " << env.MakeDotFilesDirPath();
  }
  return absl::OkStatus();
}

int RunPipeline(const Environment &original_env, std::ostream &out) {
  if (original_env.args.size() != 2 && original_env.args.size() != 3) {
    return UsageError(out, "Wrong number of arguments");
  }
  if (original_env.args.size() == 3 && original_env.args[2].empty()) {
    return UsageError(out, "Empty fuzzer name");
  }
  Environment env = original_env;
  std::error_code error;
  if (!std::filesystem::is_directory(env.binaries_dir, error)) {
    return UsageError(out, absl::StrCat("No directory: ", env.binaries_dir));
  }
  if (!std::filesystem::is_directory(env.temp_dir, error)) {
    return UsageError(out, absl::StrCat("No directory: ", env.temp_dir));
  }
  env.binaries_dir =
      std::filesystem::canonical(env.binaries_dir, error).string();
  env.temp_dir = std::filesystem::canonical(env.temp_dir, error).string();
  if (error) {
    return UsageError(out, absl::StrCat("Can not resolve directories: ",
                                        error.message()));
  }
  if (const auto aggregator = CreateDistanceAggregator(env.aggregation);
      !aggregator.ok()) {
    return UsageError(out, aggregator.status().message());
  }
  if (env.extraction_attempts < 1) {
    return UsageError(out, "--extraction_attempts must be >= 1");
  }
  if (!(env.call_site_offset >= 0)) {
    return UsageError(out, "--call_site_offset must be >= 0");
  }

  const GraphSource source = GraphSourceOf(env);
  const auto all_modules = FindModules(env.binaries_dir);
  if (!all_modules.ok()) {
    return UsageError(out, all_modules.status().message());
  }
  const auto modules = SelectModules(*all_modules, source);
  if (!modules.ok()) return UsageError(out, modules.status().message());

  const std::string opt = FindExecutable(env.opt_path);
  if (opt.empty()) {
    out << "Couldn't find the call graph extraction tool '" << env.opt_path
        << "'; install LLVM or set --opt_path\n";
    return EXIT_FAILURE;
  }
  env.opt_path = opt;
  std::filesystem::create_directories(env.MakeDotFilesDirPath(), error);
  if (error) {
    out << "Can not create " << env.MakeDotFilesDirPath() << ": "
        << error.message() << "\n";
    return EXIT_FAILURE;
  }
  LOG(INFO) << "Generating distances for " << GraphSourceToString(source)
            << ": " << modules->size() << " module(s) in " << env.binaries_dir;

  const std::string inputs_hash = HashRunInputs(env, source, *modules);
  int resume_step = LoadResumeStep(env.MakeStatePath(), inputs_hash);

  if (!RunStep(env, kCallGraphStep, resume_step, inputs_hash,
               env.MakeCallGraphDistancePath(), out,
               [&](std::ostream &log) {
                 return ComputeCallGraphDistanceStep(env, *modules, log);
               })) {
    return ReportStepFailure(env, kCallGraphStep, out);
  }
  if (!RunStep(env, kCfgStep, resume_step, inputs_hash,
               env.MakeCfgDistancePath(), out, [&](std::ostream &log) {
                 return ComputeCfgDistanceStep(env, log);
               })) {
    return ReportStepFailure(env, kCfgStep, out);
  }

  const std::string distance_flag =
      absl::StrCat("-distance=", env.MakeCfgDistancePath());
  out << "\n----------[DONE]----------\n\n"
      << "Now, you may wish to compile your sources with\n"
      << "CFLAGS=\"$CFLAGS " << distance_flag << "\"\n"
      << "CXXFLAGS=\"$CXXFLAGS " << distance_flag << "\"\n\n"
      << "--------------------------\n";
  return EXIT_SUCCESS;
}

int DistgenMain(const Environment &env) {
  SetSignalHandlers();
  return RunPipeline(env, std::cout);
}

}  // namespace distgen
