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


#include "./call_graph_merger.h"

#include <algorithm>
#include <filesystem>  // NOLINT
#include <ostream>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <system_error>  // NOLINT
#include <utility>
#include <variant>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "./command.h"
#include "./dot_parser.h"
#include "./environment.h"
#include "./graph.h"
#include "./logging.h"
#include "./util.h"

namespace distgen {
namespace {

// Returns the module name of a bitcode file name, or "" if `file_name` is not
// "<name>.0.0.<anything>.bc".
std::string ModuleNameOfBitcodeFile(absl::string_view file_name) {
  if (!absl::EndsWith(file_name, ".bc")) return "";
  std::vector<absl::string_view> fields = absl::StrSplit(file_name, '.');
  if (fields.size() < 5) return "";
  const size_t name_fields = fields.size() - 4;
  if (fields[name_fields] != "0" || fields[name_fields + 1] != "0") return "";
  return absl::StrJoin(fields.begin(), fields.begin() + name_fields, ".");
}

}  // namespace

absl::StatusOr<std::vector<Module>> FindModules(absl::string_view binaries_dir) {
  std::error_code error;
  if (!std::filesystem::is_directory(std::string{binaries_dir}, error)) {
    return absl::NotFoundError(absl::StrCat("No directory: ", binaries_dir));
  }
  std::vector<Module> modules;
  for (const auto &entry :
       std::filesystem::directory_iterator(std::string{binaries_dir}, error)) {
    const std::string name =
        ModuleNameOfBitcodeFile(entry.path().filename().string());
    if (name.empty()) continue;
    modules.push_back({name, entry.path().string()});
  }
  if (error) {
    return absl::NotFoundError(absl::StrCat("Can not list ", binaries_dir,
                                            ": ", error.message()));
  }
  if (modules.empty()) {
    return absl::InvalidArgumentError(absl::StrCat(
        "Couldn't find any binaries in folder ", binaries_dir));
  }
  std::sort(modules.begin(), modules.end(),
            [](const Module &a, const Module &b) {
              if (a.name != b.name) return a.name < b.name;
              return a.bitcode_path < b.bitcode_path;
            });
  return modules;
}

std::string GraphSourceToString(const GraphSource &source) {
  if (const auto *fuzzer = std::get_if<SingleFuzzer>(&source)) {
    return absl::StrCat("fuzzer ", fuzzer->name);
  }
  return "all modules";
}

absl::StatusOr<std::vector<Module>> SelectModules(
    const std::vector<Module> &modules, const GraphSource &source) {
  if (const auto *fuzzer = std::get_if<SingleFuzzer>(&source)) {
    std::vector<Module> selected;
    for (const auto &module : modules) {
      if (module.name == fuzzer->name) selected.push_back(module);
    }
    if (selected.size() != 1) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Couldn't find bytecode for fuzzer ", fuzzer->name, ": ",
          selected.size(), " matching files"));
    }
    return selected;
  }
  // `modules` is sorted by name.
  for (size_t i = 1; i < modules.size(); ++i) {
    if (modules[i].name == modules[i - 1].name) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Ambiguous bytecode for ", modules[i].name, ": ",
          modules[i - 1].bitcode_path, " and ", modules[i].bitcode_path));
    }
  }
  return modules;
}

Graph MergeCallGraphs(const std::vector<Graph> &graphs) {
  Graph merged;
  for (const auto &graph : graphs) merged.Merge(graph);
  return merged;
}

absl::StatusOr<Graph> ExtractCallGraph(const Module &module,
                                       const Environment &env,
                                       std::ostream &log) {
  const std::string prefix = env.MakeCallGraphDumpPrefix(module.name);
  const std::string raw_dump_path = absl::StrCat(prefix, ".callgraph.dot");
  const std::string tool_log_path = absl::StrCat(prefix, ".opt.log");
  log << "Constructing CG for " << module.name << " from "
      << module.bitcode_path << "\n";
  Command cmd(env.opt_path,
              {"-dot-callgraph", module.bitcode_path,
               "-callgraph-dot-filename-prefix", prefix},
              /*env=*/{}, /*out=*/"/dev/null", /*err=*/tool_log_path);
  const absl::Status status =
      ExecuteWithRetries(cmd, env.extraction_retry_policy());
  std::string tool_log;
  ReadFromLocalFile(tool_log_path, tool_log);
  log << tool_log;
  std::error_code error;
  std::filesystem::remove(tool_log_path, error);
  if (!status.ok()) return status;

  auto graph = ReadDotGraphFile(raw_dump_path);
  if (!graph.ok()) return graph.status();
  WriteToLocalFile(env.MakeModuleCallGraphPath(module.name),
                   graph->ToDot(absl::StrCat("Call graph: ", module.name)));
  std::filesystem::remove(raw_dump_path, error);
  log << "Call graph of " << module.name << ": " << graph->num_nodes()
      << " functions, " << graph->num_edges() << " calls\n";
  return graph;
}

absl::StatusOr<Graph> BuildProgramCallGraph(const std::vector<Module> &modules,
                                            const Environment &env,
                                            std::ostream &log) {
  std::vector<Graph> graphs;
  size_t total_edges = 0;
  for (const auto &module : modules) {
    if (EarlyExitRequested()) {
      return absl::CancelledError("Early exit requested");
    }
    auto graph = ExtractCallGraph(module, env, log);
    if (!graph.ok()) return graph.status();
    total_edges += graph->num_edges();
    graphs.push_back(*std::move(graph));
  }
  Graph merged = MergeCallGraphs(graphs);
  CHECK_LE(merged.num_edges(), total_edges);
  if (modules.size() > 1) {
    log << "Integrated " << modules.size() << " call graphs into one: "
        << merged.num_nodes() << " functions, " << merged.num_edges()
        << " calls\n";
  }
  WriteToLocalFile(env.MakeCallGraphPath(), merged.ToDot("Call graph"));
  return merged;
}

}  // namespace distgen
