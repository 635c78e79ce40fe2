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


#include "./instrumentation_set.h"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <filesystem>  // NOLINT
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "./inputs.h"
#include "./logging.h"
#include "./util.h"

namespace distgen {

const std::vector<CallSite> &CallSiteTable::CallSitesOf(
    absl::string_view caller) const {
  static const auto *kNoCallSites = new std::vector<CallSite>();
  auto it = call_sites.find(caller);
  return it == call_sites.end() ? *kNoCallSites : it->second;
}

CallSiteTable ParseCallSites(absl::string_view text) {
  CallSiteTable table;
  for (absl::string_view line : absl::StrSplit(text, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) continue;
    std::vector<absl::string_view> caller_callee = absl::StrSplit(line, ',');
    std::vector<absl::string_view> callee_line;
    if (caller_callee.size() == 2) {
      callee_line = absl::StrSplit(caller_callee[1], ':');
    }
    int line_number = 0;
    if (callee_line.size() != 2 ||
        !absl::SimpleAtoi(callee_line[1], &line_number)) {
      LOG(WARNING) << "Skipping malformed line: " << line;
      ++table.num_malformed;
      continue;
    }
    const std::string caller(caller_callee[0]);
    auto [it, inserted] = table.call_sites.try_emplace(caller);
    if (inserted) table.callers.push_back(caller);
    it->second.push_back({std::string(callee_line[0]), line_number});
  }
  return table;
}

std::vector<std::string> FindCallPath(const CallSiteTable &table,
                                      absl::string_view entry,
                                      absl::string_view target) {
  // {function, index of the next call site to try}.
  std::vector<std::pair<std::string, size_t>> stack;
  absl::flat_hash_set<std::string> visited;
  visited.insert(std::string(entry));
  stack.emplace_back(entry, 0);
  while (!stack.empty()) {
    auto &[function, next] = stack.back();
    if (function == target) {
      std::vector<std::string> path;
      for (const auto &frame : stack) path.push_back(frame.first);
      return path;
    }
    const auto &call_sites = table.CallSitesOf(function);
    if (next == call_sites.size()) {
      stack.pop_back();
      continue;
    }
    const std::string &callee = call_sites[next++].callee;
    if (visited.insert(callee).second) stack.emplace_back(callee, 0);
  }
  return {};
}

absl::flat_hash_set<std::string> PrecedingCallees(const CallSiteTable &table,
                                                  absl::string_view target) {
  absl::flat_hash_set<std::string> callees;
  for (const auto &caller : table.callers) {
    const auto &call_sites = table.CallSitesOf(caller);
    // Calling `target` on its last line lets every other call precede it.
    int last_target_line = 0;
    bool calls_target = false;
    for (const auto &call_site : call_sites) {
      if (call_site.callee != target) continue;
      last_target_line = calls_target
                             ? std::max(last_target_line, call_site.line)
                             : call_site.line;
      calls_target = true;
    }
    if (!calls_target) continue;
    for (const auto &call_site : call_sites) {
      if (call_site.callee != target && call_site.line < last_target_line) {
        callees.insert(call_site.callee);
      }
    }
  }
  return callees;
}

absl::flat_hash_set<std::string> TransitiveCallees(
    const CallSiteTable &table,
    const absl::flat_hash_set<std::string> &functions) {
  absl::flat_hash_set<std::string> result = functions;
  std::deque<std::string> worklist(functions.begin(), functions.end());
  while (!worklist.empty()) {
    const std::string function = std::move(worklist.front());
    worklist.pop_front();
    for (const auto &call_site : table.CallSitesOf(function)) {
      if (result.insert(call_site.callee).second) {
        worklist.push_back(call_site.callee);
      }
    }
  }
  return result;
}

std::vector<std::string> ComputeInstrumentationSet(
    const CallSiteTable &table, absl::string_view entry,
    const std::vector<std::string> &targets) {
  absl::flat_hash_set<std::string> functions;
  for (const auto &target : targets) {
    const auto path = FindCallPath(table, entry, target);
    if (path.empty()) {
      LOG(WARNING) << "Target " << target << " is not reachable from "
                   << entry;
    }
    functions.insert(path.begin(), path.end());
    const auto dependencies =
        TransitiveCallees(table, PrecedingCallees(table, target));
    functions.insert(dependencies.begin(), dependencies.end());
  }
  std::vector<std::string> sorted(functions.begin(), functions.end());
  std::sort(sorted.begin(), sorted.end());
  return sorted;
}

absl::Status WriteInstrumentationSet(absl::string_view temp_dir) {
  const auto path = [temp_dir](absl::string_view file_name) -> std::string {
    return std::filesystem::path(std::string{temp_dir}).append(std::string{file_name});
  };
  for (absl::string_view file_name :
       {"call_graph.txt", "target_funcs.txt", "entry_func.txt"}) {
    if (!std::filesystem::exists(path(file_name))) {
      return absl::NotFoundError(
          absl::StrCat("No such file: ", path(file_name)));
    }
  }
  std::string text;
  ReadFromLocalFile(path("entry_func.txt"), text);
  const std::string entry(absl::StripAsciiWhitespace(
      *absl::StrSplit(text, absl::MaxSplits('\n', 1)).begin()));
  if (entry.empty()) {
    return absl::InvalidArgumentError(
        absl::StrCat("No entry function in ", path("entry_func.txt")));
  }
  const auto targets = ReadNameList(path("target_funcs.txt"));
  if (!targets.ok()) return targets.status();
  ReadFromLocalFile(path("call_graph.txt"), text);
  const CallSiteTable table = ParseCallSites(text);

  const auto functions = ComputeInstrumentationSet(table, entry, *targets);
  std::string output;
  for (const auto &function : functions) absl::StrAppend(&output, function, "\n");
  WriteToLocalFile(path("instrumented_funcs.txt"), output);
  LOG(INFO) << "Instrumentation function list written to: "
            << path("instrumented_funcs.txt") << " (" << functions.size()
            << " functions)";
  return absl::OkStatus();
}

}  // namespace distgen
