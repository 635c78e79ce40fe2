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

#include "./cfg_distance.h"

#include <algorithm>
#include <filesystem>  // NOLINT
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <system_error>  // NOLINT
#include <utility>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "./defs.h"
#include "./distance.h"
#include "./dot_parser.h"
#include "./graph.h"
#include "./inputs.h"
#include "./logging.h"
#include "./util.h"

namespace distgen {

CfgDistanceCalculator::CfgDistanceCalculator(
    const std::vector<std::string> &block_names,
    const std::vector<std::string> &block_targets,
    const std::vector<BlockCall> &block_calls,
    const DistanceMap &function_distances, const CfgDistanceOptions &options,
    const DistanceAggregator &aggregator)
    : block_targets_(block_targets.begin(), block_targets.end()),
      reachability_(options.reachability),
      aggregator_(aggregator) {
  CHECK_GE(options.call_site_offset, 0);
  for (size_t i = 0; i < block_names.size(); ++i) {
    block_order_.try_emplace(block_names[i], i);
  }
  for (const auto &[block, callee] : block_calls) {
    auto it = function_distances.find(callee);
    if (it == function_distances.end()) continue;
    const double offset = it->second + options.call_site_offset;
    auto [offset_it, inserted] = call_site_offsets_.try_emplace(block, offset);
    if (!inserted) offset_it->second = std::min(offset_it->second, offset);
  }
}

std::optional<double> CfgDistanceCalculator::CallSiteOffset(
    absl::string_view block) const {
  auto it = call_site_offsets_.find(block);
  if (it == call_site_offsets_.end()) return std::nullopt;
  return it->second;
}

DistanceRows CfgDistanceCalculator::Compute(const Graph &cfg) const {
  // One BFS per real or virtual target, folded into `partials` right away.
  std::vector<PartialDistance> partials(cfg.num_nodes());
  auto add_target = [&](NodeIndex target, double extra) {
    const std::vector<HopCount> hops = HopsToNode(cfg, target, reachability_);
    for (NodeIndex node = 0; node < hops.size(); ++node) {
      if (hops[node] != kUnreachable) {
        aggregator_.Add(hops[node] + extra, partials[node]);
      }
    }
  };
  for (NodeIndex node = 0; node < cfg.num_nodes(); ++node) {
    const auto &name = cfg.NodeName(node);
    if (block_targets_.contains(name)) {
      add_target(node, 0);
    } else if (auto offset = CallSiteOffset(name); offset.has_value()) {
      add_target(node, *offset);
    }
  }

  // Blocks of this CFG that are in the output, in output order.
  std::vector<std::pair<size_t, NodeIndex>> ordered_blocks;
  for (NodeIndex node = 0; node < cfg.num_nodes(); ++node) {
    auto it = block_order_.find(cfg.NodeName(node));
    if (it != block_order_.end()) ordered_blocks.emplace_back(it->second, node);
  }
  std::sort(ordered_blocks.begin(), ordered_blocks.end());

  DistanceRows rows;
  for (const auto &[unused_order, node] : ordered_blocks) {
    const auto &name = cfg.NodeName(node);
    if (block_targets_.contains(name)) {
      rows.emplace_back(name, 0);
      continue;
    }
    if (auto distance = aggregator_.Finish(partials[node]);
        distance.has_value()) {
      rows.emplace_back(name, *distance);
    }
  }
  return rows;
}

std::string FunctionNameOfCfgFile(absl::string_view file_name) {
  if (!absl::StartsWith(file_name, "cfg.") ||
      !absl::EndsWith(file_name, ".dot")) {
    return "";
  }
  std::vector<absl::string_view> fields = absl::StrSplit(file_name, '.');
  if (fields.size() < 3) return "";
  return std::string(fields[1]);
}

CfgDistanceStats ComputeCfgDistanceFiles(
    absl::string_view dot_files_dir, const CfgDistanceCalculator &calculator,
    const std::optional<absl::flat_hash_set<std::string>> &whitelist,
    absl::string_view output_path, std::ostream &log) {
  std::vector<std::string> cfg_paths;
  std::error_code error;
  for (const auto &entry :
       std::filesystem::directory_iterator(std::string{dot_files_dir}, error)) {
    if (!entry.is_regular_file()) continue;
    if (FunctionNameOfCfgFile(entry.path().filename().string()).empty()) {
      continue;
    }
    cfg_paths.push_back(entry.path().string());
  }
  if (error) {
    log << "Can not list " << dot_files_dir << ": " << error.message() << "\n";
  }
  std::sort(cfg_paths.begin(), cfg_paths.end());

  CfgDistanceStats stats;
  std::string all_rows;
  for (const auto &cfg_path : cfg_paths) {
    ++stats.num_functions;
    const std::string function = FunctionNameOfCfgFile(
        std::filesystem::path(cfg_path).filename().string());
    const std::string distances_path = absl::StrCat(cfg_path, ".distances.txt");
    // Stale results of a previous run must not leak into the output.
    std::filesystem::remove(distances_path, error);

    if (whitelist.has_value() && !whitelist->contains(function)) {
      ++stats.num_skipped;
      log << "Skipping " << function << " (not in instrumented_funcs.txt)\n";
      continue;
    }
    auto cfg = ReadDotGraphFile(cfg_path);
    if (!cfg.ok()) {
      ++stats.num_failed;
      log << "Could not calculate distance for " << cfg_path << ": "
          << cfg.status() << "\n";
      LOG(WARNING) << "Could not calculate distance for " << function << ": "
                   << cfg.status();
      continue;
    }
    log << "Computing distance for " << cfg_path << "\n";
    const DistanceRows rows = calculator.Compute(*cfg);
    VLOG(1) << VV(function) << VV(cfg->num_nodes()) << VV(rows.size());
    const std::string text = FormatDistanceRows(rows);
    WriteToLocalFile(distances_path, text);
    all_rows.append(text);
    stats.num_rows += rows.size();
  }
  WriteToLocalFile(output_path, all_rows);
  return stats;
}

}  // namespace distgen
