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

#include "./distance.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>
#include <queue>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "./defs.h"
#include "./graph.h"
#include "./logging.h"

namespace distgen {

std::vector<HopCount> HopsToNode(const Graph &graph, NodeIndex target,
                                 Reachability reachability) {
  CHECK_LT(target, graph.num_nodes());
  std::vector<HopCount> hops(graph.num_nodes(), kUnreachable);
  std::queue<NodeIndex> worklist;

  // Walking backwards from the target: in directed mode a node is at
  // distance d+1 if one of its successors is at distance d.
  hops[target] = 0;
  worklist.push(target);
  while (!worklist.empty()) {
    const NodeIndex current = worklist.front();
    worklist.pop();
    const auto next =
        reachability == Reachability::kDirected
            ? graph.Predecessors(current)
            : graph.Neighbors(current);
    for (NodeIndex node : next) {
      if (hops[node] != kUnreachable) continue;
      hops[node] = hops[current] + 1;
      worklist.push(node);
    }
  }
  return hops;
}

std::optional<double> DistanceAggregator::Aggregate(
    const std::vector<double> &distances) const {
  PartialDistance partial;
  for (double distance : distances) Add(distance, partial);
  return Finish(partial);
}

// `value` is the sum of the inverses; a zero distance makes it infinite.
void HarmonicMeanAggregator::Add(double distance,
                                 PartialDistance &partial) const {
  ++partial.count;
  if (distance == 0) {
    partial.value = std::numeric_limits<double>::infinity();
  } else {
    partial.value += 1.0 / distance;
  }
}

std::optional<double> HarmonicMeanAggregator::Finish(
    const PartialDistance &partial) const {
  if (partial.count == 0) return std::nullopt;
  if (std::isinf(partial.value)) return 0.0;
  return static_cast<double>(partial.count) / partial.value;
}

void MinAggregator::Add(double distance, PartialDistance &partial) const {
  partial.value =
      partial.count == 0 ? distance : std::min(partial.value, distance);
  ++partial.count;
}

std::optional<double> MinAggregator::Finish(
    const PartialDistance &partial) const {
  if (partial.count == 0) return std::nullopt;
  return partial.value;
}

absl::StatusOr<std::unique_ptr<DistanceAggregator>> CreateDistanceAggregator(
    absl::string_view name) {
  if (name == "harmonic") return std::make_unique<HarmonicMeanAggregator>();
  if (name == "min") return std::make_unique<MinAggregator>();
  return absl::InvalidArgumentError(absl::StrCat(
      "Unknown aggregation '", name, "'; expected 'harmonic' or 'min'"));
}

absl::StatusOr<DistanceRows> ComputeCallGraphDistances(
    const Graph &call_graph, const std::vector<std::string> &universe,
    const std::vector<std::string> &targets, Reachability reachability,
    const DistanceAggregator &aggregator) {
  absl::flat_hash_set<absl::string_view> target_set(targets.begin(),
                                                   targets.end());
  // One BFS per target present in the graph, folded into `partials` right
  // away.
  std::vector<PartialDistance> partials(call_graph.num_nodes());
  size_t num_targets_in_graph = 0;
  for (const auto &target : targets) {
    const auto target_node = call_graph.FindNode(target);
    if (!target_node.has_value()) {
      VLOG(1) << "Target not in call graph: " << target;
      continue;
    }
    ++num_targets_in_graph;
    const std::vector<HopCount> hops =
        HopsToNode(call_graph, *target_node, reachability);
    for (NodeIndex node = 0; node < hops.size(); ++node) {
      if (hops[node] != kUnreachable) aggregator.Add(hops[node], partials[node]);
    }
  }
  VLOG(1) << VV(call_graph.num_nodes()) << VV(call_graph.num_edges())
          << VV(targets.size()) << VV(num_targets_in_graph);

  DistanceRows rows;
  for (const auto &name : universe) {
    if (target_set.contains(name)) {
      rows.emplace_back(name, 0);
      continue;
    }
    const auto node = call_graph.FindNode(name);
    if (!node.has_value()) continue;
    if (auto distance = aggregator.Finish(partials[*node]);
        distance.has_value()) {
      rows.emplace_back(name, *distance);
    }
  }
  if (rows.empty()) {
    return absl::FailedPreconditionError(
        "No function in the call graph reaches any target");
  }
  return rows;
}

}  // namespace distgen
