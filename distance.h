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

#ifndef THIRD_PARTY_DISTGEN_DISTANCE_H_
#define THIRD_PARTY_DISTGEN_DISTANCE_H_

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <vector>

#include "absl/status/statusor.h"
#include "./defs.h"
#include "./graph.h"

namespace distgen {

// How edges are followed when measuring the distance from a node to a target.
enum class Reachability {
  // Edge direction is ignored.
  kUndirected,
  // Only paths node -> ... -> target along edge direction count.
  kDirected,
};

// Hop count of the shortest path, or kUnreachable.
using HopCount = uint32_t;
inline constexpr HopCount kUnreachable = std::numeric_limits<HopCount>::max();

// Returns, for every node of `graph`, the number of edges on the shortest
// path from that node to `target` (0 for `target` itself), or kUnreachable.
std::vector<HopCount> HopsToNode(const Graph &graph, NodeIndex target,
                                 Reachability reachability);

// Running aggregation of the distances from one node to its targets.
struct PartialDistance {
  size_t count = 0;
  double value = 0;
};

// Folds the distances from one node to each reachable target into one value.
// Distances are added one at a time, so callers never hold all of them.
class DistanceAggregator {
 public:
  virtual ~DistanceAggregator() = default;

  // Name used by --aggregation.
  virtual absl::string_view name() const = 0;

  // Adds `distance` (non-negative) to `partial`.
  virtual void Add(double distance, PartialDistance &partial) const = 0;

  // Returns the aggregate of everything added to `partial`, or std::nullopt
  // if nothing was.
  virtual std::optional<double> Finish(const PartialDistance &partial) const = 0;

  // Add()s every element of `distances`, then Finish()es.
  std::optional<double> Aggregate(const std::vector<double> &distances) const;
};

// |D| / sum(1/d): dominated by the nearest targets, but rewards nodes that
// reach many targets. Any 0 in D gives 0.
class HarmonicMeanAggregator : public DistanceAggregator {
 public:
  absl::string_view name() const override { return "harmonic"; }
  void Add(double distance, PartialDistance &partial) const override;
  std::optional<double> Finish(const PartialDistance &partial) const override;
};

// Distance to the nearest target.
class MinAggregator : public DistanceAggregator {
 public:
  absl::string_view name() const override { return "min"; }
  void Add(double distance, PartialDistance &partial) const override;
  std::optional<double> Finish(const PartialDistance &partial) const override;
};

// Returns the aggregator called `name` ("harmonic" or "min").
// Returns InvalidArgumentError for any other name.
absl::StatusOr<std::unique_ptr<DistanceAggregator>> CreateDistanceAggregator(
    absl::string_view name);

// Function-level distances over the call graph `call_graph`.
//
// Emits one row per name of `universe`, in `universe` order: 0 for names in
// `targets` (whether or not they are in the graph), the aggregated hop
// counts to the reachable targets otherwise. Names that reach no target, or
// that are not in the graph, get no row.
//
// Returns FailedPreconditionError if no row was emitted.
absl::StatusOr<DistanceRows> ComputeCallGraphDistances(
    const Graph &call_graph, const std::vector<std::string> &universe,
    const std::vector<std::string> &targets, Reachability reachability,
    const DistanceAggregator &aggregator);

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_DISTANCE_H_
