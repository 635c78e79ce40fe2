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

#ifndef THIRD_PARTY_DISTGEN_GRAPH_H_
#define THIRD_PARTY_DISTGEN_GRAPH_H_

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "./defs.h"

namespace distgen {

// A canonical directed graph: either a call graph (one node per function) or
// the control-flow graph of one function (one node per basic block).
//
// Node identity is the node name: adding a name twice yields the same node.
// Parallel edges collapse: adding the same (src, dst) pair twice yields one
// edge. Nodes and edges are kept in first-seen order, so that everything
// computed from a Graph is reproducible.
class Graph {
 public:
  using Edge = std::pair<NodeIndex, NodeIndex>;

  // Returns the index of the node `name`, adding the node if needed.
  NodeIndex AddNode(absl::string_view name);

  // Adds the edge `src` -> `dst`, adding the nodes if needed.
  // Returns false if the edge was already there.
  bool AddEdge(absl::string_view src, absl::string_view dst);
  bool AddEdge(NodeIndex src, NodeIndex dst);

  // Returns the index of `name`, if the graph has such a node.
  std::optional<NodeIndex> FindNode(absl::string_view name) const;
  bool HasNode(absl::string_view name) const { return FindNode(name).has_value(); }

  const std::string &NodeName(NodeIndex node) const { return names_[node]; }
  const std::vector<NodeIndex> &Successors(NodeIndex node) const {
    return successors_[node];
  }
  const std::vector<NodeIndex> &Predecessors(NodeIndex node) const {
    return predecessors_[node];
  }
  // Successors followed by the predecessors that are not also successors.
  std::vector<NodeIndex> Neighbors(NodeIndex node) const;

  size_t num_nodes() const { return names_.size(); }
  size_t num_edges() const { return edges_.size(); }
  const std::vector<std::string> &nodes() const { return names_; }
  const std::vector<Edge> &edges() const { return edges_; }

  // Adds all nodes and edges of `other`, merging nodes by name.
  void Merge(const Graph &other);

  // Returns the graph in the canonical DOT form:
  //   digraph "`graph_name`" {
  //     "a";
  //     "a" -> "b";
  //   }
  // Nodes first, then edges, both in first-seen order.
  std::string ToDot(absl::string_view graph_name) const;

 private:
  std::vector<std::string> names_;
  absl::flat_hash_map<std::string, NodeIndex> index_;
  std::vector<std::vector<NodeIndex>> successors_;
  std::vector<std::vector<NodeIndex>> predecessors_;
  std::vector<Edge> edges_;
  absl::flat_hash_set<Edge> edge_set_;
};

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_GRAPH_H_
