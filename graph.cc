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

#include "./graph.h"

#include <optional>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "./defs.h"
#include "./logging.h"

namespace distgen {
namespace {

std::string QuoteDotId(absl::string_view id) {
  return absl::StrCat("\"",
                      absl::StrReplaceAll(id, {{"\\", "\\\\"}, {"\"", "\\\""}}),
                      "\"");
}

}  // namespace

NodeIndex Graph::AddNode(absl::string_view name) {
  auto [it, inserted] =
      index_.try_emplace(std::string{name}, static_cast<NodeIndex>(names_.size()));
  if (inserted) {
    names_.emplace_back(name);
    successors_.emplace_back();
    predecessors_.emplace_back();
  }
  return it->second;
}

bool Graph::AddEdge(absl::string_view src, absl::string_view dst) {
  const NodeIndex src_index = AddNode(src);
  const NodeIndex dst_index = AddNode(dst);
  return AddEdge(src_index, dst_index);
}

bool Graph::AddEdge(NodeIndex src, NodeIndex dst) {
  CHECK_LT(src, names_.size());
  CHECK_LT(dst, names_.size());
  if (!edge_set_.insert({src, dst}).second) return false;
  edges_.emplace_back(src, dst);
  successors_[src].push_back(dst);
  predecessors_[dst].push_back(src);
  return true;
}

std::optional<NodeIndex> Graph::FindNode(absl::string_view name) const {
  auto it = index_.find(name);
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

std::vector<NodeIndex> Graph::Neighbors(NodeIndex node) const {
  std::vector<NodeIndex> neighbors = successors_[node];
  for (NodeIndex pred : predecessors_[node]) {
    if (!edge_set_.contains({node, pred})) neighbors.push_back(pred);
  }
  return neighbors;
}

void Graph::Merge(const Graph &other) {
  for (const auto &name : other.nodes()) AddNode(name);
  for (const auto &[src, dst] : other.edges()) {
    AddEdge(other.NodeName(src), other.NodeName(dst));
  }
}

std::string Graph::ToDot(absl::string_view graph_name) const {
  std::string dot = absl::StrCat("digraph ", QuoteDotId(graph_name), " {\n");
  for (const auto &name : names_) {
    absl::StrAppend(&dot, "\t", QuoteDotId(name), ";\n");
  }
  for (const auto &[src, dst] : edges_) {
    absl::StrAppend(&dot, "\t", QuoteDotId(names_[src]), " -> ",
                    QuoteDotId(names_[dst]), ";\n");
  }
  absl::StrAppend(&dot, "}\n");
  return dot;
}

}  // namespace distgen
