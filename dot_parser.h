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

// Reads graph dumps in the DOT language, as written by LLVM's
// `opt -dot-callgraph` / `-dot-cfg` and by the AFLGo-style instrumentation,
// and turns them into canonical Graphs.
//
// Accepted grammar (a subset of https://graphviz.org/doc/info/lang.html):
//
//   graph     : [strict] (graph | digraph) [ID] '{' stmt_list '}'
//   stmt_list : (stmt [';'])*
//   stmt      : attr_stmt | edge_stmt | node_stmt | ID '=' ID | subgraph
//   attr_stmt : (graph | node | edge) attr_list
//   attr_list : ('[' [a_list] ']')+
//   a_list    : ID ['=' ID] ([';' | ','] a_list)?
//   edge_stmt : operand (('->' | '--') operand)+ [attr_list]
//   operand   : node_id | subgraph
//   node_stmt : node_id [attr_list]
//   node_id   : ID [':' ID [':' ID]]
//   subgraph  : [subgraph [ID]] '{' stmt_list '}'
//   ID        : [A-Za-z0-9_.]+ | '-'?[0-9.]+ | '"' ... '"' ('+' '"' ... '"')*
//             | '<' ... '>' (balanced)
//
// Comments ('//' to the end of line, '/* ... */', and lines starting with
// '#') are skipped. Ports and compass points in node_id are dropped.
// Keywords are case-insensitive.
//
// Node identity is taken from the node's `label` attribute, see
// CanonicalNodeName(); nodes without a label keep their DOT id. Nodes with the
// same identity become one node, repeated edges become one edge.

#ifndef THIRD_PARTY_DISTGEN_DOT_PARSER_H_
#define THIRD_PARTY_DISTGEN_DOT_PARSER_H_

#include <string>
#include <string_view>

#include "absl/strings/string_view.h"

#include "absl/status/statusor.h"
#include "./graph.h"

namespace distgen {

// Parses `dot_text` and returns the canonical graph.
// Returns InvalidArgumentError, naming the line, if `dot_text` does not
// follow the grammar above.
absl::StatusOr<Graph> ParseDotGraph(absl::string_view dot_text);

// Reads the local file `dot_path` and parses it with ParseDotGraph().
// Returns NotFoundError if the file can not be read.
absl::StatusOr<Graph> ReadDotGraphFile(absl::string_view dot_path);

// Turns a decoded `label` attribute into a node name:
//   "{main}"                     => "main"
//   "{file.c:12:\l  %5 = ...}"   => "file.c:12"
//   "{entry|{<s0>T|<s1>F}}"      => "entry"
//   "  plain  "                  => "plain"
// Record braces are removed, the text is cut at the first record field
// separator or line break escape (\l, \n, \r), one trailing ':' is removed,
// and whitespace is trimmed. Returns "" if nothing is left.
std::string CanonicalNodeName(absl::string_view label);

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_DOT_PARSER_H_
