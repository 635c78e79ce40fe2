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

#include "./dot_parser.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>  // NOLINT
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/strip.h"
#include "./graph.h"
#include "./logging.h"
#include "./util.h"

namespace distgen {
namespace {

enum class TokenKind {
  kId,
  kLeftBrace,
  kRightBrace,
  kLeftBracket,
  kRightBracket,
  kSemicolon,
  kComma,
  kEquals,
  kColon,
  kPlus,
  kEdgeOp,
  kEnd,
};

struct Token {
  TokenKind kind;
  std::string text;
  int line;
  bool quoted = false;
};

bool IsIdChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' ||
         static_cast<unsigned char>(c) >= 0x80;
}

absl::Status SyntaxError(int line, absl::string_view message) {
  return absl::InvalidArgumentError(
      absl::StrCat("DOT syntax error at line ", line, ": ", message));
}

// Splits `text` into tokens. The last token is always kEnd.
absl::StatusOr<std::vector<Token>> Tokenize(absl::string_view text) {
  std::vector<Token> tokens;
  int line = 1;
  bool at_line_start = true;
  size_t i = 0;
  auto emit = [&](TokenKind kind, std::string token_text) {
    tokens.push_back({kind, std::move(token_text), line});
  };
  while (i < text.size()) {
    const char c = text[i];
    if (c == '\n') {
      ++line;
      at_line_start = true;
      ++i;
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) {
      ++i;
      continue;
    }
    // Preprocessor-style output lines.
    if (c == '#' && at_line_start) {
      while (i < text.size() && text[i] != '\n') ++i;
      continue;
    }
    at_line_start = false;
    if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
      while (i < text.size() && text[i] != '\n') ++i;
      continue;
    }
    if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
      const int comment_line = line;
      i += 2;
      while (i + 1 < text.size() && !(text[i] == '*' && text[i + 1] == '/')) {
        if (text[i] == '\n') ++line;
        ++i;
      }
      if (i + 1 >= text.size())
        return SyntaxError(comment_line, "unterminated comment");
      i += 2;
      continue;
    }
    switch (c) {
      case '{':
        emit(TokenKind::kLeftBrace, "{");
        ++i;
        continue;
      case '}':
        emit(TokenKind::kRightBrace, "}");
        ++i;
        continue;
      case '[':
        emit(TokenKind::kLeftBracket, "[");
        ++i;
        continue;
      case ']':
        emit(TokenKind::kRightBracket, "]");
        ++i;
        continue;
      case ';':
        emit(TokenKind::kSemicolon, ";");
        ++i;
        continue;
      case ',':
        emit(TokenKind::kComma, ",");
        ++i;
        continue;
      case '=':
        emit(TokenKind::kEquals, "=");
        ++i;
        continue;
      case ':':
        emit(TokenKind::kColon, ":");
        ++i;
        continue;
      case '+':
        emit(TokenKind::kPlus, "+");
        ++i;
        continue;
      default:
        break;
    }
    if (c == '-' && i + 1 < text.size() &&
        (text[i + 1] == '>' || text[i + 1] == '-')) {
      emit(TokenKind::kEdgeOp, std::string(text.substr(i, 2)));
      i += 2;
      continue;
    }
    if (c == '"') {
      const int string_line = line;
      std::string value;
      ++i;
      while (i < text.size() && text[i] != '"') {
        if (text[i] == '\\' && i + 1 < text.size()) {
          const char next = text[i + 1];
          if (next == '"' || next == '\\') {
            value.push_back(next);
            i += 2;
            continue;
          }
          if (next == '\n') {  // Line continuation.
            ++line;
            i += 2;
            continue;
          }
        }
        if (text[i] == '\n') ++line;
        value.push_back(text[i]);
        ++i;
      }
      if (i >= text.size())
        return SyntaxError(string_line, "unterminated string");
      ++i;  // Closing quote.
      tokens.push_back({TokenKind::kId, std::move(value), string_line, true});
      continue;
    }
    if (c == '<') {
      const int html_line = line;
      int depth = 0;
      size_t begin = i;
      do {
        if (text[i] == '<') ++depth;
        if (text[i] == '>') --depth;
        if (text[i] == '\n') ++line;
        ++i;
      } while (i < text.size() && depth > 0);
      if (depth > 0) return SyntaxError(html_line, "unterminated HTML string");
      tokens.push_back({TokenKind::kId,
                        std::string(text.substr(begin + 1, i - begin - 2)),
                        html_line, true});
      continue;
    }
    if (IsIdChar(c) || c == '-') {
      size_t begin = i;
      ++i;
      while (i < text.size() && IsIdChar(text[i])) ++i;
      emit(TokenKind::kId, std::string(text.substr(begin, i - begin)));
      continue;
    }
    return SyntaxError(line, absl::StrCat("unexpected character '",
                                          std::string(1, c), "'"));
  }
  emit(TokenKind::kEnd, "<end of input>");
  return tokens;
}

// Recursive descent over the grammar in dot_parser.h. Records node ids in
// first-seen order, the last `label` of every node, and the edges.
class DotParser {
 public:
  explicit DotParser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    CHECK(!tokens_.empty());
    CHECK(tokens_.back().kind == TokenKind::kEnd);
  }

  bool ParseGraph() {
    if (IsKeyword(Peek(), "strict")) ++pos_;
    if (!IsKeyword(Peek(), "graph") && !IsKeyword(Peek(), "digraph"))
      return Fail("'graph' or 'digraph'");
    ++pos_;
    std::string graph_id;
    if (Peek().kind == TokenKind::kId && !ReadId(graph_id)) return false;
    if (!Expect(TokenKind::kLeftBrace, "'{'")) return false;
    if (!ParseStmtList(nullptr)) return false;
    if (!Expect(TokenKind::kRightBrace, "'}'")) return false;
    return Expect(TokenKind::kEnd, "end of input");
  }

  const absl::Status &status() const { return status_; }

  Graph BuildGraph() const {
    Graph graph;
    absl::flat_hash_map<std::string, std::string> id_to_name;
    for (const auto &id : node_order_) {
      std::string name;
      if (auto it = labels_.find(id); it != labels_.end()) {
        name = CanonicalNodeName(it->second);
      }
      if (name.empty()) name = id;
      graph.AddNode(name);
      id_to_name.emplace(id, std::move(name));
    }
    for (const auto &[src, dst] : edges_) {
      graph.AddEdge(id_to_name.at(src), id_to_name.at(dst));
    }
    return graph;
  }

 private:
  using Attributes = std::vector<std::pair<std::string, std::string>>;

  const Token &Peek(size_t ahead = 0) const {
    return tokens_[std::min(pos_ + ahead, tokens_.size() - 1)];
  }

  static bool IsKeyword(const Token &token, absl::string_view keyword) {
    return token.kind == TokenKind::kId && !token.quoted &&
           absl::EqualsIgnoreCase(token.text, keyword);
  }

  bool Accept(TokenKind kind) {
    if (Peek().kind != kind) return false;
    ++pos_;
    return true;
  }

  bool Expect(TokenKind kind, absl::string_view what) {
    if (Accept(kind)) return true;
    return Fail(what);
  }

  bool Fail(absl::string_view expected) {
    if (status_.ok()) {
      status_ = SyntaxError(
          Peek().line,
          absl::StrCat("expected ", expected, ", got '", Peek().text, "'"));
    }
    return false;
  }

  // ID, possibly a '+'-concatenation of quoted strings.
  bool ReadId(std::string &id) {
    if (Peek().kind != TokenKind::kId) return Fail("identifier");
    id = Peek().text;
    const bool quoted = Peek().quoted;
    ++pos_;
    while (quoted && Peek().kind == TokenKind::kPlus &&
           Peek(1).kind == TokenKind::kId && Peek(1).quoted) {
      id += Peek(1).text;
      pos_ += 2;
    }
    return true;
  }

  bool ParseNodeId(std::string &id) {
    if (!ReadId(id)) return false;
    std::string port;
    for (int i = 0; i < 2 && Accept(TokenKind::kColon); ++i) {
      if (!ReadId(port)) return false;
    }
    return true;
  }

  bool ParseAttrList(Attributes &attrs) {
    if (!Expect(TokenKind::kLeftBracket, "'['")) return false;
    do {
      while (!Accept(TokenKind::kRightBracket)) {
        std::string key, value;
        if (!ReadId(key)) return false;
        if (Accept(TokenKind::kEquals) && !ReadId(value)) return false;
        attrs.emplace_back(std::move(key), std::move(value));
        if (!Accept(TokenKind::kComma)) Accept(TokenKind::kSemicolon);
      }
    } while (Accept(TokenKind::kLeftBracket));
    return true;
  }

  void NoteNode(const std::string &id, std::vector<std::string> *scope) {
    if (seen_.insert(id).second) node_order_.push_back(id);
    if (scope != nullptr) scope->push_back(id);
  }

  bool ParseSubgraph(std::vector<std::string> &ids) {
    if (IsKeyword(Peek(), "subgraph")) {
      ++pos_;
      std::string subgraph_id;
      if (Peek().kind == TokenKind::kId && !ReadId(subgraph_id)) return false;
    }
    if (!Expect(TokenKind::kLeftBrace, "'{'")) return false;
    if (!ParseStmtList(&ids)) return false;
    return Expect(TokenKind::kRightBrace, "'}'");
  }

  // Parses one edge operand into `ids`: a node, or all nodes of a subgraph.
  bool ParseOperand(std::vector<std::string> &ids,
                    std::vector<std::string> *scope) {
    if (Peek().kind == TokenKind::kLeftBrace || IsKeyword(Peek(), "subgraph")) {
      if (!ParseSubgraph(ids)) return false;
      if (scope != nullptr) scope->insert(scope->end(), ids.begin(), ids.end());
      return true;
    }
    std::string id;
    if (!ParseNodeId(id)) return false;
    NoteNode(id, scope);
    ids.push_back(std::move(id));
    return true;
  }

  bool ParseStmt(std::vector<std::string> *scope) {
    const Token &first = Peek();
    if ((IsKeyword(first, "graph") || IsKeyword(first, "node") ||
         IsKeyword(first, "edge")) &&
        Peek(1).kind == TokenKind::kLeftBracket) {
      ++pos_;
      Attributes ignored;
      return ParseAttrList(ignored);
    }
    if (first.kind == TokenKind::kId && !IsKeyword(first, "subgraph") &&
        Peek(1).kind == TokenKind::kEquals) {
      std::string key, value;
      return ReadId(key) && Expect(TokenKind::kEquals, "'='") && ReadId(value);
    }
    std::vector<std::string> lhs;
    const bool lhs_is_node = first.kind == TokenKind::kId &&
                             !IsKeyword(first, "subgraph");
    if (!ParseOperand(lhs, scope)) return false;
    if (Peek().kind != TokenKind::kEdgeOp) {
      if (!lhs_is_node || Peek().kind != TokenKind::kLeftBracket) return true;
      Attributes attrs;
      if (!ParseAttrList(attrs)) return false;
      for (auto &[key, value] : attrs) {
        if (key == "label") labels_[lhs.front()] = std::move(value);
      }
      return true;
    }
    while (Accept(TokenKind::kEdgeOp)) {
      std::vector<std::string> rhs;
      if (!ParseOperand(rhs, scope)) return false;
      for (const auto &src : lhs) {
        for (const auto &dst : rhs) edges_.emplace_back(src, dst);
      }
      lhs = std::move(rhs);
    }
    if (Peek().kind == TokenKind::kLeftBracket) {
      Attributes ignored;
      return ParseAttrList(ignored);
    }
    return true;
  }

  bool ParseStmtList(std::vector<std::string> *scope) {
    while (Peek().kind != TokenKind::kRightBrace &&
           Peek().kind != TokenKind::kEnd) {
      if (!ParseStmt(scope)) return false;
      Accept(TokenKind::kSemicolon);
    }
    return true;
  }

  std::vector<Token> tokens_;
  size_t pos_ = 0;
  absl::Status status_;
  std::vector<std::string> node_order_;
  absl::flat_hash_set<std::string> seen_;
  absl::flat_hash_map<std::string, std::string> labels_;
  std::vector<std::pair<std::string, std::string>> edges_;
};

}  // namespace

std::string CanonicalNodeName(absl::string_view label) {
  absl::string_view text = absl::StripAsciiWhitespace(label);
  const bool is_record = text.size() >= 2 && absl::StartsWith(text, "{") &&
                         absl::EndsWith(text, "}");
  if (is_record) text = text.substr(1, text.size() - 2);
  constexpr absl::string_view kRecordEscapes = "{}|<> \\";
  std::string name;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '\n' || c == '\r') break;
    if (is_record && (c == '|' || c == '{' || c == '}')) break;
    if (c == '\\' && i + 1 < text.size()) {
      const char next = text[i + 1];
      if (next == 'l' || next == 'n' || next == 'r') break;
      if (is_record && kRecordEscapes.find(next) != absl::string_view::npos) {
        name.push_back(next);
        ++i;
        continue;
      }
    }
    name.push_back(c);
  }
  absl::string_view result = absl::StripAsciiWhitespace(name);
  absl::ConsumeSuffix(&result, ":");
  return std::string(absl::StripAsciiWhitespace(result));
}

absl::StatusOr<Graph> ParseDotGraph(absl::string_view dot_text) {
  auto tokens = Tokenize(dot_text);
  if (!tokens.ok()) return tokens.status();
  DotParser parser(*std::move(tokens));
  if (!parser.ParseGraph()) return parser.status();
  return parser.BuildGraph();
}

absl::StatusOr<Graph> ReadDotGraphFile(absl::string_view dot_path) {
  if (!std::filesystem::exists(std::string{dot_path})) {
    return absl::NotFoundError(absl::StrCat("No such file: ", dot_path));
  }
  std::string dot_text;
  ReadFromLocalFile(dot_path, dot_text);
  auto graph = ParseDotGraph(dot_text);
  if (!graph.ok()) {
    return absl::Status(graph.status().code(),
                        absl::StrCat(dot_path, ": ", graph.status().message()));
  }
  return graph;
}

}  // namespace distgen
