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

#include "./inputs.h"

#include <filesystem>  // NOLINT
#include <optional>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "./defs.h"
#include "./util.h"

namespace distgen {

std::vector<std::string> ParseNameList(absl::string_view text) {
  std::vector<std::string> names;
  absl::flat_hash_set<absl::string_view> seen;
  for (absl::string_view line : absl::StrSplit(text, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (line.empty() || !seen.insert(line).second) continue;
    names.emplace_back(line);
  }
  return names;
}

absl::StatusOr<std::vector<std::string>> ReadNameList(absl::string_view path) {
  if (!std::filesystem::exists(std::string{path})) {
    return absl::NotFoundError(absl::StrCat("No such file: ", path));
  }
  std::string text;
  ReadFromLocalFile(path, text);
  return ParseNameList(text);
}

std::optional<absl::flat_hash_set<std::string>> ReadOptionalNameSet(
    absl::string_view path) {
  if (!std::filesystem::exists(std::string{path})) return std::nullopt;
  std::string text;
  ReadFromLocalFile(path, text);
  const auto names = ParseNameList(text);
  return absl::flat_hash_set<std::string>(names.begin(), names.end());
}

BlockCalls ParseBlockCalls(absl::string_view text) {
  BlockCalls result;
  for (absl::string_view line : absl::StrSplit(text, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) continue;
    std::vector<absl::string_view> fields = absl::StrSplit(line, ',');
    if (fields.size() != 2 && fields.size() != 3) {
      ++result.num_malformed;
      continue;
    }
    absl::string_view block = absl::StripAsciiWhitespace(fields[0]);
    absl::string_view callee = absl::StripAsciiWhitespace(fields[1]);
    if (block.empty() || callee.empty()) {
      ++result.num_malformed;
      continue;
    }
    result.calls.push_back({std::string(block), std::string(callee)});
  }
  return result;
}

std::string FormatDistanceRows(const DistanceRows &rows) {
  std::string text;
  for (const auto &[name, distance] : rows) {
    absl::StrAppend(&text, name, ",", distance, "\n");
  }
  return text;
}

absl::StatusOr<DistanceMap> ParseDistanceFile(absl::string_view text) {
  DistanceMap distances;
  size_t line_number = 0;
  for (absl::string_view line : absl::StrSplit(text, '\n')) {
    ++line_number;
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) continue;
    const size_t comma = line.rfind(',');
    double distance = 0;
    if (comma == absl::string_view::npos || comma == 0 ||
        !absl::SimpleAtod(line.substr(comma + 1), &distance) ||
        !(distance >= 0)) {
      return absl::InvalidArgumentError(absl::StrCat(
          "Malformed distance row at line ", line_number, ": '", line, "'"));
    }
    distances.emplace(std::string(line.substr(0, comma)), distance);
  }
  return distances;
}

}  // namespace distgen
