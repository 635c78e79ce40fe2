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


#include "./checkpoint.h"

#include <filesystem>  // NOLINT
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "./logging.h"
#include "./util.h"

namespace distgen {

std::string FormatCheckpoint(const Checkpoint &checkpoint) {
  return absl::StrCat("step=", checkpoint.step, "\n", "name=", checkpoint.name,
                      "\n", "inputs=", checkpoint.inputs_hash, "\n");
}

absl::StatusOr<Checkpoint> ParseCheckpoint(absl::string_view text) {
  Checkpoint checkpoint;
  bool has_step = false, has_inputs = false;
  for (absl::string_view line : absl::StrSplit(text, '\n')) {
    line = absl::StripAsciiWhitespace(line);
    if (line.empty()) continue;
    std::vector<absl::string_view> key_value =
        absl::StrSplit(line, absl::MaxSplits('=', 1));
    if (key_value.size() != 2) {
      return absl::InvalidArgumentError(
          absl::StrCat("Malformed checkpoint line: '", line, "'"));
    }
    const absl::string_view key = key_value[0];
    const absl::string_view value = key_value[1];
    if (key == "step") {
      if (!absl::SimpleAtoi(value, &checkpoint.step) || checkpoint.step < 0) {
        return absl::InvalidArgumentError(
            absl::StrCat("Bad checkpoint step: '", value, "'"));
      }
      has_step = true;
    } else if (key == "name") {
      checkpoint.name = std::string(value);
    } else if (key == "inputs") {
      checkpoint.inputs_hash = std::string(value);
      has_inputs = true;
    } else {
      return absl::InvalidArgumentError(
          absl::StrCat("Unknown checkpoint key: '", key, "'"));
    }
  }
  if (!has_step || !has_inputs) {
    return absl::InvalidArgumentError("Incomplete checkpoint");
  }
  return checkpoint;
}

int LoadResumeStep(absl::string_view path, absl::string_view inputs_hash) {
  if (!std::filesystem::exists(std::string{path})) return 0;
  std::string text;
  ReadFromLocalFile(path, text);
  const auto checkpoint = ParseCheckpoint(text);
  if (!checkpoint.ok()) {
    LOG(WARNING) << "Ignoring checkpoint " << path << ": "
                 << checkpoint.status() << "; starting from scratch";
    return 0;
  }
  if (checkpoint->inputs_hash != inputs_hash) {
    LOG(WARNING) << "Inputs changed since checkpoint " << path
                 << " was written; starting from scratch";
    return 0;
  }
  VLOG(1) << "Resuming after step " << checkpoint->step << " ("
          << checkpoint->name << ")";
  return checkpoint->step;
}

void SaveCheckpoint(absl::string_view path, const Checkpoint &checkpoint) {
  WriteToLocalFile(path, FormatCheckpoint(checkpoint));
}

}  // namespace distgen
