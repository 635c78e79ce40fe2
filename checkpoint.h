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


#ifndef THIRD_PARTY_DISTGEN_CHECKPOINT_H_
#define THIRD_PARTY_DISTGEN_CHECKPOINT_H_

#include <string>
#include <string_view>

#include "absl/strings/string_view.h"

#include "absl/status/statusor.h"

namespace distgen {

// The last completed step of a run, stored in the "state" file as:
//   step=1
//   name=callgraph-distance
//   inputs=<hash of the inputs of the run>
struct Checkpoint {
  int step = 0;  // 0: nothing done yet.
  std::string name;
  std::string inputs_hash;
};

std::string FormatCheckpoint(const Checkpoint &checkpoint);

// Returns InvalidArgumentError if `text` is not a formatted Checkpoint.
absl::StatusOr<Checkpoint> ParseCheckpoint(absl::string_view text);

// Returns the step to resume after, 0 to start from scratch:
// the step of the checkpoint at `path` if it exists, parses, and was made
// for `inputs_hash`. Anything else is logged and gives 0.
int LoadResumeStep(absl::string_view path, absl::string_view inputs_hash);

// Overwrites the checkpoint at `path`.
void SaveCheckpoint(absl::string_view path, const Checkpoint &checkpoint);

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_CHECKPOINT_H_
