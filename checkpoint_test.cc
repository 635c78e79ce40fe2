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

#include <string>

#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "./test_util.h"
#include "./util.h"

namespace distgen {
namespace {

TEST(Checkpoint, FormatAndParse) {
  const Checkpoint checkpoint = {1, "callgraph-distance", "abc123"};
  const std::string text = FormatCheckpoint(checkpoint);
  EXPECT_EQ(text, "step=1\nname=callgraph-distance\ninputs=abc123\n");
  const auto parsed = ParseCheckpoint(text);
  ASSERT_OK(parsed);
  EXPECT_EQ(parsed->step, 1);
  EXPECT_EQ(parsed->name, "callgraph-distance");
  EXPECT_EQ(parsed->inputs_hash, "abc123");
}

TEST(Checkpoint, ParseErrors) {
  for (const char *bad : {"", "1\n", "step=x\ninputs=h\n", "step=1\n",
                          "step=-1\ninputs=h\n", "step=1\ninputs=h\ncolor=red\n"}) {
    SCOPED_TRACE(bad);
    EXPECT_EQ(ParseCheckpoint(bad).status().code(),
              absl::StatusCode::kInvalidArgument);
  }
}

TEST(LoadResumeStep, ResumesOnlyForTheSameInputs) {
  ScopedTempDir temp_dir(test_info_->name());
  const std::string path = temp_dir.GetFilePath("state");
  // No checkpoint yet.
  EXPECT_EQ(LoadResumeStep(path, "h1"), 0);

  SaveCheckpoint(path, {1, "callgraph-distance", "h1"});
  EXPECT_EQ(LoadResumeStep(path, "h1"), 1);
  // The inputs changed.
  EXPECT_EQ(LoadResumeStep(path, "h2"), 0);

  SaveCheckpoint(path, {2, "cfg-distance", "h1"});
  EXPECT_EQ(LoadResumeStep(path, "h1"), 2);

  // A corrupt checkpoint starts from scratch.
  WriteToLocalFile(path, "garbage");
  EXPECT_EQ(LoadResumeStep(path, "h1"), 0);
}

}  // namespace
}  // namespace distgen
