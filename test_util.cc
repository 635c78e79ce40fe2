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


#include "./test_util.h"

#include <cstdlib>
#include <filesystem>  // NOLINT
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"

#include "absl/strings/str_cat.h"
#include "./logging.h"
#include "./util.h"

namespace distgen {

std::string GetTestTempDir() {
  if (auto* path = std::getenv("TEST_TMPDIR"); path != nullptr) return path;
  if (auto* path = std::getenv("TMPDIR"); path != nullptr) return path;
  return "/tmp";
}

void PrependDirToPathEnvvar(absl::string_view dir) {
  const char* path = std::getenv("PATH");
  const std::string new_path =
      path == nullptr ? std::string(dir) : absl::StrCat(dir, ":", path);
  CHECK_EQ(setenv("PATH", new_path.c_str(), /*overwrite=*/1), 0);
}

void WriteExecutableScript(absl::string_view path,
                           absl::string_view script_body) {
  WriteToLocalFile(path, absl::StrCat("#!/bin/sh\n", script_body));
  std::filesystem::permissions(std::string{path},
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec);
}

}  // namespace distgen
