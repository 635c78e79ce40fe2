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


#ifndef THIRD_PARTY_DISTGEN_TEST_UTIL_H_
#define THIRD_PARTY_DISTGEN_TEST_UTIL_H_

#include <unistd.h>

#include <filesystem>  // NOLINT
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "./logging.h"

namespace distgen::test_internal {
// The installed Abseil has no operator<< for StatusOr; print its Status.
inline const absl::Status &StatusOf(const absl::Status &status) {
  return status;
}
template <typename T>
const absl::Status &StatusOf(const absl::StatusOr<T> &status_or) {
  return status_or.status();
}
}  // namespace distgen::test_internal

#define EXPECT_OK(status) \
  EXPECT_TRUE((status).ok()) << VV(::distgen::test_internal::StatusOf(status))
#define ASSERT_OK(status) \
  ASSERT_TRUE((status).ok()) << VV(::distgen::test_internal::StatusOf(status))

namespace distgen {

// Returns a temp dir for use inside tests. The base dir is chosen in the
// following order of precedence:
// - $TEST_TMPDIR (highest)
// - $TMPDIR
// - /tmp
std::string GetTestTempDir();

// Resets the PATH envvar to "`dir`:$PATH".
void PrependDirToPathEnvvar(absl::string_view dir);

// Writes `script_body` to `path` after a "#!/bin/sh" line and makes it
// executable.
void WriteExecutableScript(absl::string_view path, absl::string_view script_body);

// Creates a tmp dir in CTOR, removes it in DTOR.
// The dir name will contain `name`.
struct ScopedTempDir {
  explicit ScopedTempDir(absl::string_view name = "")
      : path(std::filesystem::path(GetTestTempDir())
                 .append(absl::StrCat("distgen_", name, getpid()))) {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~ScopedTempDir() { std::filesystem::remove_all(path); }
  std::string GetFilePath(absl::string_view file_name) const {
    return std::filesystem::path(path).append(std::string{file_name});
  }
  std::string path;
};

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_TEST_UTIL_H_
