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

#include "./util.h"

#include <openssl/sha.h>
#include <unistd.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <deque>
#include <filesystem>  // NOLINT
#include <fstream>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <system_error>  // NOLINT

#include "absl/strings/escaping.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "./logging.h"

namespace distgen {

std::string Hash(absl::string_view str) {
  unsigned char digest[SHA_DIGEST_LENGTH];
  SHA1(reinterpret_cast<const unsigned char *>(str.data()), str.size(),
       digest);
  std::string hash = absl::BytesToHexString(absl::string_view(
      reinterpret_cast<const char *>(digest), sizeof(digest)));
  CHECK_EQ(hash.size(), kHashLen);
  return hash;
}

std::string HashOfFileContents(absl::string_view file_path) {
  std::string contents;
  ReadFromLocalFile(file_path, contents);
  return Hash(contents);
}

void ReadFromLocalFile(absl::string_view file_path, std::string &data) {
  data.clear();
  std::ifstream f(std::string{file_path});
  if (!f) return;
  f.seekg(0, std::ios_base::end);
  size_t size = f.tellg();
  f.seekg(0, std::ios_base::beg);
  data.resize(size);
  f.read(data.data(), size);
  CHECK(f) << "Failed to read from local file: " << file_path;
  f.close();
}

void WriteToLocalFile(absl::string_view file_path, absl::string_view data) {
  std::ofstream f(std::string{file_path});
  CHECK(f) << "Failed to open local file: " << file_path;
  f.write(data.data(), data.size());
  CHECK(f) << "Failed to write to local file: " << file_path;
  f.close();
}

bool LocalFileIsNonEmpty(absl::string_view file_path) {
  std::error_code error;
  const auto size = std::filesystem::file_size(std::string{file_path}, error);
  return !error && size != 0;
}

std::string TailOfLocalFile(absl::string_view file_path, size_t num_lines) {
  std::ifstream f(std::string{file_path});
  if (!f) return "";
  std::deque<std::string> tail;
  for (std::string line; std::getline(f, line);) {
    tail.push_back(std::move(line));
    if (tail.size() > num_lines) tail.pop_front();
  }
  return absl::StrJoin(tail, "\n");
}

std::string FindExecutable(absl::string_view name) {
  auto is_executable = [](const std::filesystem::path &path) {
    std::error_code error;
    return std::filesystem::is_regular_file(path, error) &&
           access(path.c_str(), X_OK) == 0;
  };
  if (name.empty()) return "";
  if (name.find('/') != absl::string_view::npos) {
    return is_executable(std::string{name}) ? std::string{name} : "";
  }
  const char *path_env = getenv("PATH");
  if (path_env == nullptr) return "";
  for (absl::string_view dir : absl::StrSplit(path_env, ':', absl::SkipEmpty{})) {
    auto candidate = std::filesystem::path(std::string{dir}) / std::string{name};
    if (is_executable(candidate)) return candidate.string();
  }
  return "";
}

static std::atomic<int> requested_exit_code(EXIT_SUCCESS);

void RequestEarlyExit(int exit_code) {
  CHECK_NE(exit_code, EXIT_SUCCESS);
  requested_exit_code = exit_code;
}
bool EarlyExitRequested() { return requested_exit_code != EXIT_SUCCESS; }
int ExitCode() { return requested_exit_code; }

}  // namespace distgen
