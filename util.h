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

#ifndef THIRD_PARTY_DISTGEN_UTIL_H_
#define THIRD_PARTY_DISTGEN_UTIL_H_

#include <cstddef>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <vector>

namespace distgen {

// Returns a printable hash of a string. Currently sha1 is used.
std::string Hash(absl::string_view str);
// Hashes are always this many bytes.
inline constexpr size_t kHashLen = 40;
// Returns the hash of the contents of the file `file_path`.
std::string HashOfFileContents(absl::string_view file_path);
// Reads from a local file `file_path` into `data`.
// Leaves `data` empty if the file can not be opened.
// Crashes on a read error.
void ReadFromLocalFile(absl::string_view file_path, std::string &data);
// Writes the contents of `data` to a local file `file_path`.
// Crashes on any error.
void WriteToLocalFile(absl::string_view file_path, absl::string_view data);
// Returns true iff `file_path` exists and has a non-zero size.
bool LocalFileIsNonEmpty(absl::string_view file_path);
// Returns the last `num_lines` lines of the local file `file_path`,
// or an empty string if the file can not be read.
std::string TailOfLocalFile(absl::string_view file_path, size_t num_lines);

// Resolves `name` the way a shell would: a name containing '/' is used as is,
// otherwise the directories in $PATH are searched.
// Returns the path of an existing executable file, or "" if there is none.
std::string FindExecutable(absl::string_view name);

// Requests that the process exits soon, with `exit_code`.
// `exit_code` must be non-zero (!= EXIT_SUCCESS).
// Async-signal-safe.
void RequestEarlyExit(int exit_code);
// Returns true iff RequestEarlyExit() was called.
bool EarlyExitRequested();
// Returns the value most recently passed to RequestEarlyExit()
// or 0 if RequestEarlyExit() was not called.
int ExitCode();

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_UTIL_H_
