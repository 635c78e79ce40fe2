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

#ifndef THIRD_PARTY_DISTGEN_COMMAND_H_
#define THIRD_PARTY_DISTGEN_COMMAND_H_

#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <vector>

#include "absl/status/status.h"
#include "absl/time/time.h"

namespace distgen {

// Returns `arg` quoted for /bin/sh, unless it only has safe characters.
std::string ShellQuote(absl::string_view arg);

class Command final {
 public:
  Command(const Command &other) = delete;
  Command &operator=(const Command &other) = delete;

  // Constructs a command:
  // `path`: path to the binary.
  // `args`: arguments.
  // `env`: environment variables/values (in the form "KEY=VALUE").
  // `out`: stdout redirect path (empty means none).
  // `err`: stderr redirect path (empty means none).
  // If `out` == `err` and both are non-empty, stdout/stderr are combined.
  explicit Command(absl::string_view path, std::vector<std::string> args = {},
                   std::vector<std::string> env = {}, absl::string_view out = "",
                   absl::string_view err = "");

  // Returns a string representing the command, e.g. like this
  // "ENV1=VAL1 path arg1 arg2 > out 2> err"
  std::string ToString() const;
  // Executes the command, returns the exit status.
  // Can be called more than once.
  // If interrupted, calls RequestEarlyExit().
  int Execute();

 private:
  const std::string path_;
  const std::vector<std::string> args_;
  const std::vector<std::string> env_;
  const std::string out_;
  const std::string err_;
  const std::string command_line_ = ToString();
};

// How often, and how patiently, a failing command is retried.
struct RetryPolicy {
  // Total number of executions, >= 1.
  int max_attempts = 5;
  // Wait before the second attempt; doubles after every failed attempt.
  absl::Duration initial_backoff = absl::Milliseconds(500);
};

// Executes `command` until it exits with 0, at most `policy.max_attempts`
// times. Returns UnavailableError if every attempt failed, and CancelledError
// if an early exit was requested in the meantime.
absl::Status ExecuteWithRetries(Command &command, const RetryPolicy &policy);

}  // namespace distgen

#endif  // THIRD_PARTY_DISTGEN_COMMAND_H_
