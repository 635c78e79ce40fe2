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

#include "./command.h"

#include <signal.h>
#include <stdlib.h>
#include <sys/wait.h>

#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "./logging.h"
#include "./util.h"

namespace distgen {
namespace {

inline constexpr absl::string_view kCommandLineSeparator(" ");

bool IsShellSafe(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_' || c == '-' || c == '.' ||
         c == '/' || c == ':' || c == '=' || c == ',' || c == '+' || c == '@';
}

}  // namespace

std::string ShellQuote(absl::string_view arg) {
  if (!arg.empty()) {
    bool safe = true;
    for (char c : arg) safe = safe && IsShellSafe(c);
    if (safe) return std::string(arg);
  }
  return absl::StrCat("'", absl::StrReplaceAll(arg, {{"'", "'\\''"}}), "'");
}

Command::Command(absl::string_view path, std::vector<std::string> args,
                 std::vector<std::string> env, absl::string_view out,
                 absl::string_view err)
    : path_(path),
      args_(std::move(args)),
      env_(std::move(env)),
      out_(out),
      err_(err) {}

std::string Command::ToString() const {
  std::vector<std::string> ss;
  ss.insert(ss.cend(), env_.cbegin(), env_.cend());
  ss.push_back(ShellQuote(path_));
  for (const auto &arg : args_) ss.push_back(ShellQuote(arg));
  if (!out_.empty()) {
    ss.emplace_back(absl::StrCat("> ", ShellQuote(out_)));
  }
  if (!err_.empty()) {
    ss.emplace_back(out_ != err_ ? absl::StrCat("2> ", ShellQuote(err_))
                                 : "2>&1");
  }
  return absl::StrJoin(ss, kCommandLineSeparator);
}

int Command::Execute() {
  VLOG(1) << "Executing: " << command_line_;
  const int exit_code = system(command_line_.c_str());
  if (WIFSIGNALED(exit_code) && (WTERMSIG(exit_code) == SIGINT))
    RequestEarlyExit(EXIT_FAILURE);
  if (WIFEXITED(exit_code)) return WEXITSTATUS(exit_code);
  return exit_code;
}

absl::Status ExecuteWithRetries(Command &command, const RetryPolicy &policy) {
  CHECK_GE(policy.max_attempts, 1);
  absl::Duration backoff = policy.initial_backoff;
  int exit_code = 0;
  for (int attempt = 1; attempt <= policy.max_attempts; ++attempt) {
    exit_code = command.Execute();
    if (exit_code == 0) return absl::OkStatus();
    if (EarlyExitRequested()) {
      return absl::CancelledError(
          absl::StrCat("Interrupted: ", command.ToString()));
    }
    LOG(WARNING) << "Attempt " << attempt << "/" << policy.max_attempts
                 << " failed: " << VV(exit_code) << command.ToString();
    if (attempt < policy.max_attempts) {
      absl::SleepFor(backoff);
      backoff *= 2;
    }
  }
  return absl::UnavailableError(absl::StrCat("Failed ", policy.max_attempts,
                                             " times, last exit code ",
                                             exit_code, ": ",
                                             command.ToString()));
}

}  // namespace distgen
