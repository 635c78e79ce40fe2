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

#include <cstdlib>
#include <string>

#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "./logging.h"
#include "./test_util.h"
#include "./util.h"

namespace distgen {
namespace {

TEST(Command, ToString) {
  EXPECT_EQ(Command("x").ToString(), "x");
  EXPECT_EQ(Command("path", {"arg1", "arg2"}).ToString(), "path arg1 arg2");
  EXPECT_EQ(Command("x", {}, {"K1=V1", "K2=V2"}).ToString(), "K1=V1 K2=V2 x");
  EXPECT_EQ(Command("x", {}, {}, "out").ToString(), "x > out");
  EXPECT_EQ(Command("x", {}, {}, "", "err").ToString(), "x 2> err");
  EXPECT_EQ(Command("x", {}, {}, "out", "err").ToString(), "x > out 2> err");
  EXPECT_EQ(Command("x", {}, {}, "out", "out").ToString(), "x > out 2>&1");
  EXPECT_EQ(Command("opt", {"-dot-callgraph", "a b.bc"}).ToString(),
            "opt -dot-callgraph 'a b.bc'");
}

TEST(Command, ShellQuote) {
  EXPECT_EQ(ShellQuote("/tmp/x.0.0.bc"), "/tmp/x.0.0.bc");
  EXPECT_EQ(ShellQuote(""), "''");
  EXPECT_EQ(ShellQuote("a b"), "'a b'");
  EXPECT_EQ(ShellQuote("it's"), "'it'\\''s'");
  EXPECT_EQ(ShellQuote("$HOME"), "'$HOME'");
}

TEST(Command, Execute) {
  // Check for default exit code.
  Command echo("echo");
  EXPECT_EQ(echo.Execute(), 0);
  EXPECT_FALSE(EarlyExitRequested());

  // Check for exit code 7.
  Command exit7("sh", {"-c", "exit 7"});
  EXPECT_EQ(exit7.Execute(), 7);
  EXPECT_FALSE(EarlyExitRequested());

  // Test for interrupt handling.
  const auto self_sigint_lambda = []() {
    Command self_sigint("sh", {"-c", "kill -INT $$"});
    self_sigint.Execute();
    if (EarlyExitRequested()) {
      LOG(INFO) << "Early exit requested";
      exit(ExitCode());
    }
  };
  EXPECT_DEATH(self_sigint_lambda(), "Early exit requested");
}

TEST(Command, ExecuteRedirectsOutput) {
  ScopedTempDir temp_dir(test_info_->name());
  const std::string out = temp_dir.GetFilePath("out");
  Command cmd("sh", {"-c", "echo hello; echo oops >&2"}, {}, out, out);
  EXPECT_EQ(cmd.Execute(), 0);
  std::string contents;
  ReadFromLocalFile(out, contents);
  EXPECT_EQ(contents, "hello\noops\n");
}

TEST(ExecuteWithRetries, SucceedsAfterTransientFailures) {
  ScopedTempDir temp_dir(test_info_->name());
  const std::string counter = temp_dir.GetFilePath("counter");
  // Fails twice, then succeeds.
  const std::string script = temp_dir.GetFilePath("flaky.sh");
  WriteExecutableScript(
      script, absl::StrCat("echo x >> ", counter, "\n",
                           "test $(wc -l < ", counter, ") -ge 3\n"));
  Command flaky(script);
  EXPECT_OK(ExecuteWithRetries(
      flaky, {/*max_attempts=*/5, /*initial_backoff=*/absl::Milliseconds(1)}));
  std::string contents;
  ReadFromLocalFile(counter, contents);
  EXPECT_EQ(contents, "x\nx\nx\n");
}

TEST(ExecuteWithRetries, GivesUpAfterMaxAttempts) {
  ScopedTempDir temp_dir(test_info_->name());
  const std::string counter = temp_dir.GetFilePath("counter");
  Command failing("sh", {"-c", absl::StrCat("echo x >> ", counter, "; exit 3")});
  const absl::Status status = ExecuteWithRetries(
      failing, {/*max_attempts=*/3, /*initial_backoff=*/absl::Milliseconds(1)});
  EXPECT_EQ(status.code(), absl::StatusCode::kUnavailable) << status;
  std::string contents;
  ReadFromLocalFile(counter, contents);
  EXPECT_EQ(contents, "x\nx\nx\n");
}

TEST(ExecuteWithRetries, BackoffDoubles) {
  Command failing("sh", {"-c", "exit 1"});
  const absl::Time start = absl::Now();
  const absl::Status status = ExecuteWithRetries(
      failing, {/*max_attempts=*/4, /*initial_backoff=*/absl::Milliseconds(50)});
  EXPECT_EQ(status.code(), absl::StatusCode::kUnavailable) << status;
  // 50 + 100 + 200 ms of waiting; a fixed backoff would wait 150 ms.
  EXPECT_GE(absl::Now() - start, absl::Milliseconds(350));
}

}  // namespace
}  // namespace distgen
