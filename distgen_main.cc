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


#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/strings/str_join.h"
#include "./command.h"
#include "./environment.h"
#include "./logging.h"
#include "./pipeline.h"

ABSL_FLAG(int, v, 0, "Verbosity level for VLOG().");

int main(int argc, char **argv) {
  // The exact command line, to print as the resume command.
  std::vector<std::string> command_line;
  for (int i = 0; i < argc; ++i) {
    command_line.push_back(distgen::ShellQuote(argv[i]));
  }
  absl::SetProgramUsageMessage(distgen::kUsage);
  // Parse the command line.
  std::vector<char *> args = absl::ParseCommandLine(argc, argv);
  distgen::VerbosityLevel() = absl::GetFlag(FLAGS_v);

  // Reads flags; must happen after ParseCommandLine().
  distgen::Environment env(std::vector<std::string>(args.begin(), args.end()));
  env.command_line = absl::StrJoin(command_line, " ");
  return distgen::DistgenMain(env);
}
