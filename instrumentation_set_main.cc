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


#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/status/status.h"
#include "./instrumentation_set.h"

int main(int argc, char **argv) {
  absl::SetProgramUsageMessage("Usage: instrumented_funcs <temp-dir>");
  std::vector<char *> args = absl::ParseCommandLine(argc, argv);
  if (args.size() != 2) {
    std::cout << "Usage: instrumented_funcs <temp-dir>\n";
    return EXIT_FAILURE;
  }
  const absl::Status status = distgen::WriteInstrumentationSet(args[1]);
  if (!status.ok()) {
    std::cout << status << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
