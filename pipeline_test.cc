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


#include "./pipeline.h"

#include <cstdlib>
#include <filesystem>  // NOLINT
#include <sstream>
#include <string>
#include <string_view>

#include "absl/strings/string_view.h"
#include <variant>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "./call_graph_merger.h"
#include "./environment.h"
#include "./test_util.h"
#include "./util.h"

namespace distgen {
namespace {

using ::testing::HasSubstr;

// Copies the "bitcode" (DOT text in these tests) to <prefix>.callgraph.dot.
constexpr char kFakeOpt[] = "cp \"$2\" \"$4.callgraph.dot\"\n";

class PipelineTest : public ::testing::Test {
 protected:
  PipelineTest()
      : workspace_(::testing::UnitTest::GetInstance()
                       ->current_test_info()
                       ->name()),
        binaries_dir_(workspace_.GetFilePath("binaries")),
        temp_dir_(workspace_.GetFilePath("temp")),
        opt_path_(workspace_.GetFilePath("opt")) {
    std::filesystem::create_directories(binaries_dir_);
    std::filesystem::create_directories(
        std::filesystem::path(temp_dir_).append("dot-files"));
    WriteExecutableScript(opt_path_, kFakeOpt);
  }

  // Call graph A -> B -> C with target C. A's block a.c:2 calls B.
  void WriteChainProgram() {
    AddModule("prog", "digraph { A -> B; B -> C }");
    WriteTempFile("Fnames.txt", "A\nB\nC\n");
    WriteTempFile("Ftargets.txt", "C\n");
    WriteTempFile("BBnames.txt", "a.c:1\na.c:2\nc.c:1\nc.c:2\n");
    WriteTempFile("BBtargets.txt", "c.c:2\n");
    WriteTempFile("BBcalls.txt", "a.c:2,B\n");
    WriteTempFile("dot-files/cfg.A.dot", R"(digraph { "a.c:1" -> "a.c:2" })");
    WriteTempFile("dot-files/cfg.C.dot", R"(digraph { "c.c:1" -> "c.c:2" })");
  }

  void AddModule(absl::string_view name, absl::string_view dot) {
    WriteToLocalFile(std::filesystem::path(binaries_dir_)
                         .append(absl::StrCat(name, ".0.0.x.bc"))
                         .string(),
                     dot);
  }

  void WriteTempFile(absl::string_view name, absl::string_view contents) {
    WriteToLocalFile(TempFilePath(name), contents);
  }

  std::string TempFilePath(absl::string_view name) const {
    return std::filesystem::path(temp_dir_).append(std::string{name});
  }

  std::string ReadTempFile(absl::string_view name) const {
    std::string contents;
    ReadFromLocalFile(TempFilePath(name), contents);
    return contents;
  }

  Environment MakeEnvironment(absl::string_view fuzzer_name = "") const {
    std::vector<std::string> argv = {"distgen", binaries_dir_, temp_dir_};
    if (!fuzzer_name.empty()) argv.emplace_back(fuzzer_name);
    Environment env(argv);
    env.opt_path = opt_path_;
    env.extraction_attempts = 2;
    env.extraction_backoff_ms = 1;
    return env;
  }

  int Run(const Environment &env) {
    output_.str("");
    return RunPipeline(env, output_);
  }

  ScopedTempDir workspace_;
  const std::string binaries_dir_;
  const std::string temp_dir_;
  const std::string opt_path_;
  std::ostringstream output_;
};

TEST_F(PipelineTest, ChainEndToEnd) {
  WriteChainProgram();
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  EXPECT_EQ(ReadTempFile("distance.callgraph.txt"), "A,2\nB,1\nC,0\n");
  // a.c:2 calls B (distance 1), a.c:1 is one block before it.
  EXPECT_EQ(ReadTempFile("distance.cfg.txt"),
            "a.c:1,3\na.c:2,2\nc.c:1,1\nc.c:2,0\n");
  EXPECT_EQ(ReadTempFile("dot-files/cfg.A.dot.distances.txt"),
            "a.c:1,3\na.c:2,2\n");
  EXPECT_TRUE(
      std::filesystem::exists(TempFilePath("dot-files/callgraph.prog.dot")));
  EXPECT_TRUE(std::filesystem::exists(TempFilePath("dot-files/callgraph.dot")));
  EXPECT_THAT(ReadTempFile("state"), HasSubstr("step=2\n"));
  EXPECT_THAT(ReadTempFile("step1.log"), HasSubstr("Constructing CG for prog"));
  EXPECT_THAT(ReadTempFile("step2.log"), HasSubstr("cfg.C.dot"));

  const std::string distance_file =
      std::filesystem::canonical(TempFilePath("distance.cfg.txt")).string();
  EXPECT_THAT(output_.str(), HasSubstr("[DONE]"));
  EXPECT_THAT(output_.str(), HasSubstr(absl::StrCat("-distance=", distance_file)));
}

TEST_F(PipelineTest, ResumingAfterStepOneGivesTheSameOutput) {
  WriteChainProgram();
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  const std::string expected = ReadTempFile("distance.cfg.txt");

  // Pretend that the run stopped right after step 1.
  WriteTempFile("state",
                absl::StrReplaceAll(ReadTempFile("state"),
                                    {{"step=2", "step=1"},
                                     {"cfg-distance", "callgraph-distance"}}));
  std::filesystem::remove(TempFilePath("distance.cfg.txt"));
  // Step 1 must not run again.
  WriteExecutableScript(opt_path_, "exit 1\n");

  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  EXPECT_THAT(output_.str(), HasSubstr("Skipping callgraph-distance"));
  EXPECT_EQ(ReadTempFile("distance.cfg.txt"), expected);
}

TEST_F(PipelineTest, CompletedRunIsNotRepeated) {
  WriteChainProgram();
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  WriteExecutableScript(opt_path_, "exit 1\n");
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  EXPECT_THAT(output_.str(), HasSubstr("Skipping callgraph-distance"));
  EXPECT_THAT(output_.str(), HasSubstr("Skipping cfg-distance"));
}

TEST_F(PipelineTest, ChangedInputsStartFromScratch) {
  WriteChainProgram();
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  WriteTempFile("Ftargets.txt", "B\n");
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  EXPECT_THAT(output_.str(), HasSubstr("Running callgraph-distance"));
  EXPECT_EQ(ReadTempFile("distance.callgraph.txt"), "A,1\nB,0\nC,1\n");
}

TEST_F(PipelineTest, ChangedCfgDumpRecomputesDistances) {
  WriteChainProgram();
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  // The target was rebuilt: a.c:1 is now two blocks away from the call.
  WriteTempFile("dot-files/cfg.A.dot",
                R"(digraph { "a.c:1" -> "a.c:3"; "a.c:3" -> "a.c:2" })");
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  EXPECT_THAT(output_.str(), HasSubstr("Running cfg-distance"));
  EXPECT_EQ(ReadTempFile("distance.cfg.txt"),
            "a.c:1,4\na.c:2,2\nc.c:1,1\nc.c:2,0\n");
}

TEST_F(PipelineTest, ChangedBitcodeRecomputesDistances) {
  WriteChainProgram();
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  AddModule("prog", "digraph { A -> C; B -> C }");
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  EXPECT_THAT(output_.str(), HasSubstr("Running callgraph-distance"));
  EXPECT_EQ(ReadTempFile("distance.callgraph.txt"), "A,1\nB,1\nC,0\n");
}

TEST_F(PipelineTest, CfgOutputFollowsFileNameOrder) {
  // Created before the other dumps, but sorts after them.
  WriteTempFile("dot-files/cfg.Z.dot", R"(digraph { "z.c:1" -> "z.c:2" })");
  WriteChainProgram();
  WriteTempFile("BBnames.txt", "z.c:1\nz.c:2\na.c:1\na.c:2\nc.c:1\nc.c:2\n");
  WriteTempFile("BBtargets.txt", "c.c:2\nz.c:2\n");
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  EXPECT_EQ(ReadTempFile("distance.cfg.txt"),
            "a.c:1,3\na.c:2,2\nc.c:1,1\nc.c:2,0\nz.c:1,1\nz.c:2,0\n");
}

TEST_F(PipelineTest, ToolIsFoundOnPath) {
  WriteChainProgram();
  const std::string tools_dir = workspace_.GetFilePath("tools");
  std::filesystem::create_directories(tools_dir);
  WriteExecutableScript(
      std::filesystem::path(tools_dir).append("distgen-test-opt").string(),
      kFakeOpt);
  PrependDirToPathEnvvar(tools_dir);
  Environment env = MakeEnvironment();
  env.opt_path = "distgen-test-opt";
  ASSERT_EQ(Run(env), EXIT_SUCCESS) << output_.str();
  EXPECT_EQ(ReadTempFile("distance.callgraph.txt"), "A,2\nB,1\nC,0\n");
}

TEST_F(PipelineTest, ExtractionFailureReportsHowToResume) {
  WriteChainProgram();
  WriteExecutableScript(opt_path_, "echo 'opt: bad bitcode' >&2\nexit 1\n");
  const Environment env = MakeEnvironment();
  EXPECT_EQ(Run(env), EXIT_FAILURE);
  const std::string output = output_.str();
  EXPECT_THAT(output, HasSubstr("opt: bad bitcode"));
  EXPECT_THAT(output,
              HasSubstr("-- Problem in Step 1 of generating distance info!"));
  EXPECT_THAT(output, HasSubstr("-- You can resume by executing:"));
  EXPECT_THAT(output, HasSubstr(absl::StrCat("$ ", env.command_line)));
  EXPECT_FALSE(std::filesystem::exists(TempFilePath("state")));

  // Fixed: the same command now succeeds.
  WriteExecutableScript(opt_path_, kFakeOpt);
  EXPECT_EQ(Run(env), EXIT_SUCCESS) << output_.str();
}

TEST_F(PipelineTest, NoFunctionReachesATargetIsAStepFailure) {
  WriteChainProgram();
  WriteTempFile("Ftargets.txt", "Unknown\n");
  EXPECT_EQ(Run(MakeEnvironment()), EXIT_FAILURE);
  EXPECT_THAT(output_.str(), HasSubstr("Problem in Step 1"));
}

TEST_F(PipelineTest, MissingBlockListIsAStepTwoFailure) {
  WriteChainProgram();
  std::filesystem::remove(TempFilePath("BBnames.txt"));
  EXPECT_EQ(Run(MakeEnvironment()), EXIT_FAILURE);
  EXPECT_THAT(output_.str(), HasSubstr("BBnames.txt"));
  EXPECT_THAT(output_.str(), HasSubstr("Problem in Step 2"));
  EXPECT_THAT(ReadTempFile("state"), HasSubstr("step=1\n"));
}

TEST_F(PipelineTest, WhitelistLimitsTheFunctions) {
  WriteChainProgram();
  WriteTempFile("instrumented_funcs.txt", "C\n");
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  EXPECT_EQ(ReadTempFile("distance.cfg.txt"), "c.c:1,1\nc.c:2,0\n");
  EXPECT_THAT(ReadTempFile("step2.log"), HasSubstr("Skipping A"));
}

TEST_F(PipelineTest, BrokenCfgIsSkipped) {
  WriteChainProgram();
  WriteTempFile("dot-files/cfg.A.dot", "digraph { ");
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  EXPECT_EQ(ReadTempFile("distance.cfg.txt"), "c.c:1,1\nc.c:2,0\n");
}

TEST_F(PipelineTest, DisjointModules) {
  AddModule("a", "digraph { A -> T }");
  AddModule("b", "digraph { X -> Y }");
  WriteTempFile("Fnames.txt", "A\nT\nX\nY\n");
  WriteTempFile("Ftargets.txt", "T\n");
  WriteTempFile("BBnames.txt", "");
  WriteTempFile("BBtargets.txt", "");
  WriteTempFile("BBcalls.txt", "");
  ASSERT_EQ(Run(MakeEnvironment()), EXIT_SUCCESS) << output_.str();
  EXPECT_EQ(ReadTempFile("distance.callgraph.txt"), "A,1\nT,0\n");
}

TEST_F(PipelineTest, SingleFuzzerUsesOneModule) {
  AddModule("a", "digraph { A -> T }");
  AddModule("b", "digraph { X -> T }");
  WriteTempFile("Fnames.txt", "A\nT\nX\n");
  WriteTempFile("Ftargets.txt", "T\n");
  WriteTempFile("BBnames.txt", "");
  WriteTempFile("BBtargets.txt", "");
  WriteTempFile("BBcalls.txt", "");
  ASSERT_EQ(Run(MakeEnvironment("b")), EXIT_SUCCESS) << output_.str();
  EXPECT_EQ(ReadTempFile("distance.callgraph.txt"), "T,0\nX,1\n");
  EXPECT_FALSE(
      std::filesystem::exists(TempFilePath("dot-files/callgraph.a.dot")));
}

TEST_F(PipelineTest, UsageErrors) {
  WriteChainProgram();
  Environment no_args(std::vector<std::string>{"distgen"});
  EXPECT_EQ(Run(no_args), EXIT_FAILURE);
  EXPECT_THAT(output_.str(), HasSubstr(kUsage));

  EXPECT_EQ(Run(MakeEnvironment("no_such_fuzzer")), EXIT_FAILURE);
  EXPECT_THAT(output_.str(),
              HasSubstr("Couldn't find bytecode for fuzzer no_such_fuzzer"));

  Environment missing_dir(std::vector<std::string>{
      "distgen", workspace_.GetFilePath("nope"), temp_dir_});
  EXPECT_EQ(Run(missing_dir), EXIT_FAILURE);
  EXPECT_THAT(output_.str(), HasSubstr("No directory"));

  Environment empty_fuzzer(
      std::vector<std::string>{"distgen", binaries_dir_, temp_dir_, ""});
  EXPECT_EQ(Run(empty_fuzzer), EXIT_FAILURE);
  EXPECT_THAT(output_.str(), HasSubstr("Empty fuzzer name"));

  Environment bad_aggregation = MakeEnvironment();
  bad_aggregation.aggregation = "average";
  EXPECT_EQ(Run(bad_aggregation), EXIT_FAILURE);
  EXPECT_THAT(output_.str(), HasSubstr("average"));

  EXPECT_FALSE(std::filesystem::exists(TempFilePath("step1.log")));
}

TEST_F(PipelineTest, MissingToolFailsBeforeAnyStep) {
  WriteChainProgram();
  Environment env = MakeEnvironment();
  env.opt_path = workspace_.GetFilePath("no-such-opt");
  EXPECT_EQ(Run(env), EXIT_FAILURE);
  EXPECT_THAT(output_.str(), HasSubstr("Couldn't find the call graph"));
  EXPECT_FALSE(std::filesystem::exists(TempFilePath("step1.log")));
}

TEST(HashRunInputs, DependsOnInputsAndFlags) {
  ScopedTempDir temp_dir("hash_run_inputs");
  Environment env(std::vector<std::string>{"distgen", "/bin", temp_dir.path});
  std::filesystem::create_directories(env.MakeDotFilesDirPath());
  const std::string bitcode = temp_dir.GetFilePath("prog.0.0.x.bc");
  WriteToLocalFile(bitcode, "digraph { main -> f }");
  const std::vector<Module> modules = {{"prog", bitcode}};
  const std::string hash = HashRunInputs(env, WholeProgram{}, modules);
  EXPECT_EQ(hash.size(), kHashLen);
  EXPECT_EQ(HashRunInputs(env, WholeProgram{}, modules), hash);
  EXPECT_NE(HashRunInputs(env, SingleFuzzer{"prog"}, modules), hash);
  EXPECT_NE(HashRunInputs(env, WholeProgram{}, {}), hash);

  WriteToLocalFile(bitcode, "digraph { main -> g }");
  const std::string with_new_bitcode =
      HashRunInputs(env, WholeProgram{}, modules);
  EXPECT_NE(with_new_bitcode, hash);

  WriteToLocalFile(temp_dir.GetFilePath("Ftargets.txt"), "main\n");
  const std::string with_targets = HashRunInputs(env, WholeProgram{}, modules);
  EXPECT_NE(with_targets, with_new_bitcode);

  const std::string cfg = std::filesystem::path(env.MakeDotFilesDirPath())
                              .append("cfg.main.dot")
                              .string();
  WriteToLocalFile(cfg, "digraph { a -> b }");
  const std::string with_cfg = HashRunInputs(env, WholeProgram{}, modules);
  EXPECT_NE(with_cfg, with_targets);
  // Outputs next to the dumps do not count.
  WriteToLocalFile(absl::StrCat(cfg, ".distances.txt"), "a,1\n");
  EXPECT_EQ(HashRunInputs(env, WholeProgram{}, modules), with_cfg);
  WriteToLocalFile(cfg, "digraph { a -> c }");
  EXPECT_NE(HashRunInputs(env, WholeProgram{}, modules), with_cfg);

  env.aggregation = "min";
  EXPECT_NE(HashRunInputs(env, WholeProgram{}, modules), with_cfg);
}

TEST(GraphSourceOf, FuzzerNameSelectsSingleFuzzer) {
  EXPECT_TRUE(std::holds_alternative<WholeProgram>(GraphSourceOf(
      Environment(std::vector<std::string>{"distgen", "bin", "tmp"}))));
  const GraphSource source = GraphSourceOf(
      Environment(std::vector<std::string>{"distgen", "bin", "tmp", "fz"}));
  ASSERT_TRUE(std::holds_alternative<SingleFuzzer>(source));
  EXPECT_EQ(std::get<SingleFuzzer>(source).name, "fz");
}

}  // namespace
}  // namespace distgen
