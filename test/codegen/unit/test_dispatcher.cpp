/***
 * Name: test_dispatcher
 * Purpose: Code generation, persistence, native build and run-after behavior of the
 *   code-gen dispatcher.
 */
#include <gtest/gtest.h>

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "proofc/codegen/dispatcher.h"
#include "util/FakeToolchain.h"

using namespace proofc::codegen;
using proofc::backend::OutputKind;
using proofc::backend::RunResult;
using proofc::pipeline::PipelineOutcome;
using proofc::pipeline::PipelineStatistics;
using proofc::pipeline::SourceDescriptor;
using proofc::pipeline::SourceKind;
using testutil::FakeProgram;
using testutil::Harness;

namespace {

struct DispatchFixture : public ::testing::Test {
  DispatchFixture() {
    std::filesystem::create_directories(h.scratch.Path("src"));
    program_name = h.scratch.Path("src/prog.prf");
  }

  CompileResult Dispatch(PipelineOutcome outcome = PipelineOutcome::VerificationCompleted, bool verified = true,
                         const std::vector<SourceDescriptor>& others = {}) {
    const auto ctx = h.Context();
    Dispatcher dispatcher(ctx);
    FakeProgram program(program_name, h.reporter);
    const std::map<std::string, PipelineStatistics> per_unit{{"A", testutil::Stats(2, 0)},
                                                             {"B", testutil::Stats(3, 0)}};
    return dispatcher.Dispatch(outcome, per_unit, program, verified, program_name, others);
  }

  Harness h;
  std::string program_name;
};

}  // namespace

TEST_F(DispatchFixture, ErrorOutcomeDoesNothing) {
  const CompileResult result = Dispatch(PipelineOutcome::ResolutionError, false);
  EXPECT_EQ(result.status, CompileStatus::NotRequested);
  EXPECT_TRUE(result.BuildSucceeded());
  EXPECT_EQ(h.out.str(), "");
  EXPECT_TRUE(h.toolchain.log.calls.empty());
}

TEST_F(DispatchFixture, TrailerIsPrintedBeforeGeneration) {
  h.config.compile = false;
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::NotRequested);
  EXPECT_EQ(h.out.str(), "\nproofc finished with 5 verified, 0 errors\n");
  EXPECT_EQ(h.toolchain.log.CountPrefix("Compile:"), 0U);
}

TEST_F(DispatchFixture, VerifiedProgramIsBuilt) {
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::Succeeded);
  EXPECT_EQ(result.artifact, h.scratch.Path("src/prog.out"));
  ASSERT_EQ(h.native.requests.size(), 1U);
  const auto& request = h.native.requests[0];
  EXPECT_EQ(request.kind, OutputKind::Executable);
  EXPECT_EQ(request.output, h.scratch.Path("src/prog.out"));
  ASSERT_EQ(request.sources.size(), 1U);
  EXPECT_EQ(request.sources[0], h.scratch.Path("prog.cpp")) << "unspilled source goes to the temp dir";
  EXPECT_EQ(h.scratch.Read(request.sources[0]), h.toolchain.cpp.text);
  EXPECT_FALSE(h.scratch.Exists("src/prog.cpp"));
  EXPECT_NE(h.out.str().find("Compiled assembly into prog.out\n"), std::string::npos);
  EXPECT_EQ(h.native.runs.size(), 0U);
}

TEST_F(DispatchFixture, LibraryWhenThereIsNoMain) {
  h.toolchain.cpp.has_main = false;
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::Succeeded);
  EXPECT_EQ(result.artifact, h.scratch.Path("src/prog.so"));
  EXPECT_EQ(h.native.requests.at(0).kind, OutputKind::Library);
}

TEST_F(DispatchFixture, SpillWritesTargetBesideProgram) {
  h.config.spill_target_code = 1;
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::Succeeded);
  EXPECT_TRUE(h.scratch.Exists("src/prog.cpp"));
  EXPECT_NE(h.out.str().find("Compiled program written to prog.cpp\n"), std::string::npos);
  EXPECT_EQ(h.native.requests.at(0).sources.at(0), h.scratch.Path("src/prog.cpp"));
}

TEST_F(DispatchFixture, SpillOnlyNeverBuilds) {
  h.config.compile = false;
  h.config.spill_target_code = 2;
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::Spilled);
  EXPECT_TRUE(result.BuildSucceeded());
  EXPECT_TRUE(h.scratch.Exists("src/prog.cpp"));
  EXPECT_TRUE(h.native.requests.empty());
}

TEST_F(DispatchFixture, PartialProgramIsWrittenButNotBuilt) {
  h.config.spill_target_code = 1;
  h.toolchain.cpp.new_errors = 1;
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::PartialProgram);
  EXPECT_FALSE(result.BuildSucceeded());
  EXPECT_NE(h.out.str().find("File prog.cpp contains the partially compiled program\n"), std::string::npos);
  EXPECT_TRUE(h.native.requests.empty());
}

TEST_F(DispatchFixture, PartialSpillOnlyIsNotAFailure) {
  h.config.compile = false;
  h.config.spill_target_code = 3;
  h.toolchain.cpp.new_errors = 2;
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::Spilled);
  EXPECT_TRUE(result.BuildSucceeded());
}

TEST_F(DispatchFixture, NativeFilesForcePersistenceAndJoinTheBuild) {
  const std::vector<SourceDescriptor> others{{"helper.cc", SourceKind::NativeSource},
                                             {"libext.so", SourceKind::NativeLibrary}};
  const CompileResult result = Dispatch(PipelineOutcome::VerificationCompleted, true, others);
  EXPECT_EQ(result.status, CompileStatus::Succeeded);
  EXPECT_TRUE(h.scratch.Exists("src/prog.cpp"));
  const auto& request = h.native.requests.at(0);
  EXPECT_EQ(request.sources, (std::vector<std::string>{h.scratch.Path("src/prog.cpp"), "helper.cc"}));
  EXPECT_EQ(request.libraries, std::vector<std::string>{"libext.so"});
}

TEST_F(DispatchFixture, BuildFailureIsReported) {
  h.native.build_ok = false;
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::BuildFailed);
  EXPECT_FALSE(result.BuildSucceeded());
  EXPECT_NE(h.err.str().find("Errors compiling program into prog.out\nundefined reference to 'missing'\n\n"),
            std::string::npos);
}

TEST_F(DispatchFixture, BuildWarningsGoToErrorStream) {
  h.native.warnings = {"prog.cpp:3:7: warning: unused variable 'x'"};
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::Succeeded);
  EXPECT_NE(h.err.str().find("prog.cpp:3:7: warning: unused variable 'x'\n"), std::string::npos);
  EXPECT_NE(h.out.str().find("Compiled assembly into prog.out"), std::string::npos);
}

TEST_F(DispatchFixture, RunAfterBuildsIntoTempDirAndRuns) {
  h.config.run_after_compile = true;
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::Succeeded);
  EXPECT_EQ(result.artifact, h.scratch.Path("prog.out"));
  ASSERT_EQ(h.native.runs.size(), 1U);
  EXPECT_EQ(h.native.runs[0], h.scratch.Path("prog.out"));
  EXPECT_NE(h.out.str().find("Program compiled successfully\nRunning...\n\n"), std::string::npos);
  EXPECT_EQ(h.out.str().find("Compiled assembly into"), std::string::npos);
}

TEST_F(DispatchFixture, RunAfterReportsNonZeroExit) {
  h.config.run_after_compile = true;
  h.native.run_result.status = RunResult::Status::Exited;
  h.native.run_result.code = 3;
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::Succeeded);
  EXPECT_NE(h.out.str().find("Program exited with code 3\n"), std::string::npos);
}

TEST_F(DispatchFixture, RunFaultIsTaggedButBuildStillSucceeded) {
  h.config.run_after_compile = true;
  h.native.run_result.status = RunResult::Status::Signaled;
  h.native.run_result.code = 11;
  h.native.run_result.detail = "terminated by signal 11 (Segmentation fault)";
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::ExecutionFault);
  EXPECT_TRUE(result.BuildSucceeded());
  EXPECT_NE(h.err.str().find("Error: Execution resulted in exception: terminated by signal 11"),
            std::string::npos);
}

TEST_F(DispatchFixture, RunAfterLibraryStopsAfterBuild) {
  h.config.run_after_compile = true;
  h.toolchain.cpp.has_main = false;
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::Succeeded);
  EXPECT_TRUE(h.native.runs.empty());
  EXPECT_EQ(h.out.str().find("Running..."), std::string::npos);
}

TEST_F(DispatchFixture, ScriptTargetPersistsInsteadOfBuilding) {
  h.config.target = Target::JavaScript;
  h.config.run_after_compile = true;
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::Succeeded);
  EXPECT_EQ(result.artifact, h.scratch.Path("src/prog.js"));
  EXPECT_TRUE(h.scratch.Exists("src/prog.js"));
  EXPECT_EQ(h.toolchain.log.Count("Compile:js"), 1U);
  EXPECT_TRUE(h.native.requests.empty());
  EXPECT_TRUE(h.native.runs.empty());
}

TEST_F(DispatchFixture, MissingGeneratorFailsTheBuild) {
  h.config.target = Target::JavaScript;
  h.toolchain.js_enabled = false;
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::BuildFailed);
  EXPECT_NE(h.err.str().find("no js code generator"), std::string::npos);
}

TEST_F(DispatchFixture, UnwritableTargetIsAnOutputError) {
  h.config.spill_target_code = 1;
  program_name = h.scratch.Path("missing/prog.prf");
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::OutputError);
  EXPECT_FALSE(result.BuildSucceeded());
  EXPECT_TRUE(h.native.requests.empty());
}

TEST_F(DispatchFixture, OptimizeCopiesDependencyBesideArtifact) {
  h.config.optimize = true;
  h.config.runtime_lib_dir = h.scratch.Path("rt");
  std::filesystem::create_directories(h.config.runtime_lib_dir);
  h.scratch.Write("rt/libproofc_immutable.so", "lib");
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::Succeeded);
  EXPECT_TRUE(h.scratch.Exists("src/libproofc_immutable.so"));
  EXPECT_NE(h.out.str().find("Copied optimize dependency libproofc_immutable.so to " + h.scratch.Path("src")),
            std::string::npos);
}

TEST_F(DispatchFixture, OptimizeWithoutDependencyIsAnOutputError) {
  h.config.optimize = true;
  h.config.runtime_lib_dir = h.scratch.Path("rt");
  const CompileResult result = Dispatch();
  EXPECT_EQ(result.status, CompileStatus::OutputError);
  EXPECT_NE(h.err.str().find("failed to copy optimize dependency"), std::string::npos);
}
