/***
 * Name: proofc::codegen (dispatcher)
 * Purpose: Decide whether and how to generate target code after verification, then
 *   generate, persist, natively build and optionally run it.
 * Inputs: Aggregate outcome/statistics, program, verdict, input file names, context
 * Outputs: CompileResult tagged with what happened
 * Theory of Operation: SelectGenerationMode holds the policy; CompileProgram does the
 *   work. Partial output (new errors during generation) is never built.
 */
#pragma once

#include <map>
#include <string>
#include <vector>

#include "proofc/backend/native_toolchain.h"
#include "proofc/metrics/metrics.h"
#include "proofc/pipeline/config.h"
#include "proofc/pipeline/context.h"
#include "proofc/pipeline/outcome.h"
#include "proofc/pipeline/source.h"
#include "proofc/toolchain/toolchain.h"

namespace proofc {
namespace codegen {

enum class GenerationMode { Skip, SpillOnly, GenerateAndBuild };

enum class CompileStatus {
  NotRequested,    // nothing generated
  Spilled,         // generated (and possibly written) without a build
  Succeeded,       // built (and run without fault, if requested)
  ExecutionFault,  // built, but the run after the build terminated abnormally
  PartialProgram,  // generation reported new errors; nothing was built
  BuildFailed,     // native toolchain rejected the program
  OutputError,     // target file or dependency could not be written
};

struct CompileResult {
  CompileStatus status{CompileStatus::NotRequested};
  std::string artifact;

  [[nodiscard]] bool BuildSucceeded() const;
};

/*** SelectGenerationMode: Policy from outcome, verdict and configuration. */
GenerationMode SelectGenerationMode(pipeline::PipelineOutcome outcome, bool verified,
                                    const pipeline::Config& config);

/*** ArtifactPath: Input path with the executable ("out") or library ("so") extension. */
std::string ArtifactPath(const std::string& program_path, backend::OutputKind kind);

/*** MakeBuildRequest: Compose the native build for the generated source and extra files. */
backend::BuildRequest MakeBuildRequest(const std::string& generated_source, bool has_main,
                                       const std::string& output,
                                       const std::vector<pipeline::SourceDescriptor>& other_files,
                                       const pipeline::Config& config);

/*** ImmutableDependencyPath: <runtime_lib_dir>/libproofc_immutable.so. */
std::string ImmutableDependencyPath(const pipeline::Config& config);

class Dispatcher : public metrics::Metrics {
 public:
  explicit Dispatcher(const pipeline::PipelineContext& ctx) : ctx_(ctx) {}

  /*** Dispatch: Print the statistics trailer and generate per SelectGenerationMode. */
  CompileResult Dispatch(pipeline::PipelineOutcome outcome,
                         const std::map<std::string, pipeline::PipelineStatistics>& per_unit,
                         toolchain::Program& program, bool verified, const std::string& file_name,
                         const std::vector<pipeline::SourceDescriptor>& other_files);

  /*** CompileProgram: Generate target code; build natively when invoke_native is set. */
  CompileResult CompileProgram(toolchain::Program& program, const std::string& program_name,
                               const std::vector<pipeline::SourceDescriptor>& other_files,
                               bool invoke_native);

 private:
  CompileResult BuildAndRun(const std::string& source_path, bool has_main, const std::string& program_name,
                            const std::vector<pipeline::SourceDescriptor>& other_files);
  bool CopyImmutableDependency(const std::string& program_name);

  const pipeline::PipelineContext& ctx_;
};

}  // namespace codegen
}  // namespace proofc
