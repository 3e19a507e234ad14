/***
 * Name: proofc::pipeline::ProcessFiles
 * Purpose: Entry of one (possibly recursive) pipeline invocation.
 * Inputs:
 *   - files: program files
 *   - other_files: native sources/libraries for the build
 *   - ctx: configuration and collaborators
 *   - look_for_snapshots: false inside a snapshot group
 *   - program_id: cache key prefix (file path in separate mode)
 * Outputs: ExitStatus
 * Theory of Operation: Separate mode recurses per file, snapshot mode per version
 *   group; both fold the results with MergeExitStatus. Recursion levels drop the
 *   native files. Otherwise the base case runs.
 */
#include <string>
#include <vector>

#include "proofc/pipeline/controller.h"
#include "proofc/pipeline/snapshots.h"

namespace proofc::pipeline {

auto ProcessFiles(const std::vector<SourceDescriptor>& files, const std::vector<SourceDescriptor>& other_files,
                  const PipelineContext& ctx, bool look_for_snapshots,
                  const std::optional<std::string>& program_id) -> ExitStatus {
  const auto& config = ctx.config;
  ExitStatus status = ExitStatus::Verified;

  if (config.verify_separately && files.size() > 1) {
    for (const auto& file : files) {
      ctx.printer.WriteLine();
      ctx.printer.WriteLine("-------------------- " + file.path + " --------------------");
      const ExitStatus file_status = ProcessFiles({file}, {}, ctx, look_for_snapshots, file.path);
      status = MergeExitStatus(status, file_status);
    }
    return status;
  }

  if (config.verify_snapshots >= 0 && look_for_snapshots) {
    for (const auto& group : LookForSnapshots(Paths(files))) {
      std::vector<SourceDescriptor> snapshots;
      snapshots.reserve(group.size());
      for (const auto& path : group) {
        snapshots.push_back(SourceDescriptor{path, SourceKind::Program});
      }
      status = MergeExitStatus(status, ProcessFiles(snapshots, {}, ctx, false, program_id));
    }
    return status;
  }

  return ProcessProgram(files, other_files, ctx, program_id);
}

auto Run(const std::vector<SourceDescriptor>& files, const std::vector<SourceDescriptor>& other_files,
         const PipelineContext& ctx) -> ExitStatus {
  return ProcessFiles(files, other_files, ctx);
}

}  // namespace proofc::pipeline
