/***
 * Name: proofc::pipeline (controller)
 * Purpose: Top-level sequencing of one verification-gated compilation.
 * Inputs: Program files, auxiliary native files, context
 * Outputs: ExitStatus
 * Theory of Operation: Recurses per file in separate-verification mode and per
 *   snapshot group in incremental mode; the base case runs front end, translation,
 *   verification and code generation in order.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "proofc/pipeline/context.h"
#include "proofc/pipeline/outcome.h"
#include "proofc/pipeline/source.h"
#include "proofc/toolchain/toolchain.h"

namespace proofc {
namespace pipeline {

/*** ProcessFiles: One (possibly recursive) pipeline invocation. */
ExitStatus ProcessFiles(const std::vector<SourceDescriptor>& files,
                        const std::vector<SourceDescriptor>& other_files,
                        const PipelineContext& ctx,
                        bool look_for_snapshots = true,
                        const std::optional<std::string>& program_id = std::nullopt);

/*** ProcessProgram: Base case for one program (no separate/snapshot recursion). */
ExitStatus ProcessProgram(const std::vector<SourceDescriptor>& files,
                          const std::vector<SourceDescriptor>& other_files,
                          const PipelineContext& ctx,
                          const std::optional<std::string>& program_id);

/*** Run: Public entry point for a set of classified inputs. */
ExitStatus Run(const std::vector<SourceDescriptor>& files,
               const std::vector<SourceDescriptor>& other_files,
               const PipelineContext& ctx);

/*** TranslateProgram: Lower program to units, dumping each when a print file is set. */
std::vector<toolchain::VcUnit> TranslateProgram(toolchain::Program& program, const PipelineContext& ctx);

/*** ClassifyResult: Map (verified, compile status) to an exit status. */
ExitStatus ClassifyResult(bool verified, bool build_ok, bool output_error);

}  // namespace pipeline
}  // namespace proofc
