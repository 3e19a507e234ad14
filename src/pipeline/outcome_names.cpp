/***
 * Name: proofc::pipeline::OutcomeName / ExitStatusName
 * Purpose: Display names for outcomes and exit statuses (messages, tests).
 */
#include "proofc/pipeline/outcome.h"

namespace proofc::pipeline {

auto OutcomeName(PipelineOutcome outcome) -> const char* {
  switch (outcome) {
    case PipelineOutcome::Done: return "Done";
    case PipelineOutcome::ResolutionError: return "ResolutionError";
    case PipelineOutcome::TypeCheckingError: return "TypeCheckingError";
    case PipelineOutcome::ResolvedAndTypeChecked: return "ResolvedAndTypeChecked";
    case PipelineOutcome::VerificationCompleted: return "VerificationCompleted";
  }
  return "Unknown";
}

auto ExitStatusName(ExitStatus status) -> const char* {
  switch (status) {
    case ExitStatus::Verified: return "Verified";
    case ExitStatus::PreprocessingError: return "PreprocessingError";
    case ExitStatus::CompileError: return "CompileError";
    case ExitStatus::NotVerified: return "NotVerified";
    case ExitStatus::CompileOutputError: return "CompileOutputError";
  }
  return "Unknown";
}

}  // namespace proofc::pipeline
