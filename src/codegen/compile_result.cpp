/***
 * Name: proofc::codegen::CompileResult::BuildSucceeded
 * Purpose: True unless generation or the build itself failed. A run fault after
 *   a good build still counts as a successful build.
 */
#include "proofc/codegen/dispatcher.h"

namespace proofc::codegen {

auto CompileResult::BuildSucceeded() const -> bool {
  switch (status) {
    case CompileStatus::NotRequested:
    case CompileStatus::Spilled:
    case CompileStatus::Succeeded:
    case CompileStatus::ExecutionFault:
      return true;
    case CompileStatus::PartialProgram:
    case CompileStatus::BuildFailed:
    case CompileStatus::OutputError:
      return false;
  }
  return false;
}

}  // namespace proofc::codegen
