/***
 * Name: proofc::driver::MapExitCode
 * Purpose: Process exit code for a pipeline exit status.
 * Inputs: status, count_verification_errors
 * Outputs: The status ordinal; 0 for everything but PreprocessingError when
 *   verification errors are not counted
 */
#include "proofc/driver/app.h"

namespace proofc::driver {

auto MapExitCode(pipeline::ExitStatus status, bool count_verification_errors) -> int {
  if (!count_verification_errors && status != pipeline::ExitStatus::PreprocessingError) {
    return 0;
  }
  return static_cast<int>(status);
}

}  // namespace proofc::driver
