/***
 * Name: proofc::driver (cli)
 * Purpose: Declarations for CLI options, parsing, and usage printing.
 * Inputs: N/A (declarations only)
 * Outputs: Types and functions for CLI handling.
 * Theory of Operation: Options map onto the explicit pipeline::Config plus a few
 *   driver-only settings (plugin path, metrics, worker stack size, banners).
 */
#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "proofc/pipeline/config.h"

namespace proofc {
namespace driver {

/*** kDefaultStackSize: Worker stack budget for deep program structures (256 MiB). */
constexpr std::size_t kDefaultStackSize = std::size_t{256} * 1024U * 1024U;

/***
 * Name: proofc::driver::CliOptions
 * Purpose: Hold parsed command-line options for a proofc invocation.
 * Inputs: Values are populated by ParseCli.
 * Outputs: Consumed by the driver; `pipeline` is handed to the pipeline unchanged.
 */
struct CliOptions {
  std::vector<std::string> inputs;   // positional inputs (.prf, .cc/.cpp, .a/.so)
  std::vector<std::string> args;     // raw arguments, echoed by --show-env
  pipeline::Config pipeline;
  std::string toolchain_path;        // --toolchain=<plugin.so>
  std::string diag_log;              // --diag-log=<file>
  std::size_t stack_size = kDefaultStackSize;  // --stack-size=<bytes>
  bool show_help = false;            // -h, --help
  bool no_logo = false;              // --nologo
  bool show_env = false;             // --show-env
  bool metrics = false;              // --metrics
  enum class MetricsFormat { Text, Json };
  MetricsFormat metrics_format = MetricsFormat::Text; // --metrics[=json|text]
};

/***
 * Name: proofc::driver::detail::OptResult
 * Purpose: Tri-state result for option handlers.
 * Theory of Operation: Allows the main parser to remain simple while delegating
 *   specific option formats to small helpers.
 */
namespace detail {
enum class OptResult { NotMatched, Handled, Error };
}

/***
 * Name: proofc::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation: Iterates arguments left-to-right through the handler table.
 *   A missing input list is not a parse error; the driver reports it separately.
 */
bool ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err);

/*** PrintUsage: Print CLI usage information for proofc. */
void PrintUsage(std::ostream& out, const char* argv0);

}  // namespace driver
}  // namespace proofc
