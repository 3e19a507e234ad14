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
 * Theory of Operation: Resets dst, then runs the handler table for every argument
 *   after argv[0]. The raw arguments are kept for --show-env.
 */
#include "proofc/driver/cli.h"
#include "proofc/driver/cli_parse.h"

#include <ostream>
#include <string>
#include <vector>

namespace proofc::driver {

auto ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err) -> bool {
  dst = CliOptions{};
  std::vector<std::string> args;
  detail::NormalizeArgv(argc, argv, args);
  if (args.size() > 1U) {
    dst.args.assign(args.begin() + 1, args.end());
  }

  const int count = static_cast<int>(args.size());
  for (int index = 1; index < count; ++index) {
    if (detail::RunHandlers(args, index, count, dst, err) == detail::OptResult::Error) {
      return false;
    }
  }
  return true;
}

}  // namespace proofc::driver
