/***
 * Name: proofc::driver::detail::HandleEndOfOptions
 * Purpose: Handle the "--" token and push remaining inputs.
 * Inputs:
 *   - args: full argument vector
 *   - index: current index (will be advanced to the end)
 *   - argc: total argument count
 *   - dst: CLI options destination
 * Outputs: OptResult indicating match
 * Theory of Operation: Consumes "--" and appends all remaining tokens as inputs,
 *   even ones that look like options.
 */
#include "proofc/driver/cli_parse.h"
#include "proofc/driver/cli.h"  // direct use of CliOptions

#include <cstddef>
#include <string>
#include <vector>

namespace proofc {
namespace driver {
namespace detail {

auto HandleEndOfOptions(const std::vector<std::string>& args,
                        int& index,
                        int argc,
                        CliOptions& dst) -> OptResult {
  if (args[static_cast<std::size_t>(index)] != "--") {
    return OptResult::NotMatched;
  }
  for (++index; index < argc; ++index) {
    const std::string& input = args[static_cast<std::size_t>(index)];
    if (!input.empty()) {
      dst.inputs.push_back(input);
    }
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace proofc
