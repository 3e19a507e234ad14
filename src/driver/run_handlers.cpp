/***
 * Name: proofc::driver::detail::RunHandlers
 * Purpose: Execute the ordered handler list for argument at 'index'.
 * Inputs: args, index (in/out), argc, dst, err
 * Outputs: OptResult (Error halts, Handled continues)
 * Theory of Operation: Table-driven dispatch; last handler captures unknown/positional.
 */
#include "proofc/driver/cli_parse.h"
#include "proofc/driver/cli.h"

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace proofc {
namespace driver {
namespace detail {

auto RunHandlers(const std::vector<std::string>& args,
                 int& index,
                 int argc,
                 CliOptions& dst,
                 std::ostream& err) -> OptResult {
  using HandlerFn = std::function<OptResult(int&)>;
  const auto current = [&](int idx) -> const std::string& { return args[static_cast<std::size_t>(idx)]; };

  const std::array handlers{
      HandlerFn{[&](int& idx) { return HandleHelpArg(current(idx), dst); }},
      HandlerFn{[&](int& idx) { return HandleMetricsArg(current(idx), dst, err); }},
      HandlerFn{[&](int& idx) { return HandleSwitch(current(idx), dst); }},
      HandlerFn{[&](int& idx) { return HandleValueArg(current(idx), dst, err); }},
      HandlerFn{[&](int& idx) { return HandleEndOfOptions(args, idx, argc, dst); }},
      HandlerFn{[&](int& idx) { return HandleUnknownOrPositional(current(idx), dst, err); }},
  };

  for (const auto& handler : handlers) {
    const OptResult result = handler(index);
    if (result != OptResult::NotMatched) {
      return result;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace proofc
