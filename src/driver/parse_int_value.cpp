/***
 * Name: proofc::driver::detail::ParseIntValue
 * Purpose: Strict decimal integer parsing for option values.
 * Inputs: text, inclusive bounds [min, max]
 * Outputs: out; false for empty text, trailing characters or out-of-range values
 */
#include "proofc/driver/cli_parse.h"

#include <charconv>
#include <string>
#include <system_error>

namespace proofc {
namespace driver {
namespace detail {

auto ParseIntValue(const std::string& text, long long min, long long max, long long& out) -> bool {
  if (text.empty()) {
    return false;
  }
  long long value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || value < min || value > max) {
    return false;
  }
  out = value;
  return true;
}

}  // namespace detail
}  // namespace driver
}  // namespace proofc
