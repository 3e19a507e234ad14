/***
 * Name: proofc::backend::detail::JoinArgv
 * Purpose: Space-joined display command for messages.
 */
#include "proofc/backend/detail/exec.h"

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace proofc {
namespace backend {
namespace detail {

auto JoinArgv(const std::vector<char*>& argv) -> std::string {
  std::ostringstream assembled;
  for (std::size_t i = 0; i < argv.size() && argv[i] != nullptr; ++i) {
    if (i != 0U) {
      assembled << ' ';
    }
    assembled << argv[i];
  }
  return assembled.str();
}

}  // namespace detail
}  // namespace backend
}  // namespace proofc
