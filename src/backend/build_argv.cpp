/***
 * Name: proofc::backend::detail::BuildArgvMutable
 * Purpose: Construct a null-terminated argv array from a vector<string>.
 * Inputs: args (vector<string>)
 * Outputs: vector<char*> suitable for execvp
 * Theory of Operation: Pointers reference the string storage; args must outlive argv.
 */
#include "proofc/backend/detail/exec.h"

#include <string>
#include <vector>

namespace proofc {
namespace backend {
namespace detail {

auto BuildArgvMutable(std::vector<std::string>& args) -> std::vector<char*> {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1U);
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return argv;
}

}  // namespace detail
}  // namespace backend
}  // namespace proofc
