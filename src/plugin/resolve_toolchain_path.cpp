/***
 * Name: proofc::plugin::ResolveToolchainPath
 * Purpose: Plugin path from --toolchain, falling back to $PROOFC_TOOLCHAIN.
 */
#include "proofc/plugin/toolchain_plugin.h"

#include <cstdlib>
#include <string>

namespace proofc::plugin {

auto ResolveToolchainPath(const std::string& cli_value) -> std::string {
  if (!cli_value.empty()) {
    return cli_value;
  }
  const char* env = std::getenv(PROOFC_TOOLCHAIN_ENV);
  return env != nullptr ? std::string(env) : std::string();
}

}  // namespace proofc::plugin
