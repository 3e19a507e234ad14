/***
 * Name: proofc::codegen::ImmutableDependencyPath
 * Purpose: Location of the immutable-collections library used by optimized builds.
 */
#include "proofc/codegen/dispatcher.h"

#include <filesystem>
#include <string>

namespace proofc::codegen {

auto ImmutableDependencyPath(const pipeline::Config& config) -> std::string {
  return (std::filesystem::path(config.runtime_lib_dir) / "libproofc_immutable.so").string();
}

}  // namespace proofc::codegen
