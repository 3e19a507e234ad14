/***
 * Name: proofc::support::ChangeExtension
 * Purpose: Replace the extension of a path, keeping its directory.
 * Inputs:
 *   - path: original path ("dir/prog.prf")
 *   - ext: new extension without dot ("cpp"); empty removes the extension
 * Outputs: Derived path ("dir/prog.cpp")
 * Theory of Operation: std::filesystem::path::replace_extension.
 */
#include "proofc/support/fs.h"

#include <filesystem>
#include <string>

namespace proofc::support {

auto ChangeExtension(const std::string& path, const std::string& ext) -> std::string {
  std::filesystem::path changed(path);
  changed.replace_extension(ext.empty() ? std::filesystem::path() : std::filesystem::path("." + ext));
  return changed.string();
}

}  // namespace proofc::support
