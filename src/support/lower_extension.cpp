/***
 * Name: proofc::support::LowerExtension
 * Purpose: Extension of a path including the dot, ASCII lower-cased.
 * Inputs: path
 * Outputs: ".prf", ".cpp", ... or "" when the path has no extension
 */
#include "proofc/support/fs.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

namespace proofc::support {

auto LowerExtension(const std::string& path) -> std::string {
  std::string ext = std::filesystem::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char chr) { return static_cast<char>(std::tolower(chr)); });
  return ext;
}

}  // namespace proofc::support
