/***
 * Name: proofc::support::FileName
 * Purpose: Return the final component of a path ("dir/a.prf" -> "a.prf").
 */
#include "proofc/support/fs.h"

#include <filesystem>
#include <string>

namespace proofc::support {

auto FileName(const std::string& path) -> std::string {
  return std::filesystem::path(path).filename().string();
}

}  // namespace proofc::support
