/***
 * Name: proofc::support::TempDir
 * Purpose: Directory for intermediate artifacts (VC dumps, unpersisted sources).
 * Inputs: override_dir (configured dump directory, may be empty)
 * Outputs: override_dir when set, else the system temporary directory
 * Theory of Operation: Falls back to "/tmp" when the system query fails.
 */
#include "proofc/support/fs.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace proofc::support {

auto TempDir(const std::string& override_dir) -> std::string {
  if (!override_dir.empty()) {
    return override_dir;
  }
  std::error_code errc;
  const auto dir = std::filesystem::temp_directory_path(errc);
  if (errc) {
    return "/tmp";
  }
  return dir.string();
}

}  // namespace proofc::support
