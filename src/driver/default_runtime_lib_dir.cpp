/***
 * Name: proofc::driver::DefaultRuntimeLibDir
 * Purpose: Directory of the running proofc executable ("." when unknown).
 */
#include "proofc/driver/app.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace proofc::driver {

auto DefaultRuntimeLibDir() -> std::string {
  std::error_code ec;
  const std::filesystem::path self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec || self.parent_path().empty()) {
    return ".";
  }
  return self.parent_path().string();
}

}  // namespace proofc::driver
