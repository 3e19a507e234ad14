/***
 * Name: proofc::codegen::Dispatcher::CopyImmutableDependency
 * Purpose: Place the immutable-collections library beside an optimized artifact.
 * Inputs: program name (its directory is the destination)
 * Outputs: true on success; false after reporting the failure
 */
#include "proofc/codegen/dispatcher.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace proofc::codegen {

auto Dispatcher::CopyImmutableDependency(const std::string& program_name) -> bool {
  namespace fs = std::filesystem;
  const fs::path source(ImmutableDependencyPath(ctx_.config));
  fs::path directory = fs::path(program_name).parent_path();
  if (directory.empty()) {
    directory = ".";
  }
  const fs::path destination = directory / source.filename();

  std::error_code ec;
  const bool same_file = fs::exists(destination, ec) && fs::equivalent(source, destination, ec);
  if (!same_file) {
    fs::copy_file(source, destination, fs::copy_options::overwrite_existing, ec);
    if (ec) {
      ctx_.printer.ErrorWriteLine("proofc: failed to copy optimize dependency " + source.string() + " to " +
                                  directory.string() + ": " + ec.message());
      return false;
    }
  }
  ctx_.printer.WriteLine("Copied optimize dependency " + source.filename().string() + " to " + directory.string());
  return true;
}

}  // namespace proofc::codegen
