/***
 * Name: proofc::pipeline::SuffixedPath
 * Purpose: Insert "_<suffix>" between a path's stem and extension.
 * Inputs: path ("/tmp/prog.vc"), suffix ("Mod")
 * Outputs: "/tmp/prog_Mod.vc"
 */
#include "proofc/pipeline/verification_runner.h"

#include <filesystem>
#include <string>

namespace proofc::pipeline {

auto SuffixedPath(const std::string& path, const std::string& suffix) -> std::string {
  const std::filesystem::path original(path);
  const std::string file = original.stem().string() + "_" + suffix + original.extension().string();
  return (original.parent_path() / file).string();
}

}  // namespace proofc::pipeline
