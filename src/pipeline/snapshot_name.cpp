/***
 * Name: proofc::pipeline::SnapshotName
 * Purpose: Path of version `version` of an input ("dir/a.prf", 2 -> "dir/a.v2.prf").
 */
#include <filesystem>
#include <string>

#include "proofc/pipeline/snapshots.h"

namespace proofc::pipeline {

auto SnapshotName(const std::string& path, int version) -> std::string {
  const std::filesystem::path original(path);
  const std::string file =
      original.stem().string() + ".v" + std::to_string(version) + original.extension().string();
  return (original.parent_path() / file).string();
}

}  // namespace proofc::pipeline
