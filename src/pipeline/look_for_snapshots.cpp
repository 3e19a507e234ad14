/***
 * Name: proofc::pipeline::LookForSnapshots
 * Purpose: Group existing snapshot files by version number.
 * Inputs: Input file paths
 * Outputs: Groups for versions 0..n-1, where version n is the first with no file
 */
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "proofc/pipeline/snapshots.h"

namespace proofc::pipeline {

auto LookForSnapshots(const std::vector<std::string>& paths) -> std::vector<std::vector<std::string>> {
  std::vector<std::vector<std::string>> groups;
  for (int version = 0;; ++version) {
    std::vector<std::string> group;
    for (const auto& path : paths) {
      const std::string candidate = SnapshotName(path, version);
      std::error_code ec;
      if (std::filesystem::exists(candidate, ec)) {
        group.push_back(candidate);
      }
    }
    if (group.empty()) {
      break;
    }
    groups.push_back(std::move(group));
  }
  return groups;
}

}  // namespace proofc::pipeline
