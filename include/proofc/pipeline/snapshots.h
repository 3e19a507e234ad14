/***
 * Name: proofc::pipeline::LookForSnapshots
 * Purpose: Discover file-version snapshot groups for incremental verification.
 * Inputs: Input file paths
 * Outputs: One group per version number; group v holds the existing "<stem>.v<v><ext>"
 *   siblings of the inputs, in input order
 * Theory of Operation: Probe versions 0, 1, 2, ... and stop at the first version for
 *   which no input has a snapshot on disk.
 */
#pragma once

#include <string>
#include <vector>

namespace proofc {
namespace pipeline {

/*** SnapshotName: "<dir>/<stem>.v<version><ext>" for path. */
std::string SnapshotName(const std::string& path, int version);

std::vector<std::vector<std::string>> LookForSnapshots(const std::vector<std::string>& paths);

}  // namespace pipeline
}  // namespace proofc
