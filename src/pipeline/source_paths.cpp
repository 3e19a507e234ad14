/***
 * Name: proofc::pipeline::Paths
 * Purpose: Extract the paths of a descriptor list, preserving order.
 */
#include "proofc/pipeline/source.h"

#include <string>
#include <vector>

namespace proofc::pipeline {

auto Paths(const std::vector<SourceDescriptor>& files) -> std::vector<std::string> {
  std::vector<std::string> paths;
  paths.reserve(files.size());
  for (const auto& file : files) {
    paths.push_back(file.path);
  }
  return paths;
}

}  // namespace proofc::pipeline
