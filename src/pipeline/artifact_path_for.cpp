/***
 * Name: proofc::pipeline::ArtifactPathFor
 * Purpose: Deterministic dump path for one VC-unit.
 * Inputs:
 *   - base_file_name: file name of the program input ("prog.prf")
 *   - unit_name: VC-unit name
 *   - config: print_file / dump_dir
 * Outputs: "<print_file stem>_<unit><ext>" when a print file is configured, else
 *   "<temp dir>/<base stem>_<unit>.vc"
 * Theory of Operation: Depends on (base_file_name, unit_name) and configuration only,
 *   so independent runs of different units never share a dump file.
 */
#include "proofc/pipeline/verification_runner.h"

#include <filesystem>
#include <string>

#include "proofc/support/fs.h"

namespace proofc::pipeline {

auto ArtifactPathFor(const std::string& base_file_name, const std::string& unit_name, const Config& config)
    -> std::string {
  std::string dump_path;
  if (config.print_file) {
    dump_path = *config.print_file;
  } else {
    const std::string base = support::ChangeExtension(support::FileName(base_file_name), "vc");
    dump_path = (std::filesystem::path(support::TempDir(config.dump_dir)) / base).string();
  }
  return SuffixedPath(dump_path, unit_name);
}

}  // namespace proofc::pipeline
