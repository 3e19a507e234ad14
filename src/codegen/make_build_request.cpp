/***
 * Name: proofc::codegen::MakeBuildRequest
 * Purpose: Compose the native build of a generated C++ program.
 * Inputs:
 *   - generated_source: path of the generated .cpp file
 *   - has_main: executable when true, shared library otherwise
 *   - output: artifact path
 *   - other_files: native sources (compiled along) and libraries (linked)
 *   - config: runtime library and optimize settings
 * Outputs: BuildRequest
 */
#include "proofc/codegen/dispatcher.h"

#include <filesystem>
#include <string>
#include <vector>

namespace proofc::codegen {

auto MakeBuildRequest(const std::string& generated_source, bool has_main, const std::string& output,
                      const std::vector<pipeline::SourceDescriptor>& other_files, const pipeline::Config& config)
    -> backend::BuildRequest {
  backend::BuildRequest request;
  request.output = output;
  request.kind = has_main ? backend::OutputKind::Executable : backend::OutputKind::Library;
  request.options = {"-g", "-Wno-unused-label", "-Wno-unused-variable", "-Wno-self-assign",
                     "-Wno-unreachable-code"};
  request.link_refs = {"m"};
  request.sources.push_back(generated_source);

  if (config.use_runtime_lib) {
    request.libraries.push_back((std::filesystem::path(config.runtime_lib_dir) / "libproofc_runtime.a").string());
  }
  if (config.optimize) {
    request.options.emplace_back("-O2");
    request.options.emplace_back("-DPROOFC_USE_IMMUTABLE_COLLECTIONS");
    request.libraries.push_back(ImmutableDependencyPath(config));
    request.link_refs.emplace_back("pthread");
  }

  for (const auto& file : other_files) {
    switch (file.kind) {
      case pipeline::SourceKind::NativeSource:
        request.sources.push_back(file.path);
        break;
      case pipeline::SourceKind::NativeLibrary:
        request.libraries.push_back(file.path);
        break;
      case pipeline::SourceKind::Program:
        break;
    }
  }
  return request;
}

}  // namespace proofc::codegen
