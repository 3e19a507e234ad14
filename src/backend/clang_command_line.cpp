/***
 * Name: proofc::backend::ClangToolchain::CommandLine
 * Purpose: Compose the compiler invocation for a build request.
 * Inputs: request (options, kind, output, sources, libraries, link references)
 * Outputs: argv vector: <cxx> <options> [-shared -fPIC] -o <output> <sources> <libraries> -l<refs>
 */
#include "proofc/backend/native_toolchain.h"

#include <string>
#include <vector>

namespace proofc::backend {

auto ClangToolchain::CommandLine(const BuildRequest& request) const -> std::vector<std::string> {
  std::vector<std::string> args;
  args.push_back(cxx_);
  args.insert(args.end(), request.options.begin(), request.options.end());
  if (request.kind == OutputKind::Library) {
    args.emplace_back("-shared");
    args.emplace_back("-fPIC");
  }
  args.emplace_back("-o");
  args.push_back(request.output);
  args.insert(args.end(), request.sources.begin(), request.sources.end());
  args.insert(args.end(), request.libraries.begin(), request.libraries.end());
  for (const auto& ref : request.link_refs) {
    args.push_back("-l" + ref);
  }
  return args;
}

}  // namespace proofc::backend
