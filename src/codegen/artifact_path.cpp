/***
 * Name: proofc::codegen::ArtifactPath
 * Purpose: Native artifact path beside the program ("prog.prf" -> "prog.out"/"prog.so").
 */
#include "proofc/codegen/dispatcher.h"

#include <string>

#include "proofc/support/fs.h"

namespace proofc::codegen {

auto ArtifactPath(const std::string& program_path, backend::OutputKind kind) -> std::string {
  return support::ChangeExtension(program_path, kind == backend::OutputKind::Executable ? "out" : "so");
}

}  // namespace proofc::codegen
