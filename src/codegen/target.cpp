/***
 * Name: proofc::codegen (target properties)
 * Purpose: Canonical extension, build requirement and name lookup per backend.
 */
#include "proofc/codegen/target.h"

#include <optional>
#include <string>

namespace proofc::codegen {

auto CanonicalExtension(Target target) -> const char* {
  switch (target) {
    case Target::Cpp: return "cpp";
    case Target::JavaScript: return "js";
  }
  return "";
}

auto NeedsNativeBuild(Target target) -> bool { return target == Target::Cpp; }

auto ParseTarget(const std::string& name) -> std::optional<Target> {
  if (name == "cpp") {
    return Target::Cpp;
  }
  if (name == "js") {
    return Target::JavaScript;
  }
  return std::nullopt;
}

}  // namespace proofc::codegen
