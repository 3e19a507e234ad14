/***
 * Name: proofc::codegen::Target
 * Purpose: Closed set of code-generation backends.
 * Inputs: N/A
 * Outputs: Target enum and per-target properties
 * Theory of Operation: Cpp output feeds the native toolchain; JavaScript output is a
 *   self-contained script with no further build step.
 */
#pragma once

#include <optional>
#include <string>

namespace proofc {
namespace codegen {

enum class Target { Cpp, JavaScript };

/*** CanonicalExtension: "cpp" or "js" (no dot). */
const char* CanonicalExtension(Target target);

/*** NeedsNativeBuild: True when generated source is compiled further. */
bool NeedsNativeBuild(Target target);

/*** ParseTarget: "cpp"/"js" to Target; nullopt for anything else. */
std::optional<Target> ParseTarget(const std::string& name);

}  // namespace codegen
}  // namespace proofc
