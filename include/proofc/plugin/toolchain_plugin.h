/***
 * Name: proofc::plugin (toolchain plugin)
 * Purpose: Load a toolchain (front end, translator, proof engine, code generators)
 *   from a shared object at run time.
 * Inputs: Path to the plugin
 * Outputs: Owning LoadedToolchain handle
 * Theory of Operation: The plugin exports two C symbols, normally through
 *   PROOFC_EXPORT_TOOLCHAIN; the handle destroys the toolchain before dlclose.
 */
#pragma once

#include <memory>
#include <string>

#include "proofc/toolchain/toolchain.h"

#define PROOFC_TOOLCHAIN_CREATE_SYMBOL "proofc_create_toolchain"
#define PROOFC_TOOLCHAIN_DESTROY_SYMBOL "proofc_destroy_toolchain"
#define PROOFC_TOOLCHAIN_ENV "PROOFC_TOOLCHAIN"

// Place once in a plugin translation unit; Type must be default constructible.
#define PROOFC_EXPORT_TOOLCHAIN(Type)                                                        \
  extern "C" ::proofc::toolchain::Toolchain* proofc_create_toolchain() { return new Type(); } \
  extern "C" void proofc_destroy_toolchain(::proofc::toolchain::Toolchain* toolchain) { delete toolchain; }

namespace proofc {
namespace plugin {

class LoadedToolchain {
 public:
  using DestroyFn = void (*)(toolchain::Toolchain*);

  LoadedToolchain(void* handle, toolchain::Toolchain* toolchain, DestroyFn destroy) noexcept
      : handle_(handle), toolchain_(toolchain), destroy_(destroy) {}
  ~LoadedToolchain();
  LoadedToolchain(const LoadedToolchain&) = delete;
  LoadedToolchain& operator=(const LoadedToolchain&) = delete;

  toolchain::Toolchain& Get() { return *toolchain_; }

 private:
  void* handle_;
  toolchain::Toolchain* toolchain_;
  DestroyFn destroy_;
};

/*** LoadToolchain: dlopen path and create its toolchain; throws ToolchainError. */
std::unique_ptr<LoadedToolchain> LoadToolchain(const std::string& path);

/*** ResolveToolchainPath: cli_value if set, else $PROOFC_TOOLCHAIN, else "". */
std::string ResolveToolchainPath(const std::string& cli_value);

}  // namespace plugin
}  // namespace proofc
