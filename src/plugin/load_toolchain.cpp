/***
 * Name: proofc::plugin::LoadToolchain
 * Purpose: Open a toolchain plugin and instantiate its toolchain.
 * Inputs: path of the shared object
 * Outputs: Owning handle; throws ToolchainError when the object cannot be opened,
 *   lacks an entry point, or returns no toolchain
 * Theory of Operation: dlopen with RTLD_NOW so missing symbols surface here rather
 *   than mid-run; the handle is closed again on every failure path.
 */
#include "proofc/plugin/toolchain_plugin.h"

#include <memory>
#include <string>

#include <dlfcn.h>

#include "proofc/exceptions/toolchain_error.h"

namespace proofc::plugin {

namespace {

using CreateFn = toolchain::Toolchain* (*)();

auto LastDlError() -> std::string {
  const char* message = dlerror();
  return message != nullptr ? message : "unknown error";
}

}  // namespace

auto LoadToolchain(const std::string& path) -> std::unique_ptr<LoadedToolchain> {
  void* handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (handle == nullptr) {
    throw exceptions::ToolchainError("cannot load toolchain plugin '" + path + "': " + LastDlError());
  }

  dlerror();
  auto create = reinterpret_cast<CreateFn>(dlsym(handle, PROOFC_TOOLCHAIN_CREATE_SYMBOL));  // NOLINT
  auto destroy = reinterpret_cast<LoadedToolchain::DestroyFn>(                               // NOLINT
      dlsym(handle, PROOFC_TOOLCHAIN_DESTROY_SYMBOL));
  if (create == nullptr || destroy == nullptr) {
    const std::string reason = LastDlError();
    dlclose(handle);
    throw exceptions::ToolchainError("toolchain plugin '" + path + "' does not export " +
                                     PROOFC_TOOLCHAIN_CREATE_SYMBOL + "/" + PROOFC_TOOLCHAIN_DESTROY_SYMBOL +
                                     " (" + reason + ")");
  }

  toolchain::Toolchain* instance = create();
  if (instance == nullptr) {
    dlclose(handle);
    throw exceptions::ToolchainError("toolchain plugin '" + path + "' returned no toolchain");
  }
  return std::make_unique<LoadedToolchain>(handle, instance, destroy);
}

}  // namespace proofc::plugin
