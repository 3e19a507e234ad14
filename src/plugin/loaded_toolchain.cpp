/***
 * Name: proofc::plugin::LoadedToolchain::~LoadedToolchain
 * Purpose: Destroy the toolchain with the plugin's own deleter, then unload it.
 */
#include "proofc/plugin/toolchain_plugin.h"

#include <dlfcn.h>

namespace proofc::plugin {

LoadedToolchain::~LoadedToolchain() {
  if (toolchain_ != nullptr && destroy_ != nullptr) {
    destroy_(toolchain_);
  }
  if (handle_ != nullptr) {
    dlclose(handle_);
  }
}

}  // namespace proofc::plugin
