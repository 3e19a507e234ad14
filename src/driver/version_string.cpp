/***
 * Name: proofc::driver::VersionString
 * Purpose: Banner text, "proofc <version>".
 */
#include "proofc/driver/app.h"

#include <string>

#ifndef PROOFC_VERSION
#define PROOFC_VERSION "0.0.0"
#endif

namespace proofc::driver {

auto VersionString() -> std::string { return std::string("proofc ") + PROOFC_VERSION; }

}  // namespace proofc::driver
