/***
 * Name: test_resolve_toolchain_path
 * Purpose: Command-line plugin path wins over the environment.
 */
#include <gtest/gtest.h>

#include <cstdlib>

#include "proofc/plugin/toolchain_plugin.h"

TEST(ResolveToolchainPath, PrefersCommandLine) {
  ::setenv(PROOFC_TOOLCHAIN_ENV, "/env/libtc.so", 1);
  EXPECT_EQ(proofc::plugin::ResolveToolchainPath("/cli/libtc.so"), "/cli/libtc.so");
  EXPECT_EQ(proofc::plugin::ResolveToolchainPath(""), "/env/libtc.so");
  ::unsetenv(PROOFC_TOOLCHAIN_ENV);
  EXPECT_EQ(proofc::plugin::ResolveToolchainPath(""), "");
}
