/***
 * Name: test_fs
 * Purpose: Path helpers and file writing.
 */
#include <gtest/gtest.h>

#include <string>

#include "proofc/support/fs.h"
#include "util/FakeToolchain.h"

using namespace proofc::support;

TEST(Fs, ChangeExtension) {
  EXPECT_EQ(ChangeExtension("dir/prog.prf", "vc"), "dir/prog.vc");
  EXPECT_EQ(ChangeExtension("prog", "cpp"), "prog.cpp");
  EXPECT_EQ(ChangeExtension("dir/prog.prf", ""), "dir/prog");
}

TEST(Fs, FileNameAndExtension) {
  EXPECT_EQ(FileName("/a/b/prog.prf"), "prog.prf");
  EXPECT_EQ(LowerExtension("/a/B.PrF"), ".prf");
  EXPECT_EQ(LowerExtension("Makefile"), "");
}

TEST(Fs, TempDirOverride) {
  EXPECT_EQ(TempDir("/work/dump"), "/work/dump");
  EXPECT_FALSE(TempDir("").empty());
}

TEST(Fs, WriteFileReportsFailure) {
  testutil::ScratchDir dir;
  std::string err;
  ASSERT_TRUE(WriteFile(dir.Path("out.cpp"), "int x;\n", err)) << err;
  EXPECT_EQ(dir.Read(dir.Path("out.cpp")), "int x;\n");
  EXPECT_FALSE(WriteFile(dir.Path("missing/out.cpp"), "", err));
  EXPECT_EQ(err, "failed to open file for write: " + dir.Path("missing/out.cpp"));
}
