#include "Errors.hpp"
#include "PathUtils.hpp"
#include "TestHelpers.hpp"
#include "types.hpp"

#include <gtest/gtest.h>

using namespace watchflow;
using watchflow::test::TempDir;

TEST(PathUtilsTest, AbsPathCanonicalizes) {
  TempDir tmp;
  std::string sub = tmp.mkdir("a/b");

  EXPECT_EQ(absPath(tmp.path() + "/a/./b/"), sub);
  EXPECT_EQ(absPath(tmp.path() + "/a/b/../b"), sub);
}

TEST(PathUtilsTest, AbsPathResolvesRelativeToCwd) {
  TempDir tmp;
  tmp.mkdir("rel");
  auto old = std::filesystem::current_path();
  std::filesystem::current_path(tmp.path());

  EXPECT_EQ(absPath("rel"), tmp.path() + "/rel");

  std::filesystem::current_path(old);
}

TEST(PathUtilsTest, AbsPathRejectsMissing) {
  TempDir tmp;
  EXPECT_THROW(absPath(tmp.path() + "/missing"), ResolutionError);
  EXPECT_THROW(absPath(""), ResolutionError);
}

TEST(PathUtilsTest, AbsPathRejectsFiles) {
  TempDir tmp;
  std::string file = tmp.touch("file.txt");
  try {
    absPath(file);
    FAIL() << "expected ResolutionError";
  } catch (const ResolutionError &e) {
    EXPECT_EQ(e.path(), file);
  }
}

TEST(PathUtilsTest, IsHidden) {
  EXPECT_TRUE(isHidden("/src/.git"));
  EXPECT_TRUE(isHidden(".cache"));
  EXPECT_TRUE(isHidden("/src/.git/"));
  EXPECT_FALSE(isHidden("/src/git"));
  EXPECT_FALSE(isHidden("/src/.git/objects"));
  EXPECT_FALSE(isHidden("."));
  EXPECT_FALSE(isHidden(".."));
}

TEST(PathUtilsTest, IsContained) {
  EXPECT_TRUE(isContained("/root", "/root/sub/new"));
  EXPECT_TRUE(isContained("/root", "/root"));
  EXPECT_TRUE(isContained("/root/", "/root/sub"));
  EXPECT_FALSE(isContained("/root", "/rootless/sub"));
  EXPECT_FALSE(isContained("/root/sub", "/root"));
  EXPECT_FALSE(isContained("/root", "/root/../etc"));
}

TEST(PathUtilsTest, IsContainedRequiresAbsolutePaths) {
  EXPECT_FALSE(isContained("root", "root/sub"));
  EXPECT_FALSE(isContained("/root", "root/sub"));
}

TEST(OpTest, ToStringAndParse) {
  EXPECT_EQ(opToString(Op::Create), "CREATE");
  EXPECT_EQ(opToString(Op::Create | Op::Rename), "CREATE|RENAME");
  EXPECT_EQ(opToString(Op::None), "NONE");

  EXPECT_EQ(parseOp("Write"), Op::Write);
  EXPECT_EQ(parseOp("CHMOD"), Op::Chmod);
  EXPECT_EQ(parseOp("all"), Op::All);
  EXPECT_THROW(parseOp("touch"), ConfigError);
}
