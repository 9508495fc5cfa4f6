#include <gtest/gtest-spi.h>
#include <gtest/gtest.h>

#include "ramcp_core/utils.h"
#include "test_support.h"

using namespace ramcp;

TEST(UtilsTest, PathUriRoundTripEscapesSpaces) {
  std::string uri = PathToUri("/work/my crate/src/lib.rs");
  EXPECT_EQ(uri, "file:///work/my%20crate/src/lib.rs");
  EXPECT_EQ(UriToPath(uri), "/work/my crate/src/lib.rs");
}

TEST(UtilsTest, UriToPathLeavesOtherSchemesAlone) {
  EXPECT_EQ(UriToPath("untitled:Untitled-1"), "untitled:Untitled-1");
}

TEST(UtilsTest, UrlDecodeKeepsBrokenEscapes) {
  EXPECT_EQ(UrlDecode("a%2Fb"), "a/b");
  EXPECT_EQ(UrlDecode("100%"), "100%");
  EXPECT_EQ(UrlDecode("%zz"), "%zz");
}

TEST(UtilsTest, CaseInsensitiveSearch) {
  EXPECT_TRUE(ContainsIgnoreCase("Extract Into Function", "into function"));
  EXPECT_FALSE(ContainsIgnoreCase("Inline", "inlined"));
  EXPECT_TRUE(HasPrefixIgnoreCase("Content-Length", "content-"));
  EXPECT_EQ(Trim("  value \t\r\n"), "value");
  EXPECT_EQ(ToLower("Content-Type"), "content-type");
}

TEST(UtilsTest, ResolveConfigPathPrefersConfigDirectory) {
  testutil::TempDir config_dir;
  testutil::TempDir workspace;
  config_dir.Write("bin/tool", "");
  EXPECT_EQ(ResolveConfigPath("bin/tool", config_dir.path(), workspace.path()).string(),
            (config_dir.path() / "bin/tool").string());
  EXPECT_EQ(ResolveConfigPath("other/tool", config_dir.path(), workspace.path()).string(),
            (workspace.path() / "other/tool").string());
  EXPECT_EQ(ResolveConfigPath("/abs/./tool", config_dir.path(), workspace.path()).string(),
            "/abs/tool");
  EXPECT_TRUE(ResolveConfigPath("", config_dir.path(), workspace.path()).empty());
}

TEST(UtilsTest, ReadFileToStringReportsFailures) {
  testutil::TempDir dir;
  auto file = dir.Write("a.txt", "hello");
  std::string text;
  std::string error;
  ASSERT_TRUE(ReadFileToString(file, &text, &error)) << error;
  EXPECT_EQ(text, "hello");

  EXPECT_FALSE(ReadFileToString(dir.path() / "missing.txt", &text, &error));
  EXPECT_NE(error.find("missing.txt"), std::string::npos);
  EXPECT_FALSE(ReadFileToString(dir.path(), &text, &error));
}

TEST(UtilsTest, TempDirFailureLeavesParentIntact) {
  testutil::TempDir outer;
  std::filesystem::path sentinel = outer.Write("keep.txt", "keep");
  std::filesystem::path missing = outer.path() / "missing";
  bool empty_path = false;
  EXPECT_NONFATAL_FAILURE(
      {
        testutil::TempDir inner(missing);
        empty_path = inner.path().empty();
      },
      "mkdtemp failed");
  EXPECT_TRUE(empty_path);
  EXPECT_TRUE(std::filesystem::exists(sentinel));
}
