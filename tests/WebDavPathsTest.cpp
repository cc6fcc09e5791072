#include "WebDavPaths.hpp"
#include <gtest/gtest.h>

using namespace davsync::webdav;

TEST(WebDavPathsTest, EncodesSegmentsButKeepsSlashes) {
  EXPECT_EQ(encodePath("/My Docs/a+b.txt"), "/My%20Docs/a%2Bb.txt");
  EXPECT_EQ(encodePath("/dir/"), "/dir/");
  EXPECT_EQ(encodePath(""), "/");
}

TEST(WebDavPathsTest, ParentAndBaseName) {
  EXPECT_EQ(parentPath("/a/b/c.txt"), "/a/b/");
  EXPECT_EQ(parentPath("/c.txt"), "/");
  EXPECT_EQ(baseName("/a/b/c.txt"), "c.txt");
}

TEST(WebDavPathsTest, JoinsWithoutDoubleSlash) {
  EXPECT_EQ(joinUrl("http://h/dav/", "/x"), "http://h/dav/x");
  EXPECT_EQ(joinUrl("http://h/dav", "x"), "http://h/dav/x");
}

TEST(WebDavPathsTest, ResolvesLocationAgainstRequest) {
  EXPECT_EQ(resolveLocation("https://h:8443/dav/files/", "/tus/abc"),
            "https://h:8443/tus/abc");
  EXPECT_EQ(resolveLocation("https://h/dav/files/", "abc"),
            "https://h/dav/files/abc");
  EXPECT_EQ(resolveLocation("https://h/dav/", "https://other/x"),
            "https://other/x");
  EXPECT_EQ(resolveLocation("https://h/dav/", ""), "");
}

TEST(WebDavPathsTest, SplitsUrl) {
  auto parts = splitUrl("http://host:8080/a/b?q=1");
  EXPECT_EQ(parts.origin, "http://host:8080");
  EXPECT_EQ(parts.path, "/a/b?q=1");
  EXPECT_EQ(splitUrl("http://host").path, "/");
}

TEST(WebDavPathsTest, StripsEtagQuotes) {
  EXPECT_EQ(stripQuotes("\"abc\""), "abc");
  EXPECT_EQ(stripQuotes("abc"), "abc");
}
