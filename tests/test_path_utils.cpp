#include <gtest/gtest.h>
#include "pathUtils/pathUtils.hpp"

using namespace pathUtils;

TEST(PathUtilsTest, RootMapsToSlash)
{
    EXPECT_EQ(toCanonical("/data/root", "/data/root"), std::optional<std::string>("/"));
    EXPECT_EQ(toCanonical("/data/root/", "/data/root"), std::optional<std::string>("/"));
}

TEST(PathUtilsTest, ChildrenAreSlashPrefixed)
{
    EXPECT_EQ(toCanonical("/data/root", "/data/root/src/a.txt"), std::optional<std::string>("/src/a.txt"));
    EXPECT_EQ(toCanonical("/data/root", "/data/root/./src//b/../c.txt"), std::optional<std::string>("/src/c.txt"));
}

TEST(PathUtilsTest, OutsideRootIsRejected)
{
    EXPECT_FALSE(toCanonical("/data/root", "/data/other/file").has_value());
    EXPECT_FALSE(toCanonical("/data/root", "/data").has_value());
    EXPECT_FALSE(toCanonical("/data/root", "/data/rootless/x").has_value());
}

TEST(PathUtilsTest, ToAbsoluteInvertsCanonical)
{
    EXPECT_EQ(toAbsolute("/data/root", "/"), fs::path("/data/root"));
    EXPECT_EQ(toAbsolute("/data/root", "/src/a.txt"), fs::path("/data/root/src/a.txt"));
}

TEST(PathUtilsTest, ParentAndDepth)
{
    EXPECT_FALSE(parentOf("/").has_value());
    EXPECT_EQ(parentOf("/src"), std::optional<std::string>("/"));
    EXPECT_EQ(parentOf("/src/b/c.txt"), std::optional<std::string>("/src/b"));

    EXPECT_EQ(depthOf("/"), 0);
    EXPECT_EQ(depthOf("/src"), 1);
    EXPECT_EQ(depthOf("/src/a.txt"), 2);
}

TEST(PathUtilsTest, NamesAndExtensions)
{
    EXPECT_EQ(baseName("/src/a.txt"), "a.txt");
    EXPECT_EQ(extensionOf("/src/README.MD"), "md");
    EXPECT_EQ(extensionOf("/src/archive.tar.gz"), "gz");
    EXPECT_EQ(extensionOf("/home/.bashrc"), "");
    EXPECT_EQ(extensionOf("/Makefile"), "");
}

TEST(PathUtilsTest, DescendantChecksRespectSegments)
{
    EXPECT_TRUE(isSelfOrDescendant("/src", "/src"));
    EXPECT_TRUE(isSelfOrDescendant("/src", "/src/b/c.txt"));
    EXPECT_FALSE(isSelfOrDescendant("/src", "/srcfile"));
    EXPECT_TRUE(isSelfOrDescendant("/", "/anything"));
    EXPECT_TRUE(isSelfOrDescendant("/tmp/root/", "/tmp/root/a"));
    EXPECT_FALSE(isSelfOrDescendant("/tmp/root", "/tmp/rootless/a"));
}

TEST(PathUtilsTest, RepositoryRootForInternalPaths)
{
    EXPECT_EQ(repoRootForInternalPath("/.git/HEAD"), std::optional<std::string>("/"));
    EXPECT_EQ(repoRootForInternalPath("/.git"), std::optional<std::string>("/"));
    EXPECT_EQ(repoRootForInternalPath("/a/.git/refs/heads/main"), std::optional<std::string>("/a"));
    EXPECT_FALSE(repoRootForInternalPath("/a/b.txt").has_value());
    EXPECT_FALSE(repoRootForInternalPath("/a/.github/workflows").has_value());

    EXPECT_TRUE(isGitInternal("/a/.git/config"));
    EXPECT_FALSE(isGitInternal("/a/.gitignore"));
}
