#include <gtest/gtest.h>

#include <filesystem>

#include "path_guard.hpp"
#include "test_util.hpp"

using namespace sfs;
namespace fs = std::filesystem;

class PathGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = sandbox.mkdir("public");
        sandbox.write("public/index.html", "<h1>hi</h1>");
        sandbox.write("public/css/site.css", "body{}");
        sandbox.write("secret.txt", "top secret");
    }

    test::TempDir sandbox;
    fs::path root;
};

TEST_F(PathGuardTest, AcceptsFileInsideRoot) {
    auto resolved = resolve_safe_path("/index.html", root);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, root / "index.html");
}

TEST_F(PathGuardTest, AcceptsNestedFile) {
    auto resolved = resolve_safe_path("/css/site.css", root);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, root / "css" / "site.css");
}

TEST_F(PathGuardTest, AcceptsRootItself) {
    auto resolved = resolve_safe_path("/", root);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_TRUE(fs::equivalent(*resolved, root));
}

TEST_F(PathGuardTest, AcceptsMissingFileInsideRoot) {
    auto resolved = resolve_safe_path("/does/not/exist.html", root);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_TRUE(is_within(*resolved, root));
}

TEST_F(PathGuardTest, RejectsParentDirectorySegments) {
    EXPECT_FALSE(resolve_safe_path("/../secret.txt", root).has_value());
    EXPECT_FALSE(resolve_safe_path("/../etc/passwd", root).has_value());
    EXPECT_FALSE(resolve_safe_path("/css/../../secret.txt", root).has_value());
    EXPECT_FALSE(resolve_safe_path("/..", root).has_value());
    EXPECT_FALSE(resolve_safe_path("..", root).has_value());
}

TEST_F(PathGuardTest, RejectsSymlinkPointingOutside) {
    fs::create_symlink(sandbox.path() / "secret.txt", root / "leak.txt");
    fs::create_directory_symlink(sandbox.path(), root / "escape");

    EXPECT_FALSE(resolve_safe_path("/leak.txt", root).has_value());
    EXPECT_FALSE(resolve_safe_path("/escape/secret.txt", root).has_value());
    EXPECT_FALSE(resolve_safe_path("/escape", root).has_value());
}

TEST_F(PathGuardTest, AcceptsSymlinkStayingInside) {
    fs::create_symlink(root / "index.html", root / "home.html");
    auto resolved = resolve_safe_path("/home.html", root);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, root / "index.html");
}

TEST_F(PathGuardTest, ExtraLeadingSlashesStayRelative) {
    auto resolved = resolve_safe_path("//index.html", root);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, root / "index.html");
}

TEST(PathGuard, IsWithinComparesWholeComponents) {
    EXPECT_TRUE(is_within("/srv/public", "/srv/public"));
    EXPECT_TRUE(is_within("/srv/public/a/b.txt", "/srv/public"));
    EXPECT_TRUE(is_within("/srv/public/a", "/srv/public/"));
    EXPECT_FALSE(is_within("/srv/public2/a", "/srv/public"));
    EXPECT_FALSE(is_within("/srv", "/srv/public"));
    EXPECT_FALSE(is_within("/etc/passwd", "/srv/public"));
}
