#include "test_helpers.h"

#include <gtest/gtest.h>
#include <gamefetch/catalog/path_guard.h>

using namespace gamefetch;
using namespace gamefetch::catalog;
using namespace gamefetch::test;
namespace fs = std::filesystem;

class PathGuardTest : public GameFetchTest {
protected:
    void SetUp() override {
        GameFetchTest::SetUp();
        root = testDir / "root";
        writeFile(root / "data" / "level1.pak", "pak");
        writeFile(testDir / "secret.txt", "secret");
    }

    fs::path root;
};

TEST_F(PathGuardTest, ResolvesNestedFile) {
    auto r = resolveUnderRoot(root, "data/level1.pak");
    ASSERT_TRUE(r) << r.error().message;
    EXPECT_EQ(r.value(), fs::canonical(root / "data" / "level1.pak"));
}

TEST_F(PathGuardTest, MissingFileStillResolves) {
    auto r = resolveUnderRoot(root, "data/not-there.bin");
    ASSERT_TRUE(r);
    EXPECT_FALSE(fs::exists(r.value()));
}

TEST_F(PathGuardTest, RejectsTraversalBeforeTouchingDisk) {
    for (const char* bad : {"../secret.txt", "data/../../secret.txt", "./data/level1.pak",
                            "data//level1.pak", "/etc/passwd", "data\\level1.pak", "", "data/"}) {
        auto r = resolveUnderRoot(root, bad);
        ASSERT_FALSE(r) << bad;
        EXPECT_EQ(r.error().code, ErrorCode::PathViolation) << bad;
    }
}

TEST_F(PathGuardTest, RejectsSymlinkEscapingRoot) {
    fs::create_symlink(testDir / "secret.txt", root / "link.txt");
    auto r = resolveUnderRoot(root, "link.txt");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::PathViolation);
}

TEST_F(PathGuardTest, AllowsSymlinkInsideRoot) {
    fs::create_symlink(root / "data" / "level1.pak", root / "alias.pak");
    auto r = resolveUnderRoot(root, "alias.pak");
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), fs::canonical(root / "data" / "level1.pak"));
}

TEST_F(PathGuardTest, MissingRootIsNotFound) {
    auto r = resolveUnderRoot(testDir / "nowhere", "a.bin");
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::NotFound);
}

TEST(IsWithinRootTest, ComparesWholeComponents) {
    EXPECT_TRUE(isWithinRoot("/srv/games", "/srv/games/a/b"));
    EXPECT_TRUE(isWithinRoot("/srv/games/", "/srv/games/a"));
    EXPECT_FALSE(isWithinRoot("/srv/games", "/srv/games2/a"));
    EXPECT_FALSE(isWithinRoot("/srv/games", "/srv"));
}
