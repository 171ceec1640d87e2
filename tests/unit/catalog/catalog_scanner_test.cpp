#include "test_helpers.h"

#include <gtest/gtest.h>
#include <gamefetch/catalog/catalog.h>
#include <gamefetch/crypto/hasher.h>

using namespace gamefetch;
using namespace gamefetch::catalog;
using namespace gamefetch::test;
namespace fs = std::filesystem;

class CatalogScannerTest : public GameFetchTest {
protected:
    void SetUp() override {
        GameFetchTest::SetUp();
        root = testDir / "game";
        fs::create_directories(root);
    }

    fs::path root;
};

TEST_F(CatalogScannerTest, DirectoriesFirstThenCaseInsensitiveNames) {
    writeFile(root / "b.txt", "bb");
    writeFile(root / "A.txt", "a");
    writeFile(root / "zdir" / "x.bin", "xxxx");
    writeFile(root / "Adir" / "y.bin", "yyy");

    auto scan = scanCatalog(root);
    ASSERT_TRUE(scan) << scan.error().message;

    std::vector<std::string> paths;
    for (const auto& e : scan.value().entries)
        paths.push_back(e.relativePath);
    EXPECT_EQ(paths, (std::vector<std::string>{"Adir/y.bin", "zdir/x.bin", "A.txt", "b.txt"}));
    EXPECT_EQ(scan.value().totalSize, 10u);

    const auto& tree = scan.value().tree;
    ASSERT_EQ(tree.size(), 4u);
    EXPECT_EQ(tree[0].kind, FileTreeNode::Kind::Directory);
    EXPECT_EQ(tree[0].path, "Adir/");
    ASSERT_EQ(tree[0].children.size(), 1u);
    EXPECT_EQ(tree[0].children[0].path, "Adir/y.bin");
    EXPECT_EQ(tree[3].name, "b.txt");
    EXPECT_EQ(tree[3].size, 2u);
}

TEST_F(CatalogScannerTest, ChecksumsCoverWholeFile) {
    const auto content = generateRandomString(200'000);
    writeFile(root / "big.bin", content);

    auto scan = scanCatalog(root);
    ASSERT_TRUE(scan);
    ASSERT_EQ(scan.value().entries.size(), 1u);
    EXPECT_EQ(scan.value().entries[0].checksum,
              "sha256:" + crypto::SHA256Hasher::hash(asBytes(content)));
}

TEST_F(CatalogScannerTest, ZeroByteFilesAreListed) {
    writeFile(root / "empty.cfg", "");
    auto scan = scanCatalog(root);
    ASSERT_TRUE(scan);
    ASSERT_EQ(scan.value().entries.size(), 1u);
    EXPECT_EQ(scan.value().entries[0].sizeBytes, 0u);
    EXPECT_EQ(scan.value().totalSize, 0u);
}

TEST_F(CatalogScannerTest, EmptyDirectoryYieldsEmptyCatalog) {
    fs::create_directories(root / "nested" / "deeper");
    auto scan = scanCatalog(root);
    ASSERT_TRUE(scan);
    EXPECT_TRUE(scan.value().entries.empty());
    ASSERT_EQ(scan.value().tree.size(), 1u);
    EXPECT_EQ(scan.value().tree[0].children.size(), 1u);
}

TEST_F(CatalogScannerTest, MissingRootFails) {
    auto scan = scanCatalog(testDir / "absent");
    ASSERT_FALSE(scan);
    EXPECT_EQ(scan.error().code, ErrorCode::ScanFailed);
}

TEST_F(CatalogScannerTest, BrokenSymlinkFailsWholeScan) {
    writeFile(root / "ok.bin", "ok");
    fs::create_symlink(root / "gone.bin", root / "dangling.bin");
    auto scan = scanCatalog(root);
    ASSERT_FALSE(scan);
    EXPECT_EQ(scan.error().code, ErrorCode::ScanFailed);
}

TEST_F(CatalogScannerTest, SymlinkOutsideRootIsRejected) {
    writeFile(testDir / "outside.bin", "secret");
    fs::create_symlink(testDir / "outside.bin", root / "escape.bin");
    auto scan = scanCatalog(root);
    ASSERT_FALSE(scan);
    EXPECT_EQ(scan.error().code, ErrorCode::PathViolation);
}

TEST_F(CatalogScannerTest, SymlinkCycleFails) {
    fs::create_directories(root / "loop");
    fs::create_directory_symlink(root, root / "loop" / "back");
    auto scan = scanCatalog(root);
    ASSERT_FALSE(scan);
    EXPECT_EQ(scan.error().code, ErrorCode::ScanFailed);
}

TEST_F(CatalogScannerTest, LineBreakInNameFails) {
    writeFile(root / "bad\nname.bin", "x");
    auto scan = scanCatalog(root);
    ASSERT_FALSE(scan);
    EXPECT_EQ(scan.error().code, ErrorCode::ScanFailed);
}

TEST_F(CatalogScannerTest, Latin1NameFails) {
    writeFile(root / "caf\xe9.bin", "x");
    auto scan = scanCatalog(root);
    ASSERT_FALSE(scan);
    EXPECT_EQ(scan.error().code, ErrorCode::ScanFailed);
}

TEST_F(CatalogScannerTest, Utf8NameIsListed) {
    writeFile(root / "caf\xc3\xa9.bin", "x");
    auto scan = scanCatalog(root);
    ASSERT_TRUE(scan) << scan.error().message;
    ASSERT_EQ(scan.value().entries.size(), 1u);
    EXPECT_EQ(scan.value().entries[0].relativePath, "caf\xc3\xa9.bin");
}

TEST(CatalogUrlTest, DownloadUrlIsPercentEncoded) {
    CatalogEntry entry{"maps/first level.pak", 1, ""};
    EXPECT_EQ(downloadUrlFor("my game", entry), "/download/file/my%20game/maps/first%20level.pak");
    EXPECT_EQ(downloadUrlFor("a/b", entry), "/download/file/a%2Fb/maps/first%20level.pak");
}
