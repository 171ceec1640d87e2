#include "test_helpers.h"

#include <gtest/gtest.h>
#include <gamefetch/crypto/hasher.h>

using namespace gamefetch;
using namespace gamefetch::crypto;
using namespace gamefetch::test;

namespace {
constexpr const char* kEmptySha256 =
    "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr const char* kAbcSha256 =
    "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
} // namespace

class SHA256HasherTest : public GameFetchTest {
protected:
    SHA256Hasher hasher;
};

TEST_F(SHA256HasherTest, EmptyInput) {
    hasher.init();
    EXPECT_EQ(hasher.finalize(), kEmptySha256);
}

TEST_F(SHA256HasherTest, KnownVector) {
    const std::string abc = "abc";
    EXPECT_EQ(SHA256Hasher::hash(asBytes(abc)), kAbcSha256);
}

TEST_F(SHA256HasherTest, StreamingMatchesOneShot) {
    const auto data = generateRandomString(1000);
    const auto bytes = asBytes(data);

    hasher.init();
    hasher.update(bytes.subspan(0, 100));
    hasher.update(bytes.subspan(100, 400));
    hasher.update(bytes.subspan(500));
    EXPECT_EQ(hasher.finalize(), SHA256Hasher::hash(bytes));
}

TEST_F(SHA256HasherTest, HashFileReportsProgress) {
    const auto data = generateRandomString(3 * DEFAULT_CHUNK_SIZE + 17);
    const auto path = writeFile(testDir / "blob.bin", data);

    std::uint64_t lastProcessed = 0;
    std::uint64_t reportedTotal = 0;
    hasher.setProgressCallback([&](std::uint64_t processed, std::uint64_t total) {
        EXPECT_GT(processed, lastProcessed);
        lastProcessed = processed;
        reportedTotal = total;
    });

    auto digest = hasher.hashFile(path);
    ASSERT_TRUE(digest) << digest.error().message;
    EXPECT_EQ(digest.value(), SHA256Hasher::hash(asBytes(data)));
    EXPECT_EQ(lastProcessed, data.size());
    EXPECT_EQ(reportedTotal, data.size());
}

TEST_F(SHA256HasherTest, HashFileMissing) {
    auto digest = hasher.hashFile(testDir / "absent");
    ASSERT_FALSE(digest);
    EXPECT_EQ(digest.error().code, ErrorCode::IoError);
}

TEST(ChecksumTest, ParseNormalisesCase) {
    auto parsed = Checksum::parse("SHA256:BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->hex, kAbcSha256);
    EXPECT_EQ(parsed->toString(), std::string("sha256:") + kAbcSha256);
}

TEST(ChecksumTest, RejectsUnknownTagOrBadDigest) {
    EXPECT_FALSE(Checksum::parse("md5:d41d8cd98f00b204e9800998ecf8427e"));
    EXPECT_FALSE(Checksum::parse(kAbcSha256));
    EXPECT_FALSE(Checksum::parse("sha256:abc"));
    EXPECT_FALSE(Checksum::parse(
        "sha256:zz7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}
