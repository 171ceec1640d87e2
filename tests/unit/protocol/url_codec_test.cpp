#include <gtest/gtest.h>
#include <gamefetch/protocol/url_codec.h>

using namespace gamefetch;
using namespace gamefetch::protocol;

TEST(UrlCodecTest, EncodeKeepsUnreservedAndSlash) {
    EXPECT_EQ(percentEncode("dir/file-1_v2.~bin"), "dir/file-1_v2.~bin");
    EXPECT_EQ(percentEncode("a b/c"), "a%20b/c");
    EXPECT_EQ(percentEncode("a/b", true), "a%2Fb");
    EXPECT_EQ(percentEncode("100%"), "100%25");
}

TEST(UrlCodecTest, DecodeReversesEncode) {
    const std::string raw = "Spiel Daten/level #1 (final).pak";
    auto decoded = percentDecode(percentEncode(raw));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), raw);
}

TEST(UrlCodecTest, PlusIsSpaceOnlyInQueries) {
    EXPECT_EQ(percentDecode("a+b").value(), "a+b");
    EXPECT_EQ(percentDecode("a+b", true).value(), "a b");
}

TEST(UrlCodecTest, MalformedEscapesAreRejected) {
    EXPECT_FALSE(percentDecode("%"));
    EXPECT_FALSE(percentDecode("abc%2"));
    EXPECT_FALSE(percentDecode("%zz"));
    auto nul = percentDecode("a%00b");
    ASSERT_FALSE(nul);
    EXPECT_EQ(nul.error().code, ErrorCode::InvalidArgument);
}

TEST(UrlCodecTest, Utf8Validation) {
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("plain/ascii.pak"));
    EXPECT_TRUE(isValidUtf8("caf\xc3\xa9"));
    EXPECT_TRUE(isValidUtf8("\xe2\x82\xac and \xf0\x9f\x8e\xae"));
    EXPECT_FALSE(isValidUtf8("caf\xe9"));
    EXPECT_FALSE(isValidUtf8("\xc0\xaf"));         // overlong '/'
    EXPECT_FALSE(isValidUtf8("\xed\xa0\x80"));     // surrogate
    EXPECT_FALSE(isValidUtf8("\xe2\x82"));         // truncated
    EXPECT_FALSE(isValidUtf8("\xf4\x90\x80\x80")); // past U+10FFFF
}

TEST(UrlCodecTest, TargetPathDropsQuery) {
    EXPECT_EQ(targetPath("/games/x/start?progress=5"), "/games/x/start");
    EXPECT_EQ(targetPath("/games"), "/games");
}

TEST(UrlCodecTest, QueryParamLookup) {
    const std::string target = "/download/stream/g?progress=42.5&chunk_size=4096&flag";
    EXPECT_EQ(getQueryParam(target, "progress"), "42.5");
    EXPECT_EQ(getQueryParam(target, "chunk_size"), "4096");
    EXPECT_EQ(getQueryParam(target, "flag"), "");
    EXPECT_FALSE(getQueryParam(target, "offset"));
    EXPECT_FALSE(getQueryParam("/games", "progress"));
    EXPECT_EQ(getQueryParam("/x?name=a%20b+c", "name"), "a b c");
}
