#include "test_helpers.h"

#include <gtest/gtest.h>
#include <gamefetch/config/client_config.h>
#include <gamefetch/config/config_helpers.h>

#include <cstdlib>

using namespace gamefetch;
using namespace gamefetch::config;
using namespace gamefetch::test;
namespace fs = std::filesystem;

class ClientConfigTest : public GameFetchTest {
protected:
    void SetUp() override {
        GameFetchTest::SetUp();
        ::unsetenv("GAMEFETCH_SERVER_URL");
        ::unsetenv("GAMEFETCH_API_KEY");
    }

    void TearDown() override {
        ::unsetenv("GAMEFETCH_SERVER_URL");
        ::unsetenv("GAMEFETCH_API_KEY");
        GameFetchTest::TearDown();
    }
};

TEST_F(ClientConfigTest, MissingFileGivesDefaults) {
    auto cfg = loadClientConfig(testDir / "absent.toml");
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().serverUrl, "http://127.0.0.1:8000");
    EXPECT_EQ(cfg.value().stallTimeout, std::chrono::seconds(30));
    EXPECT_TRUE(cfg.value().verifyChecksums);
}

TEST_F(ClientConfigTest, ReadsClientSection) {
    const auto path = writeFile(testDir / "config.toml", R"(
# gamefetch client
[other]
server_url = "http://wrong"

[client]
server_url = "http://games.lan:9000/"   # trailing slash is dropped
api_key = 'k#ey'
install_root = "/opt/games"
catalog_timeout_ms = 2500
stall_timeout_s = 5
verify_checksums = off
)");
    auto cfg = loadClientConfig(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().serverUrl, "http://games.lan:9000");
    EXPECT_EQ(cfg.value().apiKey, "k#ey");
    EXPECT_EQ(cfg.value().installRoot, fs::path("/opt/games"));
    EXPECT_EQ(cfg.value().catalogTimeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(cfg.value().stallTimeout, std::chrono::seconds(5));
    EXPECT_FALSE(cfg.value().verifyChecksums);
}

TEST_F(ClientConfigTest, EnvironmentOverridesFile) {
    const auto path = writeFile(testDir / "config.toml", "[client]\napi_key = file\n");
    ::setenv("GAMEFETCH_API_KEY", "env", 1);
    ::setenv("GAMEFETCH_SERVER_URL", "http://env:1/", 1);
    auto cfg = loadClientConfig(path);
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().apiKey, "env");
    EXPECT_EQ(cfg.value().serverUrl, "http://env:1");
}

TEST_F(ClientConfigTest, RejectsBadValues) {
    auto bad = writeFile(testDir / "bad.toml", "[client]\nstall_timeout_s = soon\n");
    auto cfg = loadClientConfig(bad);
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument);

    writeFile(bad, "[client]\nverify_checksums = maybe\n");
    EXPECT_FALSE(loadClientConfig(bad));

    writeFile(bad, "[client]\nconnect_timeout_ms = -5\n");
    EXPECT_FALSE(loadClientConfig(bad));
}

TEST(ConfigHelpersTest, ParseBoolAndUnquote) {
    EXPECT_EQ(parse_bool(" Yes "), true);
    EXPECT_EQ(parse_bool("0"), false);
    EXPECT_FALSE(parse_bool("2"));
    EXPECT_EQ(unquote(" \"a b\" "), "a b");
    EXPECT_EQ(unquote("'x'"), "x");
    EXPECT_EQ(unquote("plain"), "plain");
}

TEST(ConfigHelpersTest, ConfigPathFollowsXdg) {
    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    EXPECT_EQ(get_config_path(), fs::path("/tmp/xdg/gamefetch/config.toml"));
    EXPECT_EQ(get_config_path("/my/own.toml"), fs::path("/my/own.toml"));
    ::unsetenv("XDG_CONFIG_HOME");
}
