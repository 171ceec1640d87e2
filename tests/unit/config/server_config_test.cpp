#include "test_helpers.h"

#include <gtest/gtest.h>
#include <gamefetch/config/server_config.h>

#include <cstdlib>

using namespace gamefetch;
using namespace gamefetch::config;
using namespace gamefetch::test;
namespace fs = std::filesystem;

class ServerConfigTest : public GameFetchTest {};

TEST_F(ServerConfigTest, ParsesFullDocument) {
    const std::string doc = R"({
        "server": {"host": "127.0.0.1", "port": 9100, "verify": true, "secret_key": "s3cret"},
        "games": [
            {"id": "doom", "name": "Doom", "version": "1.9", "description": "Shareware",
             "directory": "/srv/games/doom", "configToClient": {"exe": "doom.exe"}},
            {"id": "quake", "directory": "quake"}
        ]
    })";
    auto cfg = parseServerConfig(doc, "/etc/gamefetch");
    ASSERT_TRUE(cfg) << cfg.error().message;

    const auto& c = cfg.value();
    EXPECT_EQ(c.server.host, "127.0.0.1");
    EXPECT_EQ(c.server.port, 9100);
    EXPECT_TRUE(c.authEnabled());
    ASSERT_EQ(c.games.size(), 2u);
    EXPECT_EQ(c.games[0].configToClient->at("exe"), "doom.exe");
    EXPECT_EQ(c.games[1].name, "quake");
    EXPECT_EQ(c.games[1].directory, fs::path("/etc/gamefetch/quake"));
    ASSERT_NE(c.findGame("quake"), nullptr);
    EXPECT_EQ(c.findGame("heretic"), nullptr);
}

TEST_F(ServerConfigTest, DefaultsWithoutServerSection) {
    auto cfg = parseServerConfig(R"({"games": []})");
    ASSERT_TRUE(cfg);
    EXPECT_EQ(cfg.value().server.host, "0.0.0.0");
    EXPECT_EQ(cfg.value().server.port, 8000);
    EXPECT_FALSE(cfg.value().authEnabled());
}

TEST_F(ServerConfigTest, VerificationCanBeDisabled) {
    auto cfg = parseServerConfig(R"({"server": {"verify": false, "secret_key": "k"}})");
    ASSERT_TRUE(cfg);
    EXPECT_FALSE(cfg.value().authEnabled());
}

TEST_F(ServerConfigTest, RejectsInvalidDocuments) {
    for (const char* doc : {
             "{not json",
             "[]",
             R"({"server": {"port": 70000}})",
             R"({"server": {"port": "eighty"}})",
             R"({"games": [{"name": "no id", "directory": "/x"}]})",
             R"({"games": [{"id": "a"}]})",
             R"({"games": [{"id": "a", "directory": "/x"}, {"id": "a", "directory": "/y"}]})",
         }) {
        auto cfg = parseServerConfig(doc);
        ASSERT_FALSE(cfg) << doc;
        EXPECT_EQ(cfg.error().code, ErrorCode::InvalidArgument) << doc;
    }
}

TEST_F(ServerConfigTest, LoadResolvesRelativeToConfigFile) {
    fs::create_directories(testDir / "games" / "doom");
    const auto path = writeFile(testDir / "config.json",
                                R"({"games": [{"id": "doom", "directory": "games/doom"}]})");
    auto cfg = loadServerConfig(path);
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(fs::canonical(cfg.value().games[0].directory), fs::canonical(testDir / "games/doom"));
}

TEST_F(ServerConfigTest, LoadMissingFileIsNotFound) {
    auto cfg = loadServerConfig(testDir / "missing.json");
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::NotFound);
}

TEST_F(ServerConfigTest, ConfigPathPrecedence) {
    ::setenv("GAMEFETCH_CONFIG", "/from/env.json", 1);
    EXPECT_EQ(resolveServerConfigPath("/from/flag.json"), fs::path("/from/flag.json"));
    EXPECT_EQ(resolveServerConfigPath(), fs::path("/from/env.json"));
    ::unsetenv("GAMEFETCH_CONFIG");
    EXPECT_EQ(resolveServerConfigPath(), fs::path("config.json"));
}
