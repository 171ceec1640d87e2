#pragma once

#include <gtest/gtest.h>

#include <gamefetch/config/server_config.h>
#include <gamefetch/core/types.h>

#include <unistd.h>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace gamefetch::test {

// Base test fixture with a private scratch directory per test
class GameFetchTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / generateTestId();
        std::filesystem::create_directories(testDir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir, ec);
    }

    static std::string generateRandomString(std::size_t size) {
        static std::mt19937_64 rng{std::random_device{}()};
        std::uniform_int_distribution<int> dist(0, 255);
        std::string data;
        data.reserve(size);
        for (std::size_t i = 0; i < size; ++i)
            data.push_back(static_cast<char>(dist(rng)));
        return data;
    }

    static std::filesystem::path writeFile(const std::filesystem::path& path,
                                           const std::string& content) {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    static ByteSpan asBytes(const std::string& s) {
        return {reinterpret_cast<const std::byte*>(s.data()), s.size()};
    }

    // A frozen server configuration serving one game rooted at dir.
    static config::ServerConfigPtr singleGameConfig(const std::filesystem::path& dir,
                                                    const std::string& secret = "",
                                                    const std::string& id = "game1") {
        config::ServerConfig cfg;
        cfg.server.secretKey = secret;
        config::GameDefinition game;
        game.id = id;
        game.name = "Test Game";
        game.version = "1.0";
        game.description = "fixture";
        game.directory = dir;
        cfg.games.push_back(std::move(game));
        return std::make_shared<const config::ServerConfig>(std::move(cfg));
    }

    std::filesystem::path testDir;

private:
    static std::string generateTestId() {
        static std::mt19937 rng{std::random_device{}()};
        std::uniform_int_distribution<int> dist(100000, 999999);
        return "gamefetch_test_" + std::to_string(::getpid()) + "_" + std::to_string(dist(rng));
    }
};

} // namespace gamefetch::test
