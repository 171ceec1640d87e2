#pragma once

#include <gamefetch/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gamefetch::config {

// One configured game. directory is absolute after loading.
struct GameDefinition {
    std::string id;
    std::string name;
    std::string version;
    std::string description;
    std::filesystem::path directory;
    std::optional<nlohmann::json> configToClient;
};

struct ServerSettings {
    std::string host = "0.0.0.0";
    std::uint16_t port = 8000;
    bool verify = true;
    std::string secretKey;
};

struct ServerConfig {
    ServerSettings server;
    std::vector<GameDefinition> games;

    const GameDefinition* findGame(std::string_view id) const noexcept;

    // False when verification is disabled or no secret is configured; any key is then accepted.
    bool authEnabled() const noexcept { return server.verify && !server.secretKey.empty(); }
};

// Frozen snapshot shared by every request handler.
using ServerConfigPtr = std::shared_ptr<const ServerConfig>;

/**
 * Parse a server configuration document:
 *
 *   {"server": {"host", "port", "verify", "secret_key"},
 *    "games":  [{"id", "name", "version", "description", "directory", "configToClient"}]}
 *
 * Relative game directories are resolved against baseDir. Empty or duplicate ids are
 * InvalidArgument; a game directory that does not exist only logs a warning.
 */
Result<ServerConfig> parseServerConfig(std::string_view document,
                                       const std::filesystem::path& baseDir = {});

// Reads and parses path. A missing file is NotFound, malformed JSON is InvalidArgument.
Result<ServerConfig> loadServerConfig(const std::filesystem::path& path);

// --config value, else $GAMEFETCH_CONFIG, else ./config.json.
std::filesystem::path resolveServerConfigPath(const std::string& overridePath = "");

} // namespace gamefetch::config
