#pragma once

#include <gamefetch/config/server_config.h>
#include <gamefetch/protocol/wire_json.h>
#include <gamefetch/server/delivery.h>

#include <optional>
#include <string_view>
#include <vector>

namespace gamefetch::server {

/**
 * Request-level operations, independent of the HTTP framing.
 *
 * Holds only the frozen configuration snapshot; every call rescans the game directory so
 * responses always describe the files as they are now. Safe to call from many threads.
 */
class GameService {
public:
    explicit GameService(config::ServerConfigPtr config);

    // Constant-time comparison against the configured secret.
    bool authorize(std::optional<std::string_view> apiKey) const;

    protocol::ServerStatus status() const;
    std::vector<protocol::GameSummary> listGames() const;

    Result<protocol::RemoteCatalog> describeGame(std::string_view gameId) const;
    Result<protocol::StartInfo> startInfo(std::string_view gameId, double progress) const;

    // Check order: unknown game, path violation, missing file, offset out of range.
    Result<FileDeliveryPlan> planFileDownload(std::string_view gameId,
                                              std::string_view relativePath,
                                              std::uint64_t offset) const;

    Result<StreamPlan> planStream(std::string_view gameId, double progress,
                                  std::size_t chunkSize) const;

    const config::ServerConfig& config() const noexcept { return *config_; }

private:
    Result<const config::GameDefinition*> findGame(std::string_view gameId) const;

    config::ServerConfigPtr config_;
};

} // namespace gamefetch::server
