#pragma once

#include <gamefetch/catalog/catalog.h>
#include <gamefetch/core/types.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gamefetch::protocol {

/**
 * JSON documents exchanged between server and client.
 *
 * Field names are the wire contract (snake_case, plus the opaque "configToClient" blob that is
 * passed through untouched). Encoders never fail; decoders return CorruptedData for a body that
 * is not JSON or lacks a required field.
 */

struct ProgressSegment {
    double startPercent{0.0};
    double endPercent{0.0};
    std::size_t fileIndex{0};
};

// A catalog entry as listed by the server.
struct RemoteFile {
    catalog::CatalogEntry entry;
    std::string downloadUrl;
    std::optional<ProgressSegment> segment; // only in start-info responses
};

struct GameSummary {
    std::string id;
    std::string name;
    std::string version;
    std::string description;
    std::optional<nlohmann::json> configToClient;
};

struct RemoteCatalog {
    std::string gameId;
    std::string gameName;
    std::string version;
    std::vector<RemoteFile> files;
    std::uint64_t totalSize{0};
    std::vector<catalog::FileTreeNode> tree;
    std::optional<nlohmann::json> configToClient;

    std::vector<catalog::CatalogEntry> entries() const;
};

struct StartInfo {
    std::string gameId;
    std::size_t startFileIndex{0};
    std::string startFilePath;
    std::uint64_t startFileOffset{0};
    std::vector<RemoteFile> files;
    std::string message;
    std::optional<nlohmann::json> configToClient;
};

struct ServerStatus {
    std::string status;
    std::string name;
    std::string version;
    std::size_t gamesCount{0};
};

// Encoders
nlohmann::json toJson(const RemoteFile& file);
nlohmann::json toJson(const std::vector<catalog::FileTreeNode>& tree);
nlohmann::json toJson(const GameSummary& game);
nlohmann::json toJson(const std::vector<GameSummary>& games); // {"games": [...]}
nlohmann::json toJson(const RemoteCatalog& catalog);
nlohmann::json toJson(const StartInfo& info);
nlohmann::json toJson(const ServerStatus& status);

// Decoders
Result<std::vector<GameSummary>> parseGameList(std::string_view body);
Result<RemoteCatalog> parseCatalog(std::string_view body);
Result<StartInfo> parseStartInfo(std::string_view body);
Result<ServerStatus> parseServerStatus(std::string_view body);

// Serialise for the wire or disk. Invalid UTF-8 in strings becomes U+FFFD instead of throwing.
std::string dumpJson(const nlohmann::json& j, int indent = -1);

// Error body: {"detail": "<message>", "code": "<error-name>"}
nlohmann::json errorBody(const Error& error);

/**
 * Rebuild an Error from a non-2xx response. The body's "code" wins when present; otherwise the
 * HTTP status decides (403 maps to Unauthorized, 404 to NotFound, 416 to RangeNotSatisfiable).
 */
Error errorFromResponse(int httpStatus, std::string_view body);

// HTTP status the server answers with for an error code.
int httpStatusFor(ErrorCode code) noexcept;

} // namespace gamefetch::protocol
