#include <gamefetch/catalog/path_guard.h>
#include <gamefetch/catalog/progress_resolver.h>
#include <gamefetch/crypto/hasher.h>
#include <gamefetch/server/game_service.h>

#include <openssl/crypto.h>
#include <spdlog/spdlog.h>

#include <cmath>

namespace gamefetch::server {

namespace fs = std::filesystem;

namespace {

constexpr const char* kServerName = "Game Download Server";
constexpr const char* kServerVersion = "4.0.0";

std::string digestOf(std::string_view s) {
    return crypto::SHA256Hasher::hash(
        ByteSpan{reinterpret_cast<const std::byte*>(s.data()), s.size()});
}

std::vector<protocol::RemoteFile> remoteFiles(std::string_view gameId,
                                              const std::vector<catalog::CatalogEntry>& entries) {
    std::vector<protocol::RemoteFile> files;
    files.reserve(entries.size());
    for (const auto& e : entries)
        files.push_back({e, catalog::downloadUrlFor(gameId, e), std::nullopt});
    return files;
}

std::string truncatedKey(std::optional<std::string_view> key) {
    if (!key)
        return "None";
    return std::string(key->substr(0, 8)) + "...";
}

} // namespace

GameService::GameService(config::ServerConfigPtr config) : config_(std::move(config)) {}

bool GameService::authorize(std::optional<std::string_view> apiKey) const {
    if (!config_->authEnabled())
        return true;
    if (apiKey) {
        // Compare digests so the comparison length never depends on the caller's input.
        auto expected = digestOf(config_->server.secretKey);
        auto actual = digestOf(*apiKey);
        if (CRYPTO_memcmp(expected.data(), actual.data(), expected.size()) == 0)
            return true;
    }
    spdlog::warn("Rejected request with invalid API key: {}", truncatedKey(apiKey));
    return false;
}

protocol::ServerStatus GameService::status() const {
    return {"running", kServerName, kServerVersion, config_->games.size()};
}

std::vector<protocol::GameSummary> GameService::listGames() const {
    std::vector<protocol::GameSummary> out;
    out.reserve(config_->games.size());
    for (const auto& g : config_->games)
        out.push_back({g.id, g.name, g.version, g.description, g.configToClient});
    return out;
}

Result<const config::GameDefinition*> GameService::findGame(std::string_view gameId) const {
    const auto* game = config_->findGame(gameId);
    if (!game) {
        return Error{ErrorCode::NotFound, fmt::format("Game '{}' does not exist", gameId)};
    }
    return game;
}

Result<protocol::RemoteCatalog> GameService::describeGame(std::string_view gameId) const {
    auto game = findGame(gameId);
    if (!game)
        return game.error();
    const auto& def = *game.value();

    auto scan = catalog::scanCatalog(def.directory);
    if (!scan)
        return scan.error();

    protocol::RemoteCatalog out;
    out.gameId = def.id;
    out.gameName = def.name;
    out.version = def.version;
    out.files = remoteFiles(def.id, scan.value().entries);
    out.totalSize = scan.value().totalSize;
    out.tree = std::move(scan.value().tree);
    out.configToClient = def.configToClient;
    return out;
}

Result<protocol::StartInfo> GameService::startInfo(std::string_view gameId,
                                                   double progress) const {
    if (!(progress >= 0.0 && progress <= 100.0)) {
        return Error{ErrorCode::InvalidArgument, "progress must be between 0 and 100"};
    }
    auto game = findGame(gameId);
    if (!game)
        return game.error();
    const auto& def = *game.value();

    auto scan = catalog::scanCatalog(def.directory);
    if (!scan)
        return scan.error();
    const auto& entries = scan.value().entries;

    protocol::StartInfo info;
    info.gameId = def.id;
    info.configToClient = def.configToClient;

    if (entries.empty()) {
        info.message = "Game directory is empty";
        return info;
    }

    info.files = remoteFiles(def.id, entries);
    const auto point = catalog::resolveResumePoint(entries, progress);
    if (progress >= 100.0 || point.fileIndex >= entries.size()) {
        info.startFileIndex = entries.size();
        info.message = "Game is already fully downloaded";
        return info;
    }

    const auto count = entries.size();
    for (std::size_t i = 0; i < count; ++i) {
        info.files[i].segment = protocol::ProgressSegment{
            catalog::shareStartPercent(i, count), catalog::shareStartPercent(i + 1, count), i};
    }

    info.startFileIndex = point.fileIndex;
    info.startFilePath = entries[point.fileIndex].relativePath;
    info.startFileOffset = point.byteOffset;
    info.message = fmt::format("Progress {}%: starting at file {} ({})", progress,
                               point.fileIndex + 1, info.startFilePath);
    if (point.byteOffset > 0)
        info.message += fmt::format(", from byte offset {}", point.byteOffset);
    return info;
}

Result<FileDeliveryPlan> GameService::planFileDownload(std::string_view gameId,
                                                       std::string_view relativePath,
                                                       std::uint64_t offset) const {
    auto game = findGame(gameId);
    if (!game)
        return game.error();
    const auto& def = *game.value();

    auto resolved = catalog::resolveUnderRoot(def.directory, relativePath);
    if (!resolved)
        return resolved.error();

    std::error_code ec;
    const auto& path = resolved.value();
    if (!fs::is_regular_file(path, ec)) {
        return Error{ErrorCode::NotFound, fmt::format("File '{}' does not exist", relativePath)};
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     fmt::format("Cannot stat '{}': {}", relativePath, ec.message())};
    }
    if (offset >= size) {
        return Error{ErrorCode::RangeNotSatisfiable,
                     fmt::format("Offset {} is not below the size {} of '{}'", offset, size,
                                 relativePath)};
    }

    FileDeliveryPlan plan;
    plan.path = path;
    plan.fileName = path.filename().string();
    plan.fileSize = size;
    plan.offset = offset;
    return plan;
}

Result<StreamPlan> GameService::planStream(std::string_view gameId, double progress,
                                           std::size_t chunkSize) const {
    if (!(progress >= 0.0 && progress <= 100.0)) {
        return Error{ErrorCode::InvalidArgument, "progress must be between 0 and 100"};
    }
    if (chunkSize < MIN_STREAM_CHUNK_SIZE || chunkSize > MAX_STREAM_CHUNK_SIZE) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("chunk_size must be between {} and {}", MIN_STREAM_CHUNK_SIZE,
                                 MAX_STREAM_CHUNK_SIZE)};
    }
    auto game = findGame(gameId);
    if (!game)
        return game.error();
    const auto& def = *game.value();

    auto scan = catalog::scanCatalog(def.directory);
    if (!scan)
        return scan.error();
    if (scan.value().entries.empty()) {
        return Error{ErrorCode::EmptyCatalog, fmt::format("Game '{}' has no files", def.id)};
    }

    std::error_code ec;
    auto root = fs::canonical(def.directory, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     fmt::format("Cannot resolve '{}': {}", def.directory.string(), ec.message())};
    }

    StreamPlan plan;
    plan.gameId = def.id;
    plan.root = std::move(root);
    plan.entries = std::move(scan.value().entries);
    plan.start = catalog::resolveResumePoint(plan.entries, progress);
    plan.progress = progress;
    plan.chunkSize = chunkSize;

    if (progress >= 100.0 || plan.start.fileIndex >= plan.entries.size()) {
        return Error{ErrorCode::NotFound, "Nothing to stream: game already fully downloaded"};
    }

    for (std::size_t i = plan.start.fileIndex; i < plan.entries.size(); ++i)
        plan.totalBytes += plan.entries[i].sizeBytes;
    plan.totalBytes -= plan.start.byteOffset;
    return plan;
}

} // namespace gamefetch::server
