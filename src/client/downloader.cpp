/*
 * gamefetch/src/client/downloader.cpp
 *
 * Per-file resumable download:
 * - Fetch the catalog (short timeout) and refuse empty games
 * - Load, seed, track and reconcile the ledger so local length == recorded bytes
 * - Request each incomplete file at offset = downloaded (connect + stall timeouts)
 * - Append, then record, then report; persist the ledger after each file
 * - Verify sha256 checksums of completed files when enabled
 */

#include <gamefetch/catalog/path_guard.h>
#include <gamefetch/client/downloader.h>
#include <gamefetch/crypto/hasher.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>

namespace gamefetch::client {

namespace fs = std::filesystem;

namespace detail {

Result<fs::path> localPathFor(const fs::path& installDir, const std::string& relativePath) {
    return catalog::resolveUnderRoot(installDir, relativePath);
}

Result<void> verifyChecksum(const fs::path& path, const std::string& checksum) {
    auto expected = crypto::Checksum::parse(checksum);
    if (!expected) {
        spdlog::debug("No verifiable checksum for '{}' ('{}')", path.string(), checksum);
        return {};
    }
    auto hasher = crypto::createSHA256Hasher();
    auto actual = hasher->hashFile(path);
    if (!actual)
        return actual.error();
    if (actual.value() != expected->hex) {
        return Error{ErrorCode::HashMismatch,
                     fmt::format("Checksum mismatch for '{}': expected {}, got sha256:{}",
                                 path.filename().string(), expected->toString(), actual.value())};
    }
    return {};
}

} // namespace detail

namespace {

void status(const DownloadCallbacks& cb, const std::string& msg) {
    spdlog::info("{}", msg);
    if (cb.onStatus)
        cb.onStatus(msg);
}

Result<void> ensureEmptyFile(const fs::path& path) {
    std::error_code ec;
    if (fs::exists(path, ec))
        return {};
    fs::create_directories(path.parent_path(), ec);
    std::ofstream out(path, std::ios::binary);
    if (!out)
        return Error{ErrorCode::IoError, fmt::format("Cannot create '{}'", path.string())};
    return {};
}

} // namespace

ResumableDownloader::ResumableDownloader(std::shared_ptr<CatalogClient> client,
                                         DownloaderOptions options)
    : client_(std::move(client)), options_(options) {}

Result<DownloadSummary> ResumableDownloader::download(const std::string& gameId,
                                                      const fs::path& installDir,
                                                      const DownloadCallbacks& callbacks) {
    auto remote = client_->fetchCatalog(gameId);
    if (!remote)
        return remote.error();
    const auto entries = remote.value().entries();
    const auto total = remote.value().totalSize;
    if (total == 0) {
        return Error{ErrorCode::EmptyCatalog,
                     fmt::format("Game '{}' has a total size of zero", gameId)};
    }

    std::error_code ec;
    fs::create_directories(installDir, ec);
    if (ec) {
        return Error{ErrorCode::IoError, fmt::format("Cannot create '{}': {}",
                                                     installDir.string(), ec.message())};
    }

    std::vector<fs::path> localPaths;
    localPaths.reserve(entries.size());
    for (const auto& entry : entries) {
        auto local = detail::localPathFor(installDir, entry.relativePath);
        if (!local)
            return local.error();
        localPaths.push_back(std::move(local).value());
    }

    auto ledger = TransferLedger::load(installDir);
    ledger.seedFromDisk(installDir, entries, options_.verifyChecksums);
    for (const auto& entry : entries)
        ledger.track(entry);
    if (auto r = ledger.reconcile(installDir, entries); !r)
        return r.error();

    DownloadSummary summary;
    summary.gameId = gameId;
    summary.filesTotal = entries.size();
    summary.bytesTotal = total;
    summary.configToClient = remote.value().configToClient;

    std::uint64_t done = 0;
    for (const auto& entry : entries) {
        const auto* rec = ledger.find(entry.relativePath);
        done += std::min(rec->downloaded, entry.sizeBytes);
    }
    if (callbacks.onProgress)
        callbacks.onProgress(done, total);

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (ledger.find(entry.relativePath)->complete()) {
            if (entry.sizeBytes == 0) {
                if (auto r = ensureEmptyFile(localPaths[i]); !r)
                    return r.error();
            }
            continue;
        }
        auto r = transferFile(gameId, entry, localPaths[i], installDir, ledger, callbacks, done,
                              total, summary);
        if (!r) {
            spdlog::error("Download of '{}' stopped at '{}': {}", gameId, entry.relativePath,
                          r.error().message);
            return r.error();
        }
    }

    if (auto r = TransferLedger::remove(installDir); !r) {
        status(callbacks, fmt::format("Warning: could not remove progress file: {}",
                                      r.error().message));
    }

    status(callbacks, "Download complete");
    if (callbacks.onComplete)
        callbacks.onComplete(summary);
    return summary;
}

Result<void> ResumableDownloader::transferFile(const std::string& gameId,
                                               const catalog::CatalogEntry& entry,
                                               const fs::path& localPath,
                                               const fs::path& installDir, TransferLedger& ledger,
                                               const DownloadCallbacks& callbacks,
                                               std::uint64_t& done, std::uint64_t total,
                                               DownloadSummary& summary) {
    const auto offset = ledger.find(entry.relativePath)->downloaded;
    status(callbacks, fmt::format("Downloading: {}", entry.relativePath));

    std::error_code ec;
    fs::create_directories(localPath.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, fmt::format("Cannot create '{}': {}",
                                                     localPath.parent_path().string(),
                                                     ec.message())};
    }

    std::ofstream out(localPath, std::ios::binary | std::ios::app);
    if (!out) {
        return Error{ErrorCode::IoError, fmt::format("Cannot open '{}'", localPath.string())};
    }

    ByteSink sink = [&](ByteSpan bytes) -> Result<void> {
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return Error{ErrorCode::IoError,
                         fmt::format("Write to '{}' failed", localPath.string())};
        }
        ledger.addDownloaded(entry.relativePath, bytes.size());
        summary.bytesTransferred += bytes.size();
        done += bytes.size();
        if (callbacks.onProgress)
            callbacks.onProgress(std::min(done, total), total);
        return {};
    };

    ++summary.transferRequests;
    auto fetched = client_->transport().fetch(client_->fileUrl(gameId, entry, offset),
                                              client_->authHeaders(), options_.transfer, sink);
    out.close();

    if (!fetched) {
        // Persist what actually reached the disk so the next run resumes from there.
        if (auto saved = ledger.save(installDir); !saved)
            spdlog::warn("Could not persist ledger: {}", saved.error().message);
        auto err = fetched.error();
        if (err.code == ErrorCode::RangeNotSatisfiable) {
            err.message = fmt::format("'{}' is shorter on the server than the {} bytes already "
                                      "downloaded; the catalog is stale",
                                      entry.relativePath, offset);
        }
        return err;
    }

    const auto* rec = ledger.find(entry.relativePath);
    Result<void> check;
    if (rec->downloaded != entry.sizeBytes) {
        check = Error{ErrorCode::CorruptedData,
                      fmt::format("'{}' has {} bytes, expected {}", entry.relativePath,
                                  rec->downloaded, entry.sizeBytes)};
    } else if (options_.verifyChecksums) {
        check = detail::verifyChecksum(localPath, entry.checksum);
    }
    if (!check) {
        // The bytes cannot be trusted: restart this file next time.
        fs::resize_file(localPath, 0, ec);
        if (ec)
            spdlog::warn("Could not truncate '{}': {}", localPath.string(), ec.message());
        ledger.reset(entry.relativePath);
        if (auto saved = ledger.save(installDir); !saved)
            spdlog::warn("Could not persist ledger: {}", saved.error().message);
        return check.error();
    }

    if (auto saved = ledger.save(installDir); !saved)
        return saved.error();
    ++summary.filesTransferred;
    return {};
}

std::future<Result<DownloadSummary>>
ResumableDownloader::downloadAsync(std::string gameId, fs::path installDir,
                                   DownloadCallbacks callbacks) {
    return std::async(std::launch::async,
                      [this, gameId = std::move(gameId), installDir = std::move(installDir),
                       callbacks = std::move(callbacks)]() {
                          return download(gameId, installDir, callbacks);
                      });
}

} // namespace gamefetch::client
