#pragma once

#include <gamefetch/client/catalog_client.h>
#include <gamefetch/client/transfer_ledger.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace gamefetch::client {

struct DownloadSummary {
    std::string gameId;
    std::size_t filesTotal{0};
    std::size_t filesTransferred{0};
    std::uint64_t bytesTotal{0};
    std::uint64_t bytesTransferred{0}; // received during this run
    std::size_t transferRequests{0};
    std::optional<nlohmann::json> configToClient;
};

// Callbacks run on the thread executing the download (a worker thread for downloadAsync).
struct DownloadCallbacks {
    std::function<void(std::uint64_t done, std::uint64_t total)> onProgress;
    std::function<void(const std::string&)> onStatus;
    std::function<void(const DownloadSummary&)> onComplete;
};

struct DownloaderOptions {
    RequestOptions transfer{std::chrono::milliseconds{0}, std::chrono::milliseconds{10000},
                            std::chrono::seconds{30}};
    bool verifyChecksums{true};
};

/**
 * Sequential, resumable per-file downloader.
 *
 * For each catalog entry not yet complete in the ledger it requests the file from the
 * recorded offset and appends the bytes. The ledger is persisted after every file (and on
 * failure) and removed once everything is complete. Any error aborts the run; the ledger and
 * the partial file stay consistent for the next attempt.
 */
class ResumableDownloader {
public:
    ResumableDownloader(std::shared_ptr<CatalogClient> client, DownloaderOptions options = {});

    Result<DownloadSummary> download(const std::string& gameId,
                                     const std::filesystem::path& installDir,
                                     const DownloadCallbacks& callbacks = {});

    // Runs download() on a worker thread. The downloader must outlive the returned future.
    std::future<Result<DownloadSummary>> downloadAsync(std::string gameId,
                                                       std::filesystem::path installDir,
                                                       DownloadCallbacks callbacks = {});

private:
    Result<void> transferFile(const std::string& gameId, const catalog::CatalogEntry& entry,
                              const std::filesystem::path& localPath,
                              const std::filesystem::path& installDir, TransferLedger& ledger,
                              const DownloadCallbacks& callbacks, std::uint64_t& done,
                              std::uint64_t total, DownloadSummary& summary);

    std::shared_ptr<CatalogClient> client_;
    DownloaderOptions options_;
};

// Shared by both download strategies.
namespace detail {

// Local destination for a catalog path; PathViolation if it would leave installDir.
Result<std::filesystem::path> localPathFor(const std::filesystem::path& installDir,
                                           const std::string& relativePath);

// HashMismatch when the file does not match a "sha256:<hex>" checksum. Unknown tags pass.
Result<void> verifyChecksum(const std::filesystem::path& path, const std::string& checksum);

} // namespace detail

} // namespace gamefetch::client
