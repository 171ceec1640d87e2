#pragma once

#include <gamefetch/catalog/progress_resolver.h>
#include <gamefetch/client/downloader.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace gamefetch::client {

struct StreamSummary {
    std::string gameId;
    catalog::ResumePoint start;
    std::size_t segmentsReceived{0};
    std::uint64_t bytesReceived{0};
};

/**
 * Client side of the percentage-driven path: resolves the resume point locally with the same
 * resolver the server uses, requests one continuous stream and splits it back into files.
 *
 * The first segment is written at the resume offset (the local file is cut to that length
 * first); every later segment recreates its file. No ledger is involved.
 */
class StreamDownloader {
public:
    StreamDownloader(std::shared_ptr<CatalogClient> client, DownloaderOptions options = {});

    Result<StreamSummary> download(const std::string& gameId,
                                   const std::filesystem::path& installDir, double progressPercent,
                                   const DownloadCallbacks& callbacks = {});

    void setChunkSize(std::size_t chunkSize) noexcept { chunkSize_ = chunkSize; }

private:
    std::shared_ptr<CatalogClient> client_;
    DownloaderOptions options_;
    std::size_t chunkSize_{DEFAULT_CHUNK_SIZE};
};

} // namespace gamefetch::client
