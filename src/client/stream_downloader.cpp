#include <gamefetch/client/stream_downloader.h>
#include <gamefetch/protocol/stream_framing.h>

#include <spdlog/spdlog.h>

#include <fstream>
#include <unordered_map>

namespace gamefetch::client {

namespace fs = std::filesystem;

StreamDownloader::StreamDownloader(std::shared_ptr<CatalogClient> client,
                                   DownloaderOptions options)
    : client_(std::move(client)), options_(options) {}

Result<StreamSummary> StreamDownloader::download(const std::string& gameId,
                                                 const fs::path& installDir,
                                                 double progressPercent,
                                                 const DownloadCallbacks& callbacks) {
    if (!(progressPercent >= 0.0 && progressPercent <= 100.0)) {
        return Error{ErrorCode::InvalidArgument, "progress must be between 0 and 100"};
    }
    auto remote = client_->fetchCatalog(gameId);
    if (!remote)
        return remote.error();
    const auto entries = remote.value().entries();
    const auto total = remote.value().totalSize;
    if (total == 0) {
        return Error{ErrorCode::EmptyCatalog,
                     fmt::format("Game '{}' has a total size of zero", gameId)};
    }

    StreamSummary summary;
    summary.gameId = gameId;
    summary.start = catalog::resolveResumePoint(entries, progressPercent);

    std::error_code ec;
    fs::create_directories(installDir, ec);
    if (ec) {
        return Error{ErrorCode::IoError, fmt::format("Cannot create '{}': {}",
                                                     installDir.string(), ec.message())};
    }

    if (summary.start.fileIndex >= entries.size()) {
        spdlog::info("Stream '{}': nothing left at {}%", gameId, progressPercent);
        if (callbacks.onProgress)
            callbacks.onProgress(total, total);
        if (callbacks.onStatus)
            callbacks.onStatus("Download complete");
        return summary;
    }

    std::unordered_map<std::string, std::size_t> indexOf;
    std::vector<std::uint64_t> bytesBefore(entries.size(), 0);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        indexOf.emplace(entries[i].relativePath, i);
        if (i > 0)
            bytesBefore[i] = bytesBefore[i - 1] + entries[i - 1].sizeBytes;
    }

    std::ofstream out;
    const catalog::CatalogEntry* current = nullptr;
    fs::path currentPath;
    std::uint64_t done = bytesBefore[summary.start.fileIndex] + summary.start.byteOffset;

    if (callbacks.onProgress)
        callbacks.onProgress(done, total);

    protocol::StreamFrameParser::Callbacks pc;
    pc.onSegmentStart = [&](const protocol::SegmentHeader& header,
                            std::uint64_t startOffset) -> Result<void> {
        auto it = indexOf.find(header.filename);
        if (it == indexOf.end()) {
            return Error{ErrorCode::CorruptedData,
                         fmt::format("Stream names unknown file '{}'", header.filename)};
        }
        const auto& entry = entries[it->second];
        if (header.size != entry.sizeBytes) {
            return Error{ErrorCode::CorruptedData,
                         fmt::format("Stream size {} for '{}' differs from the catalog ({})",
                                     header.size, header.filename, entry.sizeBytes)};
        }
        auto local = detail::localPathFor(installDir, entry.relativePath);
        if (!local)
            return local.error();

        std::error_code fsErr;
        fs::create_directories(local.value().parent_path(), fsErr);
        if (startOffset > 0) {
            const auto have = fs::exists(local.value(), fsErr) ? fs::file_size(local.value(), fsErr)
                                                               : std::uint64_t{0};
            if (have < startOffset) {
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("Local '{}' has {} bytes; cannot resume at {}",
                                         entry.relativePath, have, startOffset)};
            }
            fs::resize_file(local.value(), startOffset, fsErr);
            if (fsErr) {
                return Error{ErrorCode::IoError, fmt::format("Cannot truncate '{}': {}",
                                                             entry.relativePath, fsErr.message())};
            }
            out.open(local.value(), std::ios::binary | std::ios::app);
        } else {
            out.open(local.value(), std::ios::binary | std::ios::trunc);
        }
        if (!out) {
            return Error{ErrorCode::IoError,
                         fmt::format("Cannot open '{}'", local.value().string())};
        }

        current = &entry;
        currentPath = local.value();
        done = bytesBefore[it->second] + startOffset;
        if (callbacks.onStatus) {
            const double pct = total > 0 ? 100.0 * static_cast<double>(done) /
                                               static_cast<double>(total)
                                         : 0.0;
            callbacks.onStatus(fmt::format("Downloading: {} ({:.1f}%)", entry.relativePath, pct));
        }
        return {};
    };
    pc.onSegmentData = [&](ByteSpan bytes) -> Result<void> {
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out) {
            return Error{ErrorCode::IoError,
                         fmt::format("Write to '{}' failed", currentPath.string())};
        }
        summary.bytesReceived += bytes.size();
        done += bytes.size();
        if (callbacks.onProgress)
            callbacks.onProgress(done, total);
        return {};
    };
    pc.onSegmentEnd = [&]() -> Result<void> {
        out.close();
        if (!out) {
            return Error{ErrorCode::IoError,
                         fmt::format("Closing '{}' failed", currentPath.string())};
        }
        ++summary.segmentsReceived;
        if (options_.verifyChecksums && current) {
            if (auto r = detail::verifyChecksum(currentPath, current->checksum); !r)
                return r;
        }
        return {};
    };

    const auto& first = entries[summary.start.fileIndex];
    protocol::StreamFrameParser parser({first.relativePath, first.sizeBytes,
                                        summary.start.byteOffset},
                                       std::move(pc));

    auto response = client_->transport().fetch(
        client_->streamUrl(gameId, progressPercent, chunkSize_), client_->authHeaders(),
        options_.transfer, [&](ByteSpan bytes) { return parser.feed(bytes); });
    if (out.is_open())
        out.close();
    if (!response)
        return response.error();
    if (auto r = parser.finish(); !r)
        return r.error();

    const auto& headers = response.value().headers;
    if (auto it = headers.find("x-start-file-index");
        it != headers.end() && it->second != std::to_string(summary.start.fileIndex)) {
        spdlog::warn("Server resolved start file {} but client resolved {}", it->second,
                     summary.start.fileIndex);
    }

    if (callbacks.onStatus)
        callbacks.onStatus("Download complete");
    spdlog::info("Stream '{}': {} segment(s), {} bytes", gameId, summary.segmentsReceived,
                 summary.bytesReceived);
    return summary;
}

} // namespace gamefetch::client
