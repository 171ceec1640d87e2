#include <gamefetch/protocol/stream_framing.h>
#include <gamefetch/server/delivery.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <vector>

namespace gamefetch::server {

namespace fs = std::filesystem;

namespace {

ByteSpan asBytes(std::string_view s) {
    return {reinterpret_cast<const std::byte*>(s.data()), s.size()};
}

// Stream exactly `length` bytes starting at `offset` from an already opened file.
Result<std::uint64_t> copyRange(std::ifstream& in, const fs::path& path, std::uint64_t offset,
                                std::uint64_t length, std::size_t chunkSize, const ByteSink& sink) {
    in.seekg(static_cast<std::streamoff>(offset));
    if (!in) {
        return Error{ErrorCode::IoError,
                     fmt::format("Cannot seek '{}' to {}", path.string(), offset)};
    }

    std::vector<char> buffer(chunkSize);
    std::uint64_t remaining = length;
    std::uint64_t sent = 0;
    while (remaining > 0) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(chunkSize, remaining));
        in.read(buffer.data(), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0) {
            return Error{ErrorCode::IoError,
                         fmt::format("'{}' ended {} bytes early", path.string(), remaining)};
        }
        auto r = sink(ByteSpan{reinterpret_cast<const std::byte*>(buffer.data()), got});
        if (!r)
            return r.error();
        remaining -= got;
        sent += got;
    }
    return sent;
}

} // namespace

Result<void> sendFileRange(const FileDeliveryPlan& plan, const ByteSink& sink,
                           std::size_t chunkSize) {
    if (chunkSize == 0) {
        return Error{ErrorCode::InvalidArgument, "chunk size must be positive"};
    }
    std::ifstream in(plan.path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, fmt::format("Cannot open '{}'", plan.path.string())};
    }
    auto sent = copyRange(in, plan.path, plan.offset, plan.length(), chunkSize, sink);
    if (!sent)
        return sent.error();
    spdlog::debug("Sent {} bytes of '{}' from offset {}", sent.value(), plan.fileName,
                  plan.offset);
    return {};
}

Result<StreamStats> writeStream(const StreamPlan& plan, const ByteSink& sink) {
    StreamStats stats;
    const auto& entries = plan.entries;

    for (std::size_t i = plan.start.fileIndex; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        const std::uint64_t startOffset = (i == plan.start.fileIndex) ? plan.start.byteOffset : 0;
        const auto path = plan.root / fs::path(entry.relativePath);

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            spdlog::warn("Stream '{}': '{}' vanished since the scan, skipping", plan.gameId,
                         entry.relativePath);
            ++stats.filesSkipped;
            continue;
        }

        if (i > plan.start.fileIndex || startOffset > 0) {
            auto marker =
                protocol::FrameWriter::boundary({entry.relativePath, entry.sizeBytes});
            if (!marker)
                return marker.error();
            if (auto r = sink(asBytes(marker.value())); !r)
                return r.error();
        }

        auto sent = copyRange(in, path, startOffset, entry.sizeBytes - startOffset,
                              plan.chunkSize, sink);
        if (!sent) {
            spdlog::error("Stream '{}' aborted at '{}': {}", plan.gameId, entry.relativePath,
                          sent.error().message);
            return sent.error();
        }
        stats.bytesSent += sent.value();
        ++stats.filesSent;
    }

    spdlog::info("Stream '{}' finished: {} file(s), {} skipped, {} bytes", plan.gameId,
                 stats.filesSent, stats.filesSkipped, stats.bytesSent);
    return stats;
}

} // namespace gamefetch::server
