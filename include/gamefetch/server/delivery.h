#pragma once

#include <gamefetch/catalog/catalog.h>
#include <gamefetch/catalog/progress_resolver.h>
#include <gamefetch/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gamefetch::server {

// A validated single-file request: the path is inside the game root and offset < fileSize.
struct FileDeliveryPlan {
    std::filesystem::path path;
    std::string fileName;
    std::uint64_t fileSize{0};
    std::uint64_t offset{0};

    bool partial() const noexcept { return offset > 0; }
    std::uint64_t length() const noexcept { return fileSize - offset; }
};

// Everything needed to produce a continuous stream, resolved before the response starts.
struct StreamPlan {
    std::string gameId;
    std::filesystem::path root;
    std::vector<catalog::CatalogEntry> entries;
    catalog::ResumePoint start;
    double progress{0.0};
    std::size_t chunkSize{DEFAULT_CHUNK_SIZE};
    std::uint64_t totalBytes{0}; // advisory: sizes from start.fileIndex on, minus start.byteOffset
};

struct StreamStats {
    std::size_t filesSent{0};
    std::size_t filesSkipped{0};
    std::uint64_t bytesSent{0};
};

/**
 * Copy [offset, fileSize) of the planned file into sink, chunkSize bytes at a time.
 * The file is never read past the planned size; a file that turns out shorter is IoError.
 */
Result<void> sendFileRange(const FileDeliveryPlan& plan, const ByteSink& sink,
                           std::size_t chunkSize = DEFAULT_CHUNK_SIZE);

/**
 * Write the framed stream for plan into sink.
 *
 * Files missing at stream time are skipped without a boundary. Each file contributes at most
 * its catalogued size; a file that shrank since the scan fails the stream with IoError, since
 * the framing already promised the catalogued length.
 */
Result<StreamStats> writeStream(const StreamPlan& plan, const ByteSink& sink);

} // namespace gamefetch::server
