#pragma once

#include <gamefetch/core/types.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace gamefetch::protocol {

/*
 * Continuous multi-file stream framing.
 *
 *   boundary := "--FILE_BOUNDARY--" LF
 *               "Filename: " relative-path LF
 *               "Size: " full-file-size LF
 *               "--FILE_CONTENT--" LF
 *
 * A boundary precedes every segment except a first segment that starts at offset 0.
 * Size is the file's full size; for a first segment resumed at offset k the segment
 * carries size - k bytes. Segment bodies are raw bytes and are delimited by length only.
 */
inline constexpr std::string_view kBoundaryLine = "--FILE_BOUNDARY--";
inline constexpr std::string_view kContentLine = "--FILE_CONTENT--";
inline constexpr std::string_view kFilenameKey = "Filename";
inline constexpr std::string_view kSizeKey = "Size";

struct SegmentHeader {
    std::string filename;
    std::uint64_t size{0};
};

class FrameWriter {
public:
    // Serialised boundary marker. Filenames containing CR or LF are rejected.
    static Result<std::string> boundary(const SegmentHeader& header);
};

/**
 * Incremental parser for the continuous stream.
 *
 * The caller describes the segment the stream starts with (the same resume point the
 * server resolved). Bytes may arrive in arbitrary slices; callbacks fire in order:
 * onSegmentStart(header, startOffset), onSegmentData(bytes)..., onSegmentEnd().
 */
class StreamFrameParser {
public:
    struct FirstSegment {
        std::string filename;
        std::uint64_t fileSize{0};
        std::uint64_t offset{0};
    };

    struct Callbacks {
        std::function<Result<void>(const SegmentHeader&, std::uint64_t startOffset)> onSegmentStart;
        std::function<Result<void>(ByteSpan)> onSegmentData;
        std::function<Result<void>()> onSegmentEnd;
    };

    StreamFrameParser(FirstSegment first, Callbacks callbacks);

    Result<void> feed(ByteSpan data);

    // Call once the transport reports end of body; fails if a segment or marker is incomplete.
    Result<void> finish();

    [[nodiscard]] std::size_t segmentsCompleted() const noexcept { return completed_; }

private:
    enum class State { Implicit, Marker, Body };

    Result<void> consumeLine(std::string_view line);
    Result<void> beginSegment();
    Result<void> endSegment();

    FirstSegment first_;
    Callbacks callbacks_;
    State state_;
    bool markerOpen_{false};
    bool firstSegmentSeen_{false};
    std::string line_;
    SegmentHeader header_;
    bool haveSize_{false};
    std::uint64_t remaining_{0};
    std::size_t completed_{0};
};

} // namespace gamefetch::protocol
