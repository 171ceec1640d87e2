#include <gamefetch/protocol/stream_framing.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>

namespace gamefetch::protocol {

namespace {

// Marker lines are short; anything longer means we lost sync with the framing.
constexpr std::size_t kMaxMarkerLine = 8 * 1024;

Error framingError(std::string msg) {
    return Error{ErrorCode::CorruptedData, "Stream framing: " + std::move(msg)};
}

} // namespace

Result<std::string> FrameWriter::boundary(const SegmentHeader& header) {
    if (header.filename.empty() || header.filename.find_first_of("\r\n") != std::string::npos) {
        return Error{ErrorCode::InvalidArgument,
                     "Segment filename must be non-empty and free of line breaks"};
    }
    std::string out;
    out.reserve(kBoundaryLine.size() + kContentLine.size() + header.filename.size() + 48);
    out.append(kBoundaryLine).push_back('\n');
    out.append(kFilenameKey).append(": ").append(header.filename).push_back('\n');
    out.append(kSizeKey).append(": ").append(std::to_string(header.size)).push_back('\n');
    out.append(kContentLine).push_back('\n');
    return out;
}

StreamFrameParser::StreamFrameParser(FirstSegment first, Callbacks callbacks)
    : first_(std::move(first)), callbacks_(std::move(callbacks)),
      state_(first_.offset > 0 ? State::Marker : State::Implicit) {}

Result<void> StreamFrameParser::feed(ByteSpan data) {
    if (state_ == State::Implicit) {
        header_ = SegmentHeader{first_.filename, first_.fileSize};
        if (auto r = beginSegment(); !r)
            return r;
    }

    std::size_t pos = 0;
    while (pos < data.size()) {
        if (state_ == State::Body) {
            const auto avail = static_cast<std::uint64_t>(data.size() - pos);
            const auto n = static_cast<std::size_t>(std::min(remaining_, avail));
            if (callbacks_.onSegmentData) {
                if (auto r = callbacks_.onSegmentData(data.subspan(pos, n)); !r)
                    return r;
            }
            remaining_ -= n;
            pos += n;
            if (remaining_ == 0) {
                if (auto r = endSegment(); !r)
                    return r;
            }
            continue;
        }

        // State::Marker
        const auto* begin = reinterpret_cast<const char*>(data.data()) + pos;
        const auto* end = reinterpret_cast<const char*>(data.data()) + data.size();
        const auto* nl = std::find(begin, end, '\n');
        line_.append(begin, nl);
        if (line_.size() > kMaxMarkerLine)
            return framingError("marker line too long");
        if (nl == end) {
            pos = data.size();
            break;
        }
        pos += static_cast<std::size_t>(nl - begin) + 1;
        auto r = consumeLine(line_);
        line_.clear();
        if (!r)
            return r;
    }
    return {};
}

Result<void> StreamFrameParser::consumeLine(std::string_view line) {
    if (!markerOpen_) {
        if (line != kBoundaryLine)
            return framingError("expected boundary marker");
        markerOpen_ = true;
        header_ = SegmentHeader{};
        haveSize_ = false;
        return {};
    }

    if (line == kContentLine) {
        if (header_.filename.empty() || !haveSize_)
            return framingError("boundary is missing Filename or Size");
        markerOpen_ = false;
        return beginSegment();
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return framingError("malformed header line");
    auto key = line.substr(0, colon);
    auto value = line.substr(colon + 1);
    while (!value.empty() && value.front() == ' ')
        value.remove_prefix(1);

    if (key == kFilenameKey) {
        header_.filename = std::string(value);
    } else if (key == kSizeKey) {
        std::uint64_t size = 0;
        auto res = std::from_chars(value.data(), value.data() + value.size(), size);
        if (res.ec != std::errc() || res.ptr != value.data() + value.size())
            return framingError("invalid Size value");
        header_.size = size;
        haveSize_ = true;
    } else {
        spdlog::debug("Stream framing: ignoring header '{}'", key);
    }
    return {};
}

Result<void> StreamFrameParser::beginSegment() {
    std::uint64_t startOffset = 0;
    if (!firstSegmentSeen_ && first_.offset > 0 && header_.filename == first_.filename) {
        startOffset = first_.offset;
        if (startOffset > header_.size)
            return framingError("resume offset beyond segment size");
    }
    firstSegmentSeen_ = true;
    remaining_ = header_.size - startOffset;
    state_ = State::Body;

    if (callbacks_.onSegmentStart) {
        if (auto r = callbacks_.onSegmentStart(header_, startOffset); !r)
            return r;
    }
    if (remaining_ == 0)
        return endSegment();
    return {};
}

Result<void> StreamFrameParser::endSegment() {
    state_ = State::Marker;
    ++completed_;
    if (callbacks_.onSegmentEnd)
        return callbacks_.onSegmentEnd();
    return {};
}

Result<void> StreamFrameParser::finish() {
    if (state_ == State::Implicit) {
        header_ = SegmentHeader{first_.filename, first_.fileSize};
        if (auto r = beginSegment(); !r)
            return r;
    }
    if (state_ == State::Body && remaining_ > 0)
        return framingError("stream ended inside a segment");
    if (markerOpen_ || !line_.empty())
        return framingError("stream ended inside a boundary marker");
    return {};
}

} // namespace gamefetch::protocol
