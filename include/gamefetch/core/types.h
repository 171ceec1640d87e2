#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gamefetch {

// Type aliases
using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    Unauthorized,
    NotFound,
    PathViolation,
    RangeNotSatisfiable,
    EmptyCatalog,
    ScanFailed,
    NetworkError,
    Timeout,
    IoError,
    ServerError,
    HashMismatch,
    CorruptedData,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::Unauthorized: return "Invalid API key";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::PathViolation: return "Access to this path is forbidden";
        case ErrorCode::RangeNotSatisfiable: return "Offset exceeds file size";
        case ErrorCode::EmptyCatalog: return "Game has no content to download";
        case ErrorCode::ScanFailed: return "Catalog scan failed";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::IoError: return "I/O error";
        case ErrorCode::ServerError: return "Server error";
        case ErrorCode::HashMismatch: return "Hash mismatch";
        case ErrorCode::CorruptedData: return "Corrupted data";
        case ErrorCode::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

// Stable snake_case names used in wire error bodies ({"code": "..."}).
constexpr const char* errorName(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "success";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::Unauthorized: return "unauthorized";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::PathViolation: return "path_violation";
        case ErrorCode::RangeNotSatisfiable: return "range_not_satisfiable";
        case ErrorCode::EmptyCatalog: return "empty_catalog";
        case ErrorCode::ScanFailed: return "scan_failed";
        case ErrorCode::NetworkError: return "network_error";
        case ErrorCode::Timeout: return "timeout";
        case ErrorCode::IoError: return "io_error";
        case ErrorCode::ServerError: return "server_error";
        case ErrorCode::HashMismatch: return "hash_mismatch";
        case ErrorCode::CorruptedData: return "corrupted_data";
        case ErrorCode::Unknown: return "unknown";
    }
    return "unknown";
}

// Inverse of errorName(); unrecognised names map to ErrorCode::Unknown.
ErrorCode errorCodeFromName(std::string_view name) noexcept;

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Simple Result type for operations that can fail
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T& value() & {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

// Consumer of streamed bytes. Returning an error aborts the producer.
using ByteSink = std::function<Result<void>(ByteSpan)>;

} // namespace gamefetch

// fmt library support for ErrorCode (for spdlog)
#include <spdlog/fmt/fmt.h>
template <> struct fmt::formatter<gamefetch::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(gamefetch::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", gamefetch::errorName(error));
    }
};

namespace gamefetch {

// Common constants
inline constexpr std::size_t DEFAULT_CHUNK_SIZE = 64 * 1024;  // 64KB
inline constexpr std::size_t MIN_STREAM_CHUNK_SIZE = 1024;
inline constexpr std::size_t MAX_STREAM_CHUNK_SIZE = 1024 * 1024;

// Shared-secret header carried by every request.
inline constexpr std::string_view API_KEY_HEADER = "X-API-Key";

} // namespace gamefetch
