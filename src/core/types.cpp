#include <gamefetch/core/types.h>

#include <array>

namespace gamefetch {

ErrorCode errorCodeFromName(std::string_view name) noexcept {
    static constexpr std::array kAll = {
        ErrorCode::Success,         ErrorCode::InvalidArgument,     ErrorCode::Unauthorized,
        ErrorCode::NotFound,        ErrorCode::PathViolation,       ErrorCode::RangeNotSatisfiable,
        ErrorCode::EmptyCatalog,    ErrorCode::ScanFailed,          ErrorCode::NetworkError,
        ErrorCode::Timeout,         ErrorCode::IoError,             ErrorCode::ServerError,
        ErrorCode::HashMismatch,    ErrorCode::CorruptedData,       ErrorCode::Unknown};
    for (auto code : kAll) {
        if (name == errorName(code)) {
            return code;
        }
    }
    return ErrorCode::Unknown;
}

} // namespace gamefetch
