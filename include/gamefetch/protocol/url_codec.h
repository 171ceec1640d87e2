#pragma once

#include <gamefetch/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace gamefetch::protocol {

// RFC 3986 percent-encoding; '/' is kept unless encodeSlash is set.
std::string percentEncode(std::string_view s, bool encodeSlash = false);

// Decodes %XX escapes. With plusAsSpace (query strings), '+' becomes ' '.
// Malformed escapes and embedded NUL bytes yield InvalidArgument.
Result<std::string> percentDecode(std::string_view s, bool plusAsSpace = false);

// Well-formed UTF-8: no overlong forms, surrogates or code points past U+10FFFF.
bool isValidUtf8(std::string_view s) noexcept;

// Path component of a request target (everything before '?').
std::string_view targetPath(std::string_view target) noexcept;

// First value for key in the target's query string, percent-decoded.
std::optional<std::string> getQueryParam(std::string_view target, std::string_view key);

} // namespace gamefetch::protocol
