#include <gamefetch/protocol/url_codec.h>

#include <boost/algorithm/string.hpp>

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <vector>

namespace gamefetch::protocol {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

std::string percentEncode(std::string_view s, bool encodeSlash) {
    static const char* unreserved =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_.~";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c != 0 && std::strchr(unreserved, c)) || (!encodeSlash && c == '/')) {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

Result<std::string> percentDecode(std::string_view s, bool plusAsSpace) {
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%') {
            if (i + 2 >= s.size()) {
                return Error{ErrorCode::InvalidArgument, "Truncated percent escape"};
            }
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi < 0 || lo < 0) {
                return Error{ErrorCode::InvalidArgument, "Malformed percent escape"};
            }
            c = static_cast<char>((hi << 4) | lo);
            i += 2;
        } else if (plusAsSpace && c == '+') {
            c = ' ';
        }
        if (c == '\0') {
            return Error{ErrorCode::InvalidArgument, "NUL byte in encoded value"};
        }
        out.push_back(c);
    }
    return out;
}

bool isValidUtf8(std::string_view s) noexcept {
    std::size_t i = 0;
    while (i < s.size()) {
        const auto lead = static_cast<unsigned char>(s[i]);
        if (lead <= 0x7F) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        std::uint32_t cp = 0;
        if ((lead & 0xE0) == 0xC0) {
            len = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4;
            cp = lead & 0x07;
        } else {
            return false;
        }
        if (len > s.size() - i)
            return false;
        for (std::size_t k = 1; k < len; ++k) {
            const auto c = static_cast<unsigned char>(s[i + k]);
            if ((c & 0xC0) != 0x80)
                return false;
            cp = (cp << 6) | (c & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF)
            return false;
        i += len;
    }
    return true;
}

std::string_view targetPath(std::string_view target) noexcept {
    auto pos = target.find('?');
    return pos == std::string_view::npos ? target : target.substr(0, pos);
}

std::optional<std::string> getQueryParam(std::string_view target, std::string_view key) {
    auto pos = target.find('?');
    if (pos == std::string_view::npos)
        return std::nullopt;
    std::string q(target.substr(pos + 1));
    std::vector<std::string> parts;
    boost::split(parts, q, boost::is_any_of("&"));
    for (auto& p : parts) {
        auto eq = p.find('=');
        auto k = p.substr(0, eq);
        if (k != key)
            continue;
        if (eq == std::string::npos)
            return std::string{};
        auto raw = std::string_view(p).substr(eq + 1);
        auto decoded = percentDecode(raw, true);
        // Undecodable values are handed back raw so the caller's validation rejects them.
        if (!decoded)
            return std::string(raw);
        return std::move(decoded).value();
    }
    return std::nullopt;
}

} // namespace gamefetch::protocol
