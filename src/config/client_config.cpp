#include <gamefetch/config/client_config.h>
#include <gamefetch/config/config_helpers.h>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdlib>

namespace gamefetch::config {

namespace {

constexpr const char* kSection = "client";

Result<long> parsePositive(const std::string& key, const std::string& raw) {
    long value = 0;
    auto res = std::from_chars(raw.data(), raw.data() + raw.size(), value);
    if (res.ec != std::errc() || res.ptr != raw.data() + raw.size() || value <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("client.{} must be a positive integer, got '{}'", key, raw)};
    }
    return value;
}

} // namespace

Result<ClientConfig> loadClientConfig(const std::filesystem::path& path) {
    ClientConfig cfg;

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        spdlog::debug("Reading client config '{}'", path.string());

        if (auto v = parse_config_value(path, kSection, "server_url"); !v.empty())
            cfg.serverUrl = v;
        if (auto v = parse_config_value(path, kSection, "api_key"); !v.empty())
            cfg.apiKey = v;
        if (auto v = parse_config_value(path, kSection, "install_root"); !v.empty())
            cfg.installRoot = expand_tilde(v);

        if (auto v = parse_config_value(path, kSection, "catalog_timeout_ms"); !v.empty()) {
            auto ms = parsePositive("catalog_timeout_ms", v);
            if (!ms)
                return ms.error();
            cfg.catalogTimeout = std::chrono::milliseconds(ms.value());
        }
        if (auto v = parse_config_value(path, kSection, "connect_timeout_ms"); !v.empty()) {
            auto ms = parsePositive("connect_timeout_ms", v);
            if (!ms)
                return ms.error();
            cfg.connectTimeout = std::chrono::milliseconds(ms.value());
        }
        if (auto v = parse_config_value(path, kSection, "stall_timeout_s"); !v.empty()) {
            auto s = parsePositive("stall_timeout_s", v);
            if (!s)
                return s.error();
            cfg.stallTimeout = std::chrono::seconds(s.value());
        }
        if (auto v = parse_config_value(path, kSection, "verify_checksums"); !v.empty()) {
            auto b = parse_bool(v);
            if (!b) {
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("client.verify_checksums must be a boolean, got '{}'", v)};
            }
            cfg.verifyChecksums = *b;
        }
    }

    if (const char* env = std::getenv("GAMEFETCH_SERVER_URL"); env && *env)
        cfg.serverUrl = env;
    if (const char* env = std::getenv("GAMEFETCH_API_KEY"); env && *env)
        cfg.apiKey = env;

    while (!cfg.serverUrl.empty() && cfg.serverUrl.back() == '/')
        cfg.serverUrl.pop_back();
    return cfg;
}

} // namespace gamefetch::config
