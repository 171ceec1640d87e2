#pragma once

#include <gamefetch/core/types.h>

#include <chrono>
#include <filesystem>
#include <string>

namespace gamefetch::config {

struct ClientConfig {
    std::string serverUrl = "http://127.0.0.1:8000";
    std::string apiKey;
    std::filesystem::path installRoot = ".";
    std::chrono::milliseconds catalogTimeout{10000};
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::seconds stallTimeout{30};
    bool verifyChecksums = true;
};

/**
 * Load the [client] section of a config.toml:
 *
 *   [client]
 *   server_url = "http://host:8000"
 *   api_key = "..."
 *   install_root = "~/Games"
 *   catalog_timeout_ms = 10000
 *   connect_timeout_ms = 10000
 *   stall_timeout_s = 30
 *   verify_checksums = true
 *
 * A missing file yields the defaults. GAMEFETCH_SERVER_URL and GAMEFETCH_API_KEY override
 * the file. Unparsable numbers or booleans are InvalidArgument.
 */
Result<ClientConfig> loadClientConfig(const std::filesystem::path& path);

} // namespace gamefetch::config
