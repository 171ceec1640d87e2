#pragma once

/*
 * gamefetch client - HTTP transport abstraction
 *
 * The downloader and catalog client only talk to IHttpTransport, so tests can substitute an
 * in-memory transport. The production implementation is libcurl based (makeCurlHttpTransport).
 *
 * Every request is bounded: buffered requests by a total timeout, streaming requests by a
 * connect timeout plus a stall timeout (the transfer fails once it receives nothing for that
 * long), since a large file has no sensible total timeout.
 */

#include <gamefetch/core/types.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gamefetch::client {

struct Header {
    std::string name;
    std::string value;
};

struct RequestOptions {
    std::chrono::milliseconds totalTimeout{0}; // 0 = no total bound
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::seconds stallTimeout{0}; // 0 = no stall detection
};

// Outcome of a successful (2xx) streaming request.
struct StreamResponse {
    long status{0};
    std::map<std::string, std::string> headers; // lower-cased names
    std::uint64_t bytesReceived{0};
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /**
     * GET and buffer the body. Non-2xx responses become errors decoded from the server's
     * {"detail", "code"} body.
     */
    virtual Result<std::string> get(std::string_view url, const std::vector<Header>& headers,
                                    const RequestOptions& options) = 0;

    /**
     * GET and hand body bytes to sink as they arrive. The sink only ever sees 2xx bodies;
     * an error returned by the sink aborts the transfer and is returned unchanged.
     */
    virtual Result<StreamResponse> fetch(std::string_view url, const std::vector<Header>& headers,
                                         const RequestOptions& options, const ByteSink& sink) = 0;
};

std::unique_ptr<IHttpTransport> makeCurlHttpTransport();

} // namespace gamefetch::client
