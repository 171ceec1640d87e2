#pragma once

#include <gamefetch/catalog/catalog.h>
#include <gamefetch/client/http_transport.h>
#include <gamefetch/protocol/wire_json.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace gamefetch::client {

struct ServerEndpoint {
    std::string baseUrl; // e.g. "http://127.0.0.1:8000", no trailing slash
    std::string apiKey;
};

/**
 * Catalog-side requests against one server. Every request carries X-API-Key and uses the
 * short catalog options; the URL builders are shared with the downloaders.
 */
class CatalogClient {
public:
    CatalogClient(std::shared_ptr<IHttpTransport> transport, ServerEndpoint endpoint,
                  RequestOptions catalogOptions);

    Result<protocol::ServerStatus> status();
    Result<std::vector<protocol::GameSummary>> listGames();
    Result<protocol::RemoteCatalog> fetchCatalog(std::string_view gameId);
    Result<protocol::StartInfo> fetchStartInfo(std::string_view gameId, double progress);

    std::string fileUrl(std::string_view gameId, const catalog::CatalogEntry& entry,
                        std::uint64_t offset) const;
    std::string streamUrl(std::string_view gameId, double progress, std::size_t chunkSize) const;

    std::vector<Header> authHeaders() const;

    IHttpTransport& transport() noexcept { return *transport_; }
    const ServerEndpoint& endpoint() const noexcept { return endpoint_; }

private:
    Result<std::string> getJson(const std::string& path);

    std::shared_ptr<IHttpTransport> transport_;
    ServerEndpoint endpoint_;
    RequestOptions catalogOptions_;
};

} // namespace gamefetch::client
