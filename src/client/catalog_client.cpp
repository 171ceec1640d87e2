#include <gamefetch/client/catalog_client.h>
#include <gamefetch/protocol/url_codec.h>

#include <spdlog/spdlog.h>

namespace gamefetch::client {

CatalogClient::CatalogClient(std::shared_ptr<IHttpTransport> transport, ServerEndpoint endpoint,
                             RequestOptions catalogOptions)
    : transport_(std::move(transport)), endpoint_(std::move(endpoint)),
      catalogOptions_(catalogOptions) {
    while (!endpoint_.baseUrl.empty() && endpoint_.baseUrl.back() == '/')
        endpoint_.baseUrl.pop_back();
}

std::vector<Header> CatalogClient::authHeaders() const {
    return {Header{std::string(API_KEY_HEADER), endpoint_.apiKey}};
}

Result<std::string> CatalogClient::getJson(const std::string& path) {
    return transport_->get(endpoint_.baseUrl + path, authHeaders(), catalogOptions_);
}

Result<protocol::ServerStatus> CatalogClient::status() {
    auto body = getJson("/");
    if (!body)
        return body.error();
    return protocol::parseServerStatus(body.value());
}

Result<std::vector<protocol::GameSummary>> CatalogClient::listGames() {
    auto body = getJson("/games");
    if (!body)
        return body.error();
    return protocol::parseGameList(body.value());
}

Result<protocol::RemoteCatalog> CatalogClient::fetchCatalog(std::string_view gameId) {
    auto body = getJson("/games/" + protocol::percentEncode(gameId, true));
    if (!body)
        return body.error();
    auto catalog = protocol::parseCatalog(body.value());
    if (catalog) {
        spdlog::debug("Catalog '{}': {} files, {} bytes", gameId, catalog.value().files.size(),
                      catalog.value().totalSize);
    }
    return catalog;
}

Result<protocol::StartInfo> CatalogClient::fetchStartInfo(std::string_view gameId,
                                                          double progress) {
    auto body = getJson(fmt::format("/games/{}/start?progress={}",
                                    protocol::percentEncode(gameId, true), progress));
    if (!body)
        return body.error();
    return protocol::parseStartInfo(body.value());
}

std::string CatalogClient::fileUrl(std::string_view gameId, const catalog::CatalogEntry& entry,
                                   std::uint64_t offset) const {
    return fmt::format("{}{}?offset={}", endpoint_.baseUrl, catalog::downloadUrlFor(gameId, entry),
                       offset);
}

std::string CatalogClient::streamUrl(std::string_view gameId, double progress,
                                     std::size_t chunkSize) const {
    return fmt::format("{}/download/stream/{}?progress={}&chunk_size={}", endpoint_.baseUrl,
                       protocol::percentEncode(gameId, true), progress, chunkSize);
}

} // namespace gamefetch::client
