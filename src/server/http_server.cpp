#include <gamefetch/protocol/url_codec.h>
#include <gamefetch/server/http_server.h>

#include <boost/asio/post.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/buffer_body.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <thread>

using nlohmann::json;

namespace gamefetch::server {

namespace {

constexpr std::string_view kGamesPrefix = "/games/";
constexpr std::string_view kStartSuffix = "/start";
constexpr std::string_view kFilePrefix = "/download/file/";
constexpr std::string_view kStreamPrefix = "/download/stream/";
constexpr const char* kServerHeader = "gamefetch";

bool startsWith(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

Result<std::uint64_t> parseOffset(const std::optional<std::string>& raw) {
    if (!raw || raw->empty())
        return std::uint64_t{0};
    std::uint64_t v = 0;
    auto res = std::from_chars(raw->data(), raw->data() + raw->size(), v);
    if (res.ec != std::errc() || res.ptr != raw->data() + raw->size()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("offset must be a non-negative integer, got '{}'", *raw)};
    }
    return v;
}

Result<double> parseProgress(const std::optional<std::string>& raw) {
    if (!raw || raw->empty())
        return 0.0;
    double v = 0.0;
    auto res = std::from_chars(raw->data(), raw->data() + raw->size(), v);
    if (res.ec != std::errc() || res.ptr != raw->data() + raw->size() || !(v >= 0.0 && v <= 100.0)) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("progress must be a number between 0 and 100, got '{}'", *raw)};
    }
    return v;
}

Result<std::size_t> parseChunkSize(const std::optional<std::string>& raw) {
    if (!raw || raw->empty())
        return DEFAULT_CHUNK_SIZE;
    std::size_t v = 0;
    auto res = std::from_chars(raw->data(), raw->data() + raw->size(), v);
    if (res.ec != std::errc() || res.ptr != raw->data() + raw->size() ||
        v < MIN_STREAM_CHUNK_SIZE || v > MAX_STREAM_CHUNK_SIZE) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("chunk_size must be between {} and {}, got '{}'",
                                 MIN_STREAM_CHUNK_SIZE, MAX_STREAM_CHUNK_SIZE, *raw)};
    }
    return v;
}

std::optional<std::string_view> apiKeyOf(const http::request<http::string_body>& req) {
    if (auto h = req.find(beast::string_view(API_KEY_HEADER.data(), API_KEY_HEADER.size()));
        h != req.end())
        return std::string_view(h->value().data(), h->value().size());
    return std::nullopt;
}

// Header values must not carry quotes or line breaks.
std::string headerSafe(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        if (c == '"' || c == '\r' || c == '\n')
            c = '_';
    }
    return out;
}

/**
 * Incremental writer for a buffer_body response. Bytes handed to the sink go to the socket
 * immediately; finish() terminates the body (the last chunk for chunked responses).
 */
class BodyStreamer {
public:
    BodyStreamer(tcp::socket& socket, http::response<http::buffer_body>& res)
        : socket_(socket), res_(res), serializer_(res_) {}

    Result<void> writeHeader() {
        res_.body().data = nullptr;
        res_.body().more = true;
        beast::error_code ec;
        http::write_header(socket_, serializer_, ec);
        if (ec)
            return Error{ErrorCode::NetworkError, "write header: " + ec.message()};
        return {};
    }

    ByteSink sink() {
        return [this](ByteSpan bytes) -> Result<void> {
            if (bytes.empty())
                return {};
            res_.body().data = const_cast<std::byte*>(bytes.data());
            res_.body().size = bytes.size();
            res_.body().more = true;
            beast::error_code ec;
            http::write(socket_, serializer_, ec);
            if (ec == http::error::need_buffer)
                ec = {};
            if (ec)
                return Error{ErrorCode::NetworkError, "client write: " + ec.message()};
            return {};
        };
    }

    Result<void> finish() {
        res_.body().data = nullptr;
        res_.body().more = false;
        beast::error_code ec;
        http::write(socket_, serializer_, ec);
        if (ec)
            return Error{ErrorCode::NetworkError, "finish body: " + ec.message()};
        return {};
    }

private:
    tcp::socket& socket_;
    http::response<http::buffer_body>& res_;
    http::response_serializer<http::buffer_body> serializer_;
};

} // namespace

GameHttpServer::GameHttpServer(boost::asio::io_context& ioc,
                               std::shared_ptr<const GameService> service, const Config& cfg)
    : ioc_(ioc), acceptor_(ioc), service_(std::move(service)), cfg_(cfg), reaper_(ioc) {}

GameHttpServer::~GameHttpServer() {
    beast::error_code ec;
    acceptor_.close(ec);
    reapIdle(true);
    std::unique_lock lk(sessionsMutex_);
    sessionsDone_.wait(lk, [this] { return sessions_.empty(); });
}

Result<void> GameHttpServer::listen() {
    beast::error_code ec;
    const tcp::endpoint ep{boost::asio::ip::make_address(cfg_.bindAddress, ec), cfg_.bindPort};
    if (ec)
        return Error{ErrorCode::InvalidArgument, "Invalid bind address: " + ec.message()};
    acceptor_.open(ep.protocol(), ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "acceptor open failed: " + ec.message()};
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    acceptor_.bind(ep, ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "bind failed: " + ec.message()};
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec)
        return Error{ErrorCode::NetworkError, "listen failed: " + ec.message()};

    boundPort_.store(acceptor_.local_endpoint().port());
    spdlog::info("Game server listening on {}:{}", cfg_.bindAddress, boundPort_.load());
    return {};
}

void GameHttpServer::run() {
    doAccept();
    scheduleReap();
    ioc_.run();

    std::unique_lock lk(sessionsMutex_);
    sessionsDone_.wait(lk, [this] { return sessions_.empty(); });
    spdlog::info("Game server stopped");
}

void GameHttpServer::stop() {
    boost::asio::post(ioc_, [this] {
        beast::error_code ec;
        acceptor_.close(ec);
        reaper_.cancel();
        reapIdle(true);
    });
}

std::size_t GameHttpServer::activeSessions() const {
    std::lock_guard lk(sessionsMutex_);
    return sessions_.size();
}

void GameHttpServer::doAccept() {
    acceptor_.async_accept([this](beast::error_code ec, tcp::socket socket) {
        if (ec == boost::asio::error::operation_aborted)
            return;
        if (ec) {
            spdlog::warn("accept error: {}", ec.message());
        } else {
            startSession(std::move(socket));
        }
        if (acceptor_.is_open())
            doAccept();
    });
}

void GameHttpServer::scheduleReap() {
    reaper_.expires_after(std::chrono::seconds(1));
    reaper_.async_wait([this](beast::error_code ec) {
        if (ec == boost::asio::error::operation_aborted || !acceptor_.is_open())
            return;
        reapIdle(false);
        scheduleReap();
    });
}

void GameHttpServer::reapIdle(bool all) {
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard lk(sessionsMutex_);
    for (const auto& session : sessions_) {
        if (!all && now - session->accepted < cfg_.requestTimeout)
            continue;
        std::lock_guard sessionLock(session->mutex);
        if (!session->awaitingRequest)
            continue;
        // Wakes the blocked read with end-of-stream; the session thread closes the socket.
        beast::error_code ec;
        session->socket.shutdown(tcp::socket::shutdown_both, ec);
        session->awaitingRequest = false;
        spdlog::debug("Dropped connection with no request ({})", all ? "shutdown" : "timeout");
    }
}

void GameHttpServer::startSession(tcp::socket socket) {
    auto session = std::make_shared<Session>(std::move(socket));
    {
        std::lock_guard lk(sessionsMutex_);
        sessions_.insert(session);
    }
    std::thread([this, session = std::move(session)]() mutable {
        handleSession(*session);
        beast::error_code ec;
        session->socket.close(ec);
        std::lock_guard lk(sessionsMutex_);
        sessions_.erase(session);
        // The socket must not outlive the io_context the destructor's caller owns.
        session.reset();
        if (sessions_.empty())
            sessionsDone_.notify_all();
    }).detach();
}

void GameHttpServer::handleSession(Session& session) {
    auto& socket = session.socket;
    beast::flat_buffer buffer;
    beast::error_code ec;
    http::request<http::string_body> req;
    http::read(socket, buffer, req, ec);
    {
        std::lock_guard lk(session.mutex);
        if (!session.awaitingRequest) {
            spdlog::debug("Connection dropped before its request was served");
            return;
        }
        session.awaitingRequest = false;
    }
    if (ec) {
        spdlog::debug("http read error: {}", ec.message());
        return;
    }

    const std::string target(req.target());
    const auto path = protocol::targetPath(target);
    spdlog::debug("{} {}", std::string(req.method_string()), target);

    if (req.method() != http::verb::get) {
        http::response<http::string_body> res{http::status::method_not_allowed, req.version()};
        res.set(http::field::server, kServerHeader);
        res.set(http::field::allow, "GET");
        res.set(http::field::content_type, "application/json");
        res.body() = protocol::dumpJson(
            protocol::errorBody({ErrorCode::InvalidArgument, "Method not allowed"}));
        res.keep_alive(false);
        res.prepare_payload();
        http::write(socket, res, ec);
        socket.shutdown(tcp::socket::shutdown_send, ec);
        return;
    }

    if (path == "/") {
        sendJson(socket, req, http::status::ok, protocol::toJson(service_->status()));
        return;
    }

    if (!service_->authorize(apiKeyOf(req))) {
        sendError(socket, req, Error{ErrorCode::Unauthorized});
        return;
    }

    if (path == "/games") {
        sendJson(socket, req, http::status::ok, protocol::toJson(service_->listGames()));
        return;
    }

    if (startsWith(path, kFilePrefix)) {
        handleFile(socket, req, path.substr(kFilePrefix.size()));
        return;
    }

    if (startsWith(path, kStreamPrefix)) {
        auto id = protocol::percentDecode(path.substr(kStreamPrefix.size()));
        if (!id) {
            sendError(socket, req, id.error());
            return;
        }
        handleStream(socket, req, id.value());
        return;
    }

    if (startsWith(path, kGamesPrefix)) {
        auto rest = path.substr(kGamesPrefix.size());
        const bool start = rest.size() > kStartSuffix.size() &&
                           rest.substr(rest.size() - kStartSuffix.size()) == kStartSuffix;
        if (start)
            rest.remove_suffix(kStartSuffix.size());
        if (!rest.empty() && rest.find('/') == std::string_view::npos) {
            auto id = protocol::percentDecode(rest);
            if (!id) {
                sendError(socket, req, id.error());
                return;
            }
            if (start) {
                auto progress = parseProgress(protocol::getQueryParam(target, "progress"));
                if (!progress) {
                    sendError(socket, req, progress.error());
                    return;
                }
                auto info = service_->startInfo(id.value(), progress.value());
                if (!info) {
                    sendError(socket, req, info.error());
                    return;
                }
                sendJson(socket, req, http::status::ok, protocol::toJson(info.value()));
            } else {
                auto catalog = service_->describeGame(id.value());
                if (!catalog) {
                    sendError(socket, req, catalog.error());
                    return;
                }
                sendJson(socket, req, http::status::ok, protocol::toJson(catalog.value()));
            }
            return;
        }
    }

    sendError(socket, req, Error{ErrorCode::NotFound, fmt::format("No route for '{}'", path)});
}

void GameHttpServer::handleFile(tcp::socket& socket, const http::request<http::string_body>& req,
                                std::string_view rest) {
    const std::string target(req.target());
    auto slash = rest.find('/');
    auto id = protocol::percentDecode(rest.substr(0, slash));
    if (!id) {
        sendError(socket, req, id.error());
        return;
    }
    auto relPath = protocol::percentDecode(slash == std::string_view::npos ? std::string_view{}
                                                                           : rest.substr(slash + 1));
    if (!relPath) {
        sendError(socket, req, relPath.error());
        return;
    }
    auto offset = parseOffset(protocol::getQueryParam(target, "offset"));
    if (!offset) {
        sendError(socket, req, offset.error());
        return;
    }

    auto plan = service_->planFileDownload(id.value(), relPath.value(), offset.value());
    if (!plan) {
        sendError(socket, req, plan.error());
        return;
    }
    const auto& p = plan.value();

    http::response<http::buffer_body> res{
        p.partial() ? http::status::partial_content : http::status::ok, req.version()};
    res.set(http::field::server, kServerHeader);
    res.set(http::field::content_type, "application/octet-stream");
    res.set(http::field::accept_ranges, "bytes");
    res.set(http::field::content_disposition,
            fmt::format("attachment; filename=\"{}\"", headerSafe(p.fileName)));
    if (p.partial()) {
        res.set(http::field::content_range,
                fmt::format("bytes {}-{}/{}", p.offset, p.fileSize - 1, p.fileSize));
    }
    res.content_length(p.length());
    res.keep_alive(false);

    BodyStreamer streamer(socket, res);
    if (auto r = streamer.writeHeader(); !r) {
        spdlog::debug("File '{}': {}", relPath.value(), r.error().message);
        return;
    }
    if (auto r = sendFileRange(p, streamer.sink()); !r) {
        spdlog::warn("File '{}' transfer aborted: {}", relPath.value(), r.error().message);
        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return;
    }
    if (auto r = streamer.finish(); !r) {
        spdlog::debug("File '{}': {}", relPath.value(), r.error().message);
    }
    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

void GameHttpServer::handleStream(tcp::socket& socket, const http::request<http::string_body>& req,
                                  std::string_view gameId) {
    const std::string target(req.target());
    auto progress = parseProgress(protocol::getQueryParam(target, "progress"));
    if (!progress) {
        sendError(socket, req, progress.error());
        return;
    }
    auto chunkSize = parseChunkSize(protocol::getQueryParam(target, "chunk_size"));
    if (!chunkSize) {
        sendError(socket, req, chunkSize.error());
        return;
    }

    auto plan = service_->planStream(gameId, progress.value(), chunkSize.value());
    if (!plan) {
        sendError(socket, req, plan.error());
        return;
    }
    const auto& p = plan.value();

    http::response<http::buffer_body> res{http::status::ok, req.version()};
    res.set(http::field::server, kServerHeader);
    res.set(http::field::content_type, "application/octet-stream");
    res.set(http::field::content_disposition,
            fmt::format("attachment; filename=\"{}.stream\"", headerSafe(p.gameId)));
    res.set("X-Game-Id", headerSafe(p.gameId));
    res.set("X-Start-File-Index", std::to_string(p.start.fileIndex));
    res.set("X-Start-File-Path", headerSafe(p.entries[p.start.fileIndex].relativePath));
    res.set("X-Start-File-Offset", std::to_string(p.start.byteOffset));
    res.set("X-Total-Files", std::to_string(p.entries.size()));
    res.set("X-Current-Progress", fmt::format("{}", p.progress));
    res.set("X-Total-Size", std::to_string(p.totalBytes));
    res.chunked(true);
    res.keep_alive(false);

    spdlog::info("Stream '{}' from file {} offset {} ({} bytes advertised)", p.gameId,
                 p.start.fileIndex, p.start.byteOffset, p.totalBytes);

    BodyStreamer streamer(socket, res);
    if (auto r = streamer.writeHeader(); !r) {
        spdlog::debug("Stream '{}': {}", p.gameId, r.error().message);
        return;
    }
    if (auto r = writeStream(p, streamer.sink()); !r) {
        // Closing without the terminating chunk tells the client the stream is incomplete.
        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return;
    }
    if (auto r = streamer.finish(); !r) {
        spdlog::debug("Stream '{}': {}", p.gameId, r.error().message);
    }
    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

void GameHttpServer::sendJson(tcp::socket& socket, const http::request<http::string_body>& req,
                              http::status status, const json& body) {
    http::response<http::string_body> res{status, req.version()};
    res.set(http::field::server, kServerHeader);
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.body() = protocol::dumpJson(body);
    res.keep_alive(false);
    res.prepare_payload();
    beast::error_code ec;
    http::write(socket, res, ec);
    if (ec)
        spdlog::debug("http write error: {}", ec.message());
    socket.shutdown(tcp::socket::shutdown_send, ec);
}

void GameHttpServer::sendError(tcp::socket& socket, const http::request<http::string_body>& req,
                               const Error& error) {
    const int status = protocol::httpStatusFor(error.code);
    if (status >= 500) {
        spdlog::error("{} {} failed: {}", std::string(req.method_string()),
                      std::string(req.target()), error.message);
    } else {
        spdlog::debug("{} {} -> {} ({})", std::string(req.method_string()),
                      std::string(req.target()), status, error.code);
    }
    sendJson(socket, req, static_cast<http::status>(status), protocol::errorBody(error));
}

} // namespace gamefetch::server
