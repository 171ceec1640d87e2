#pragma once

#include <gamefetch/server/game_service.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace gamefetch::server {

namespace http = boost::beast::http;
namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

/**
 * HTTP front end for GameService.
 *
 *   GET /                                   status document (no key required)
 *   GET /games                              game list
 *   GET /games/{id}                         catalog with file tree
 *   GET /games/{id}/start?progress=P        resolved resume point
 *   GET /download/file/{id}/{path}?offset=O single file, 200 or 206
 *   GET /download/stream/{id}?progress=P&chunk_size=C  framed multi-file stream
 *
 * Accepts on the io_context; each connection is then served on its own thread with blocking
 * Beast I/O, one request per connection. A connection that has not delivered its request
 * within requestTimeout is shut down, and stop() shuts down every connection still waiting
 * for one, so idle clients cannot pin a thread or hold up shutdown.
 */
class GameHttpServer {
public:
    struct Config {
        std::string bindAddress = "0.0.0.0";
        std::uint16_t bindPort = 8000; // 0 picks an ephemeral port
        std::chrono::seconds requestTimeout{30};
    };

    GameHttpServer(boost::asio::io_context& ioc, std::shared_ptr<const GameService> service,
                   const Config& cfg);
    ~GameHttpServer();

    GameHttpServer(const GameHttpServer&) = delete;
    GameHttpServer& operator=(const GameHttpServer&) = delete;

    // Opens, binds and listens. Must be called before run().
    Result<void> listen();

    std::uint16_t boundPort() const noexcept { return boundPort_.load(); }

    // Runs the io_context until stop(), then waits for in-flight sessions to finish.
    void run();

    // Thread-safe; stops accepting new connections and drops those still awaiting a request.
    void stop();

    std::size_t activeSessions() const;

private:
    struct Session {
        explicit Session(tcp::socket s)
            : socket(std::move(s)), accepted(std::chrono::steady_clock::now()) {}

        tcp::socket socket;
        std::chrono::steady_clock::time_point accepted;
        std::mutex mutex;
        bool awaitingRequest{true};
    };

    void doAccept();
    void scheduleReap();
    // Shuts down sessions still waiting for their request: all of them, or only expired ones.
    void reapIdle(bool all);
    void startSession(tcp::socket socket);
    void handleSession(Session& session);

    void handleFile(tcp::socket& socket, const http::request<http::string_body>& req,
                    std::string_view rest);
    void handleStream(tcp::socket& socket, const http::request<http::string_body>& req,
                      std::string_view gameId);

    void sendJson(tcp::socket& socket, const http::request<http::string_body>& req,
                  http::status status, const nlohmann::json& body);
    void sendError(tcp::socket& socket, const http::request<http::string_body>& req,
                   const Error& error);

    boost::asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    std::shared_ptr<const GameService> service_;
    Config cfg_{};
    std::atomic<std::uint16_t> boundPort_{0};

    boost::asio::steady_timer reaper_;

    mutable std::mutex sessionsMutex_;
    std::condition_variable sessionsDone_;
    std::set<std::shared_ptr<Session>> sessions_;
};

} // namespace gamefetch::server
