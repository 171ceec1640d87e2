#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <thread>

#include <CLI/CLI.hpp>

#include <gamefetch/config/server_config.h>
#include <gamefetch/core/logging.h>
#include <gamefetch/server/http_server.h>

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

int main(int argc, char* argv[]) {
    CLI::App app{"gamefetch server - serves game catalogs and resumable downloads"};

    std::string config_path;
    std::string host;
    int port = -1;
    std::string log_level = "info";
    std::string log_file;

    app.add_option("-c,--config", config_path,
                   "Config file (default: $GAMEFETCH_CONFIG or ./config.json)");
    app.add_option("--host", host, "Bind address, overrides server.host");
    app.add_option("-p,--port", port, "Listen port, overrides server.port")
        ->check(CLI::Range(0, 65535));
    app.add_option("-l,--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))
        ->default_val("info");
    app.add_option("--log-file", log_file, "Log file path (optional)");
    CLI11_PARSE(app, argc, argv);

    try {
        gamefetch::setupLogging("gamefetch-server", log_level, log_file);
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    auto loaded = gamefetch::config::loadServerConfig(
        gamefetch::config::resolveServerConfigPath(config_path));
    if (!loaded) {
        spdlog::error("Cannot start: {}", loaded.error().message);
        return 1;
    }
    auto cfg = std::move(loaded).value();
    if (!host.empty())
        cfg.server.host = host;
    if (port >= 0)
        cfg.server.port = static_cast<std::uint16_t>(port);

    // Frozen from here on; handlers only ever see this snapshot.
    const gamefetch::config::ServerConfigPtr snapshot =
        std::make_shared<const gamefetch::config::ServerConfig>(std::move(cfg));

    spdlog::info("Games available: {}", snapshot->games.size());
    spdlog::info("API key verification: {}", snapshot->authEnabled() ? "enabled" : "disabled");

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    boost::asio::io_context ioc;
    gamefetch::server::GameHttpServer server(
        ioc, std::make_shared<const gamefetch::server::GameService>(snapshot),
        {snapshot->server.host, snapshot->server.port});
    if (auto r = server.listen(); !r) {
        spdlog::error("Cannot listen on {}:{}: {}", snapshot->server.host, snapshot->server.port,
                      r.error().message);
        return 1;
    }

    std::thread server_thread([&server]() { server.run(); });
    spdlog::info("Press Ctrl+C to stop");

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutting down, waiting for active transfers...");
    server.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }
    return 0;
}
