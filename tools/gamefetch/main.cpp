#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include <CLI/CLI.hpp>

#include <gamefetch/client/catalog_client.h>
#include <gamefetch/client/downloader.h>
#include <gamefetch/client/stream_downloader.h>
#include <gamefetch/config/client_config.h>
#include <gamefetch/config/config_helpers.h>
#include <gamefetch/core/logging.h>

namespace fs = std::filesystem;
using namespace gamefetch;

namespace {

struct Options {
    std::string config_path;
    std::string server_url;
    std::string api_key;
    std::string log_level = "warn";
    std::string log_file;
    bool no_verify{false};

    std::string game_id;
    std::string install_dir;
    double progress{0.0};
    std::size_t chunk_size{DEFAULT_CHUNK_SIZE};
};

// Single-line progress on stderr, redrawn only when the whole percentage changes.
client::DownloadCallbacks consoleCallbacks() {
    auto last = std::make_shared<int>(-1);
    client::DownloadCallbacks cb;
    cb.onProgress = [last](std::uint64_t done, std::uint64_t total) {
        const int pct = total ? static_cast<int>((done * 100) / total) : 100;
        if (pct == *last)
            return;
        *last = pct;
        fmt::print(stderr, "\r{:3d}% ({}/{} bytes)", pct, done, total);
        if (pct >= 100)
            fmt::print(stderr, "\n");
    };
    cb.onStatus = [](const std::string& msg) { fmt::print(stderr, "\n{}\n", msg); };
    return cb;
}

int fail(const Error& err) {
    fmt::print(stderr, "error: {} ({})\n", err.message, err.code);
    return 1;
}

fs::path installDirFor(const Options& opts, const config::ClientConfig& cfg) {
    if (!opts.install_dir.empty())
        return config::expand_tilde(opts.install_dir);
    return cfg.installRoot / opts.game_id;
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"gamefetch - resumable game downloader"};
    Options opts;

    app.add_option("-c,--config", opts.config_path,
                   "Client config (default: $XDG_CONFIG_HOME/gamefetch/config.toml)");
    app.add_option("-s,--server", opts.server_url, "Server URL, overrides client.server_url");
    app.add_option("-k,--api-key", opts.api_key, "API key, overrides client.api_key");
    app.add_option("-l,--log-level", opts.log_level, "Log level (trace, debug, info, warn, error)")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}))
        ->default_val("warn");
    app.add_option("--log-file", opts.log_file, "Log file path (optional)");
    app.add_flag("--no-verify", opts.no_verify, "Skip sha256 verification of downloaded files");
    app.require_subcommand(1);

    auto* games = app.add_subcommand("games", "List the games offered by the server");

    auto* catalogCmd = app.add_subcommand("catalog", "Show the file catalog of a game");
    catalogCmd->add_option("game", opts.game_id, "Game id")->required();

    auto* start = app.add_subcommand("start", "Show where a download at a progress would resume");
    start->add_option("game", opts.game_id, "Game id")->required();
    start->add_option("-p,--progress", opts.progress, "Overall progress in percent")
        ->check(CLI::Range(0.0, 100.0));

    auto* download = app.add_subcommand("download", "Download a game file by file, resumably");
    download->add_option("game", opts.game_id, "Game id")->required();
    download->add_option("-d,--dir", opts.install_dir,
                         "Install directory (default: <install_root>/<game>)");

    auto* stream = app.add_subcommand("stream", "Download a game as one continuous stream");
    stream->add_option("game", opts.game_id, "Game id")->required();
    stream->add_option("-d,--dir", opts.install_dir,
                       "Install directory (default: <install_root>/<game>)");
    stream->add_option("-p,--progress", opts.progress, "Resume at this overall percentage")
        ->check(CLI::Range(0.0, 100.0));
    stream->add_option("--chunk-size", opts.chunk_size, "Server read size in bytes")
        ->check(CLI::Range(MIN_STREAM_CHUNK_SIZE, MAX_STREAM_CHUNK_SIZE));

    CLI11_PARSE(app, argc, argv);

    try {
        setupLogging("gamefetch", opts.log_level, opts.log_file);
    } catch (const std::exception& e) {
        std::cerr << "Failed to setup logging: " << e.what() << std::endl;
        return 1;
    }

    auto loaded = config::loadClientConfig(config::get_config_path(opts.config_path));
    if (!loaded)
        return fail(loaded.error());
    auto cfg = std::move(loaded).value();
    if (!opts.server_url.empty())
        cfg.serverUrl = opts.server_url;
    if (!opts.api_key.empty())
        cfg.apiKey = opts.api_key;
    if (opts.no_verify)
        cfg.verifyChecksums = false;

    client::RequestOptions catalogOptions;
    catalogOptions.totalTimeout = cfg.catalogTimeout;
    catalogOptions.connectTimeout = cfg.connectTimeout;

    client::DownloaderOptions downloaderOptions;
    downloaderOptions.transfer.connectTimeout = cfg.connectTimeout;
    downloaderOptions.transfer.stallTimeout = cfg.stallTimeout;
    downloaderOptions.verifyChecksums = cfg.verifyChecksums;

    auto catalogClient = std::make_shared<client::CatalogClient>(
        client::makeCurlHttpTransport(), client::ServerEndpoint{cfg.serverUrl, cfg.apiKey},
        catalogOptions);

    if (app.got_subcommand(games)) {
        auto list = catalogClient->listGames();
        if (!list)
            return fail(list.error());
        fmt::print("{}\n", protocol::dumpJson(protocol::toJson(list.value()), 2));
        return 0;
    }

    if (app.got_subcommand(catalogCmd)) {
        auto cat = catalogClient->fetchCatalog(opts.game_id);
        if (!cat)
            return fail(cat.error());
        fmt::print("{}\n", protocol::dumpJson(protocol::toJson(cat.value()), 2));
        return 0;
    }

    if (app.got_subcommand(start)) {
        auto info = catalogClient->fetchStartInfo(opts.game_id, opts.progress);
        if (!info)
            return fail(info.error());
        fmt::print("{}\n", protocol::dumpJson(protocol::toJson(info.value()), 2));
        return 0;
    }

    if (app.got_subcommand(download)) {
        client::ResumableDownloader downloader(catalogClient, downloaderOptions);
        auto summary =
            downloader.download(opts.game_id, installDirFor(opts, cfg), consoleCallbacks());
        if (!summary)
            return fail(summary.error());
        fmt::print("{}: {} of {} file(s) transferred, {} bytes\n", opts.game_id,
                   summary.value().filesTransferred, summary.value().filesTotal,
                   summary.value().bytesTransferred);
        return 0;
    }

    if (app.got_subcommand(stream)) {
        client::StreamDownloader downloader(catalogClient, downloaderOptions);
        downloader.setChunkSize(opts.chunk_size);
        auto summary = downloader.download(opts.game_id, installDirFor(opts, cfg), opts.progress,
                                           consoleCallbacks());
        if (!summary)
            return fail(summary.error());
        fmt::print("{}: {} segment(s), {} bytes\n", opts.game_id,
                   summary.value().segmentsReceived, summary.value().bytesReceived);
        return 0;
    }

    return 0;
}
