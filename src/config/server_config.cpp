#include <gamefetch/config/server_config.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace gamefetch::config {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

Result<GameDefinition> parseGame(const json& j, const fs::path& baseDir) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidArgument, "Game entry must be an object"};
    }
    GameDefinition game;
    game.id = j.value("id", std::string{});
    if (game.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Game entry without an id"};
    }
    game.name = j.value("name", game.id);
    game.version = j.value("version", std::string{});
    if (auto it = j.find("description"); it != j.end() && it->is_string())
        game.description = it->get<std::string>();

    auto dir = j.value("directory", std::string{});
    if (dir.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Game '{}' has no directory", game.id)};
    }
    game.directory = fs::path(dir);
    if (game.directory.is_relative() && !baseDir.empty())
        game.directory = baseDir / game.directory;
    game.directory = game.directory.lexically_normal();

    if (auto it = j.find("configToClient"); it != j.end() && !it->is_null())
        game.configToClient = *it;

    std::error_code ec;
    if (!fs::exists(game.directory, ec)) {
        spdlog::warn("Game '{}': directory '{}' does not exist", game.id,
                     game.directory.string());
    }
    return game;
}

} // namespace

const GameDefinition* ServerConfig::findGame(std::string_view id) const noexcept {
    for (const auto& g : games) {
        if (g.id == id)
            return &g;
    }
    return nullptr;
}

Result<ServerConfig> parseServerConfig(std::string_view document, const fs::path& baseDir) {
    json root;
    try {
        root = json::parse(document.begin(), document.end());
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidArgument, fmt::format("Invalid config JSON: {}", e.what())};
    }
    if (!root.is_object()) {
        return Error{ErrorCode::InvalidArgument, "Config root must be an object"};
    }

    ServerConfig cfg;
    try {
        if (auto it = root.find("server"); it != root.end()) {
            const auto& s = *it;
            cfg.server.host = s.value("host", cfg.server.host);
            auto port = s.value("port", static_cast<int>(cfg.server.port));
            if (port < 0 || port > 65535) {
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("server.port out of range: {}", port)};
            }
            cfg.server.port = static_cast<std::uint16_t>(port);
            cfg.server.verify = s.value("verify", cfg.server.verify);
            if (auto k = s.find("secret_key"); k != s.end() && k->is_string())
                cfg.server.secretKey = k->get<std::string>();
        }

        std::set<std::string> seen;
        for (const auto& item : root.value("games", json::array())) {
            auto game = parseGame(item, baseDir);
            if (!game)
                return game.error();
            if (!seen.insert(game.value().id).second) {
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("Duplicate game id '{}'", game.value().id)};
            }
            cfg.games.push_back(std::move(game).value());
        }
    } catch (const json::type_error& e) {
        return Error{ErrorCode::InvalidArgument, fmt::format("Invalid config value: {}", e.what())};
    }

    if (cfg.server.verify && cfg.server.secretKey.empty()) {
        spdlog::warn("No secret_key configured; API key verification is disabled");
    }
    return cfg;
}

Result<ServerConfig> loadServerConfig(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound,
                     fmt::format("Config file not found: {}", path.string())};
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    auto cfg = parseServerConfig(ss.str(), fs::absolute(path).parent_path());
    if (!cfg) {
        spdlog::error("Failed to load config '{}': {}", path.string(), cfg.error().message);
        return cfg;
    }
    spdlog::info("Loaded config '{}' with {} game(s)", path.string(), cfg.value().games.size());
    return cfg;
}

fs::path resolveServerConfigPath(const std::string& overridePath) {
    if (!overridePath.empty())
        return fs::path(overridePath);
    if (const char* env = std::getenv("GAMEFETCH_CONFIG"); env && *env)
        return fs::path(env);
    return fs::path("config.json");
}

} // namespace gamefetch::config
