#include <gamefetch/protocol/wire_json.h>

#include <spdlog/spdlog.h>

namespace gamefetch::protocol {

using nlohmann::json;

namespace {

Error corrupted(std::string_view what, const std::exception& e) {
    return Error{ErrorCode::CorruptedData, fmt::format("Malformed {} response: {}", what, e.what())};
}

json parseBody(std::string_view body) {
    return json::parse(body.begin(), body.end());
}

void putConfig(json& j, const std::optional<json>& cfg) {
    if (cfg)
        j["configToClient"] = *cfg;
}

std::optional<json> takeConfig(const json& j) {
    if (auto it = j.find("configToClient"); it != j.end() && !it->is_null())
        return *it;
    return std::nullopt;
}

RemoteFile fileFromJson(const json& j) {
    RemoteFile f;
    f.entry.relativePath = j.at("path").get<std::string>();
    f.entry.sizeBytes = j.at("size").get<std::uint64_t>();
    f.entry.checksum = j.value("checksum", std::string{});
    f.downloadUrl = j.value("download_url", std::string{});
    if (auto it = j.find("progress_segment"); it != j.end() && it->is_object()) {
        ProgressSegment seg;
        seg.startPercent = it->at("start_percent").get<double>();
        seg.endPercent = it->at("end_percent").get<double>();
        seg.fileIndex = it->at("file_index").get<std::size_t>();
        f.segment = seg;
    }
    return f;
}

std::vector<RemoteFile> filesFromJson(const json& arr) {
    std::vector<RemoteFile> files;
    files.reserve(arr.size());
    for (const auto& item : arr)
        files.push_back(fileFromJson(item));
    return files;
}

std::vector<catalog::FileTreeNode> treeFromJson(const json& arr) {
    std::vector<catalog::FileTreeNode> nodes;
    nodes.reserve(arr.size());
    for (const auto& item : arr) {
        catalog::FileTreeNode node;
        node.name = item.at("name").get<std::string>();
        node.path = item.at("path").get<std::string>();
        if (item.at("type").get<std::string>() == "directory") {
            node.kind = catalog::FileTreeNode::Kind::Directory;
            node.children = treeFromJson(item.value("children", json::array()));
        } else {
            node.kind = catalog::FileTreeNode::Kind::File;
            node.size = item.value("size", std::uint64_t{0});
            node.checksum = item.value("checksum", std::string{});
        }
        nodes.push_back(std::move(node));
    }
    return nodes;
}

GameSummary gameFromJson(const json& j) {
    GameSummary g;
    g.id = j.at("id").get<std::string>();
    g.name = j.value("name", std::string{});
    g.version = j.value("version", std::string{});
    if (auto it = j.find("description"); it != j.end() && it->is_string())
        g.description = it->get<std::string>();
    g.configToClient = takeConfig(j);
    return g;
}

} // namespace

std::vector<catalog::CatalogEntry> RemoteCatalog::entries() const {
    std::vector<catalog::CatalogEntry> out;
    out.reserve(files.size());
    for (const auto& f : files)
        out.push_back(f.entry);
    return out;
}

json toJson(const RemoteFile& file) {
    json j = {{"path", file.entry.relativePath},
              {"relative_path", file.entry.relativePath},
              {"size", file.entry.sizeBytes},
              {"checksum", file.entry.checksum},
              {"download_url", file.downloadUrl}};
    if (file.segment) {
        j["progress_segment"] = {{"start_percent", file.segment->startPercent},
                                 {"end_percent", file.segment->endPercent},
                                 {"file_index", file.segment->fileIndex}};
    }
    return j;
}

json toJson(const std::vector<catalog::FileTreeNode>& tree) {
    json arr = json::array();
    for (const auto& node : tree) {
        json j = {{"name", node.name}, {"path", node.path}};
        if (node.kind == catalog::FileTreeNode::Kind::Directory) {
            j["type"] = "directory";
            j["children"] = toJson(node.children);
        } else {
            j["type"] = "file";
            j["size"] = node.size;
            j["checksum"] = node.checksum;
        }
        arr.push_back(std::move(j));
    }
    return arr;
}

json toJson(const GameSummary& game) {
    json j = {{"id", game.id},
              {"name", game.name},
              {"version", game.version},
              {"description", game.description}};
    putConfig(j, game.configToClient);
    return j;
}

json toJson(const std::vector<GameSummary>& games) {
    json arr = json::array();
    for (const auto& g : games)
        arr.push_back(toJson(g));
    return json{{"games", std::move(arr)}};
}

json toJson(const RemoteCatalog& catalog) {
    json files = json::array();
    for (const auto& f : catalog.files)
        files.push_back(toJson(f));
    json j = {{"game_id", catalog.gameId},
              {"game_name", catalog.gameName},
              {"version", catalog.version},
              {"files", std::move(files)},
              {"total_files", catalog.files.size()},
              {"total_size", catalog.totalSize},
              {"file_tree", toJson(catalog.tree)}};
    putConfig(j, catalog.configToClient);
    return j;
}

json toJson(const StartInfo& info) {
    json files = json::array();
    for (const auto& f : info.files)
        files.push_back(toJson(f));
    json j = {{"game_id", info.gameId},
              {"start_file_index", info.startFileIndex},
              {"start_file_path", info.startFilePath},
              {"start_file_offset", info.startFileOffset},
              {"files", std::move(files)},
              {"message", info.message}};
    putConfig(j, info.configToClient);
    return j;
}

json toJson(const ServerStatus& status) {
    return json{{"status", status.status},
                {"name", status.name},
                {"version", status.version},
                {"games_count", status.gamesCount}};
}

Result<std::vector<GameSummary>> parseGameList(std::string_view body) {
    try {
        auto j = parseBody(body);
        std::vector<GameSummary> games;
        for (const auto& item : j.at("games"))
            games.push_back(gameFromJson(item));
        return games;
    } catch (const json::exception& e) {
        return corrupted("game list", e);
    }
}

Result<RemoteCatalog> parseCatalog(std::string_view body) {
    try {
        auto j = parseBody(body);
        RemoteCatalog c;
        c.gameId = j.at("game_id").get<std::string>();
        c.gameName = j.value("game_name", std::string{});
        c.version = j.value("version", std::string{});
        c.files = filesFromJson(j.at("files"));
        c.totalSize = j.value("total_size", std::uint64_t{0});
        c.tree = treeFromJson(j.value("file_tree", json::array()));
        c.configToClient = takeConfig(j);
        if (c.totalSize != catalog::totalSize(c.entries())) {
            return Error{ErrorCode::CorruptedData,
                         "Catalog total_size does not match the sum of file sizes"};
        }
        return c;
    } catch (const json::exception& e) {
        return corrupted("catalog", e);
    }
}

Result<StartInfo> parseStartInfo(std::string_view body) {
    try {
        auto j = parseBody(body);
        StartInfo s;
        s.gameId = j.at("game_id").get<std::string>();
        s.startFileIndex = j.at("start_file_index").get<std::size_t>();
        s.startFilePath = j.value("start_file_path", std::string{});
        s.startFileOffset = j.value("start_file_offset", std::uint64_t{0});
        s.files = filesFromJson(j.at("files"));
        s.message = j.value("message", std::string{});
        s.configToClient = takeConfig(j);
        return s;
    } catch (const json::exception& e) {
        return corrupted("start info", e);
    }
}

Result<ServerStatus> parseServerStatus(std::string_view body) {
    try {
        auto j = parseBody(body);
        ServerStatus s;
        s.status = j.at("status").get<std::string>();
        s.name = j.value("name", std::string{});
        s.version = j.value("version", std::string{});
        s.gamesCount = j.value("games_count", std::size_t{0});
        return s;
    } catch (const json::exception& e) {
        return corrupted("status", e);
    }
}

std::string dumpJson(const json& j, int indent) {
    return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

json errorBody(const Error& error) {
    return json{{"detail", error.message}, {"code", errorName(error.code)}};
}

Error errorFromResponse(int httpStatus, std::string_view body) {
    ErrorCode code = ErrorCode::Unknown;
    std::string detail;
    try {
        auto j = parseBody(body);
        if (j.is_object()) {
            if (auto it = j.find("code"); it != j.end() && it->is_string())
                code = errorCodeFromName(it->get<std::string>());
            if (auto it = j.find("detail"); it != j.end() && it->is_string())
                detail = it->get<std::string>();
        }
    } catch (const json::exception& e) {
        spdlog::debug("Error body is not JSON (HTTP {}): {}", httpStatus, e.what());
    }

    if (code == ErrorCode::Unknown) {
        switch (httpStatus) {
            case 400: code = ErrorCode::InvalidArgument; break;
            case 403: code = ErrorCode::Unauthorized; break;
            case 404: code = ErrorCode::NotFound; break;
            case 416: code = ErrorCode::RangeNotSatisfiable; break;
            default: code = ErrorCode::ServerError; break;
        }
    }
    if (detail.empty())
        detail = fmt::format("HTTP {}: {}", httpStatus, errorToString(code));
    return Error{code, std::move(detail)};
}

int httpStatusFor(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unauthorized:
        case ErrorCode::PathViolation:
            return 403;
        case ErrorCode::NotFound:
        case ErrorCode::EmptyCatalog:
            return 404;
        case ErrorCode::RangeNotSatisfiable:
            return 416;
        case ErrorCode::InvalidArgument:
            return 400;
        default:
            return 500;
    }
}

} // namespace gamefetch::protocol
