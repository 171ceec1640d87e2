/*
 * gamefetch/src/catalog/catalog_scanner.cpp
 *
 * Directory walk producing the flat transfer list and the display tree in one pass.
 * - Directories first, then files; case-insensitive name order within each group
 * - Every regular file is hashed by streaming chunks through SHA256Hasher
 * - Symlinks are followed only while their target stays under the root
 * - Any error fails the whole scan (no partial catalogs)
 */

#include <gamefetch/catalog/catalog.h>
#include <gamefetch/catalog/path_guard.h>
#include <gamefetch/crypto/hasher.h>
#include <gamefetch/protocol/url_codec.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <numeric>
#include <set>

namespace fs = std::filesystem;

namespace gamefetch::catalog {

namespace {

std::string lowerCopy(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

struct DirItem {
    std::string name;
    fs::path path;
    bool isDirectory{false};
};

class Scanner {
public:
    explicit Scanner(fs::path canonicalRoot) : root_(std::move(canonicalRoot)) {}

    Result<std::vector<FileTreeNode>> walk(const fs::path& dir, const std::string& relPrefix) {
        auto canonicalDir = fs::canonical(dir, ec_);
        if (ec_) {
            return scanError(dir, "cannot resolve directory");
        }
        if (!active_.insert(canonicalDir).second) {
            return Error{ErrorCode::ScanFailed,
                         fmt::format("Symlink cycle at '{}'", relPrefix.empty() ? "." : relPrefix)};
        }

        auto items = list(dir);
        if (!items) {
            active_.erase(canonicalDir);
            return items.error();
        }

        std::vector<FileTreeNode> nodes;
        nodes.reserve(items.value().size());
        for (const auto& item : items.value()) {
            const std::string rel = relPrefix.empty() ? item.name : relPrefix + "/" + item.name;
            if (item.isDirectory) {
                auto children = walk(item.path, rel);
                if (!children) {
                    active_.erase(canonicalDir);
                    return children.error();
                }
                FileTreeNode node;
                node.kind = FileTreeNode::Kind::Directory;
                node.name = item.name;
                node.path = rel + "/";
                node.children = std::move(children).value();
                nodes.push_back(std::move(node));
                continue;
            }

            auto entry = describeFile(item.path, rel);
            if (!entry) {
                active_.erase(canonicalDir);
                return entry.error();
            }
            FileTreeNode node;
            node.kind = FileTreeNode::Kind::File;
            node.name = item.name;
            node.path = rel;
            node.size = entry.value().sizeBytes;
            node.checksum = entry.value().checksum;
            nodes.push_back(std::move(node));
            entries_.push_back(std::move(entry).value());
        }

        active_.erase(canonicalDir);
        return nodes;
    }

    std::vector<CatalogEntry> takeEntries() { return std::move(entries_); }

private:
    Result<std::vector<DirItem>> list(const fs::path& dir) {
        std::vector<DirItem> items;
        fs::directory_iterator it(dir, ec_);
        if (ec_) {
            return scanError(dir, "cannot list directory");
        }
        for (; it != fs::directory_iterator(); it.increment(ec_)) {
            if (ec_) {
                return scanError(dir, "directory iteration failed");
            }
            const auto& path = it->path();
            const auto name = path.filename().string();
            if (name.find_first_of("\r\n") != std::string::npos) {
                // Line breaks would corrupt the stream framing headers.
                return Error{ErrorCode::ScanFailed,
                             fmt::format("File name with line break under '{}'", dir.string())};
            }
            if (!protocol::isValidUtf8(name)) {
                // Catalog paths travel as JSON strings.
                return Error{ErrorCode::ScanFailed,
                             fmt::format("File name that is not valid UTF-8 under '{}'",
                                         dir.string())};
            }
            auto linkStatus = it->symlink_status(ec_);
            if (ec_) {
                return scanError(path, "cannot stat entry");
            }

            if (fs::is_symlink(linkStatus)) {
                auto target = fs::canonical(path, ec_);
                if (ec_) {
                    return scanError(path, "broken symlink");
                }
                if (!isWithinRoot(root_, target)) {
                    return Error{ErrorCode::PathViolation,
                                 fmt::format("Symlink '{}' points outside the game root",
                                             path.filename().string())};
                }
            }

            auto status = it->status(ec_);
            if (ec_) {
                return scanError(path, "cannot stat entry");
            }
            if (fs::is_directory(status)) {
                items.push_back({path.filename().string(), path, true});
            } else if (fs::is_regular_file(status)) {
                items.push_back({path.filename().string(), path, false});
            } else {
                spdlog::warn("Catalog scan: skipping non-regular entry '{}'", path.string());
            }
        }

        std::sort(items.begin(), items.end(), [](const DirItem& a, const DirItem& b) {
            if (a.isDirectory != b.isDirectory)
                return a.isDirectory;
            auto la = lowerCopy(a.name);
            auto lb = lowerCopy(b.name);
            if (la != lb)
                return la < lb;
            return a.name < b.name;
        });
        return items;
    }

    Result<CatalogEntry> describeFile(const fs::path& path, const std::string& rel) {
        const auto size = fs::file_size(path, ec_);
        if (ec_) {
            return scanError(path, "cannot read file size");
        }
        auto digest = hasher_->hashFile(path);
        if (!digest) {
            return Error{ErrorCode::ScanFailed,
                         fmt::format("Cannot hash '{}': {}", rel, digest.error().message)};
        }

        CatalogEntry entry;
        entry.relativePath = rel;
        entry.sizeBytes = size;
        entry.checksum = crypto::Checksum{crypto::HashAlgo::Sha256, digest.value()}.toString();
        return entry;
    }

    Error scanError(const fs::path& where, std::string_view what) {
        auto err = Error{ErrorCode::ScanFailed,
                         fmt::format("{} '{}': {}", what, where.string(), ec_.message())};
        spdlog::error("Catalog scan failed: {}", err.message);
        return err;
    }

    fs::path root_;
    std::error_code ec_;
    std::set<fs::path> active_;
    std::vector<CatalogEntry> entries_;
    std::unique_ptr<crypto::IContentHasher> hasher_ = crypto::createSHA256Hasher();
};

} // namespace

Result<CatalogScan> scanCatalog(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Error{ErrorCode::ScanFailed,
                     fmt::format("Game directory '{}' is missing or not a directory",
                                 root.string())};
    }
    auto canonicalRoot = fs::canonical(root, ec);
    if (ec) {
        return Error{ErrorCode::ScanFailed,
                     fmt::format("Cannot resolve '{}': {}", root.string(), ec.message())};
    }

    Scanner scanner(canonicalRoot);
    auto tree = scanner.walk(canonicalRoot, "");
    if (!tree) {
        return tree.error();
    }

    CatalogScan scan;
    scan.tree = std::move(tree).value();
    scan.entries = scanner.takeEntries();
    scan.totalSize = totalSize(scan.entries);
    spdlog::debug("Scanned '{}': {} files, {} bytes", root.string(), scan.entries.size(),
                  scan.totalSize);
    return scan;
}

std::string downloadUrlFor(std::string_view gameId, const CatalogEntry& entry) {
    return fmt::format("/download/file/{}/{}", protocol::percentEncode(gameId, true),
                       protocol::percentEncode(entry.relativePath));
}

std::uint64_t totalSize(const std::vector<CatalogEntry>& entries) noexcept {
    return std::accumulate(entries.begin(), entries.end(), std::uint64_t{0},
                           [](std::uint64_t acc, const CatalogEntry& e) { return acc + e.sizeBytes; });
}

} // namespace gamefetch::catalog
