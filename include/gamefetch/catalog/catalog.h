#pragma once

#include <gamefetch/core/types.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gamefetch::catalog {

/**
 * One transferable file under a game's root directory.
 *
 * relativePath uses forward slashes and never escapes the root. checksum is the tagged
 * digest ("sha256:<hex>") computed over the full file at scan time.
 */
struct CatalogEntry {
    std::string relativePath;
    std::uint64_t sizeBytes{0};
    std::string checksum;

    bool operator==(const CatalogEntry&) const = default;
};

/**
 * Display-only directory tree. Directories sort before files, then case-insensitive by
 * name. The flat entry list, not this tree, drives transfers.
 */
struct FileTreeNode {
    enum class Kind { Directory, File };

    Kind kind{Kind::File};
    std::string name;
    std::string path; // directories carry a trailing '/'
    std::uint64_t size{0};
    std::string checksum;
    std::vector<FileTreeNode> children;
};

struct CatalogScan {
    std::vector<CatalogEntry> entries; // depth-first, in tree order
    std::vector<FileTreeNode> tree;
    std::uint64_t totalSize{0};
};

/**
 * Walk root recursively, hashing every regular file.
 *
 * Any unreadable directory, unhashable file, broken symlink or symlink escaping the root
 * fails the whole scan; entries are never silently dropped because the client's offset
 * accounting depends on the complete list.
 */
Result<CatalogScan> scanCatalog(const std::filesystem::path& root);

// Percent-encoded "/download/file/{gameId}/{path}" for an entry.
std::string downloadUrlFor(std::string_view gameId, const CatalogEntry& entry);

// Sum of sizeBytes.
std::uint64_t totalSize(const std::vector<CatalogEntry>& entries) noexcept;

} // namespace gamefetch::catalog
