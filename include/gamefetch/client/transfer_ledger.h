#pragma once

#include <gamefetch/catalog/catalog.h>
#include <gamefetch/core/types.h>

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace gamefetch::client {

struct LedgerEntry {
    std::uint64_t size{0};
    std::uint64_t downloaded{0};

    bool complete() const noexcept { return downloaded >= size; }
    bool operator==(const LedgerEntry&) const = default;
};

/**
 * Per-install record of how many bytes of each file are on disk.
 *
 * Persisted as <installDir>/.download_progress.json:
 *   { "<relativePath>": { "size": N, "downloaded": M }, ... }
 *
 * The downloader keeps local file length == downloaded before every append: bytes are written
 * first and recorded second, and reconcile() repairs any divergence a crash left behind.
 */
class TransferLedger {
public:
    static constexpr const char* kFileName = ".download_progress.json";

    static std::filesystem::path pathFor(const std::filesystem::path& installDir);

    // Missing or unparsable ledgers load as empty; corruption is logged, never fatal.
    static TransferLedger load(const std::filesystem::path& installDir);

    // Write to "<ledger>.tmp", flush, then rename over the ledger.
    Result<void> save(const std::filesystem::path& installDir) const;

    // Deleting a ledger that does not exist succeeds.
    static Result<void> remove(const std::filesystem::path& installDir);

    // Sum of downloaded over every tracked path.
    std::uint64_t totalDownloaded() const noexcept;

    // Adds untracked entries with downloaded = 0 and refreshes the size of tracked ones.
    void track(const catalog::CatalogEntry& entry);

    /**
     * For each untracked entry whose local file already has exactly the declared size, record
     * it as complete so content from an earlier run is not fetched again. With verifyChecksums
     * a file is only seeded when its sha256 matches the entry; a mismatch is left untracked and
     * downloaded again from the start.
     */
    void seedFromDisk(const std::filesystem::path& installDir,
                      const std::vector<catalog::CatalogEntry>& entries,
                      bool verifyChecksums = false);

    /**
     * Make local file lengths agree with the ledger for the given entries: a shorter local
     * file lowers downloaded, a longer one is truncated to downloaded, and a record beyond
     * the declared size restarts the file.
     */
    Result<void> reconcile(const std::filesystem::path& installDir,
                           const std::vector<catalog::CatalogEntry>& entries);

    const LedgerEntry* find(const std::string& relativePath) const;
    void addDownloaded(const std::string& relativePath, std::uint64_t bytes);
    void reset(const std::string& relativePath);

    const std::map<std::string, LedgerEntry>& entries() const noexcept { return entries_; }
    bool empty() const noexcept { return entries_.empty(); }

private:
    std::map<std::string, LedgerEntry> entries_;
};

} // namespace gamefetch::client
