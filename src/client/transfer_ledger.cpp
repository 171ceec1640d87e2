#include <gamefetch/client/transfer_ledger.h>
#include <gamefetch/crypto/hasher.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <memory>
#include <numeric>

namespace gamefetch::client {

namespace fs = std::filesystem;
using nlohmann::json;

fs::path TransferLedger::pathFor(const fs::path& installDir) {
    return installDir / kFileName;
}

TransferLedger TransferLedger::load(const fs::path& installDir) {
    TransferLedger ledger;
    const auto path = pathFor(installDir);

    std::error_code ec;
    if (!fs::exists(path, ec))
        return ledger;

    std::ifstream in(path);
    if (!in) {
        spdlog::warn("Cannot open ledger '{}', starting over", path.string());
        return ledger;
    }
    try {
        json j;
        in >> j;
        if (!j.is_object()) {
            spdlog::warn("Ledger '{}' is not an object, starting over", path.string());
            return ledger;
        }
        for (auto it = j.begin(); it != j.end(); ++it) {
            LedgerEntry e;
            e.size = it.value().at("size").get<std::uint64_t>();
            e.downloaded = it.value().at("downloaded").get<std::uint64_t>();
            ledger.entries_.emplace(it.key(), e);
        }
    } catch (const json::exception& e) {
        spdlog::warn("Corrupt ledger '{}' ({}), starting over", path.string(), e.what());
        ledger.entries_.clear();
    }
    return ledger;
}

Result<void> TransferLedger::save(const fs::path& installDir) const {
    json j = json::object();
    for (const auto& [path, e] : entries_)
        j[path] = {{"size", e.size}, {"downloaded", e.downloaded}};

    // Keys must survive the round trip unchanged, so invalid UTF-8 is an error, not replaced.
    std::string document;
    try {
        document = j.dump(2);
    } catch (const json::exception& e) {
        return Error{ErrorCode::CorruptedData,
                     fmt::format("Cannot serialise ledger: {}", e.what())};
    }

    const auto target = pathFor(installDir);
    auto tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::IoError,
                         fmt::format("Cannot write ledger '{}'", tmp.string())};
        }
        out << document;
        out.flush();
        if (!out) {
            return Error{ErrorCode::IoError,
                         fmt::format("Failed writing ledger '{}'", tmp.string())};
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Error{ErrorCode::IoError,
                     fmt::format("Cannot replace ledger '{}': {}", target.string(), ec.message())};
    }
    return {};
}

Result<void> TransferLedger::remove(const fs::path& installDir) {
    std::error_code ec;
    fs::remove(pathFor(installDir), ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     fmt::format("Cannot remove ledger: {}", ec.message())};
    }
    return {};
}

std::uint64_t TransferLedger::totalDownloaded() const noexcept {
    return std::accumulate(entries_.begin(), entries_.end(), std::uint64_t{0},
                           [](std::uint64_t acc, const auto& kv) { return acc + kv.second.downloaded; });
}

void TransferLedger::track(const catalog::CatalogEntry& entry) {
    auto [it, inserted] = entries_.try_emplace(entry.relativePath, LedgerEntry{entry.sizeBytes, 0});
    if (!inserted && it->second.size != entry.sizeBytes) {
        spdlog::info("'{}' changed size on the server ({} -> {})", entry.relativePath,
                     it->second.size, entry.sizeBytes);
        it->second.size = entry.sizeBytes;
    }
}

void TransferLedger::seedFromDisk(const fs::path& installDir,
                                  const std::vector<catalog::CatalogEntry>& entries,
                                  bool verifyChecksums) {
    std::unique_ptr<crypto::IContentHasher> hasher;
    for (const auto& entry : entries) {
        if (entries_.count(entry.relativePath))
            continue;
        std::error_code ec;
        const auto local = installDir / fs::path(entry.relativePath);
        if (!fs::is_regular_file(local, ec))
            continue;
        const auto size = fs::file_size(local, ec);
        if (ec || size != entry.sizeBytes)
            continue;

        if (verifyChecksums) {
            if (auto expected = crypto::Checksum::parse(entry.checksum)) {
                if (!hasher)
                    hasher = crypto::createSHA256Hasher();
                auto actual = hasher->hashFile(local);
                if (!actual) {
                    spdlog::warn("Cannot hash '{}': {}", local.string(), actual.error().message);
                    continue;
                }
                if (actual.value() != expected->hex) {
                    spdlog::warn("'{}' on disk does not match {}, downloading it again",
                                 entry.relativePath, expected->toString());
                    continue;
                }
            }
        }
        entries_[entry.relativePath] = LedgerEntry{entry.sizeBytes, entry.sizeBytes};
        spdlog::debug("Seeded '{}' as complete from disk", entry.relativePath);
    }
}

Result<void> TransferLedger::reconcile(const fs::path& installDir,
                                       const std::vector<catalog::CatalogEntry>& entries) {
    for (const auto& entry : entries) {
        auto it = entries_.find(entry.relativePath);
        if (it == entries_.end())
            continue;
        auto& rec = it->second;
        const auto local = installDir / fs::path(entry.relativePath);

        std::error_code ec;
        std::uint64_t localSize = 0;
        if (fs::exists(local, ec)) {
            localSize = fs::file_size(local, ec);
            if (ec) {
                return Error{ErrorCode::IoError,
                             fmt::format("Cannot stat '{}': {}", local.string(), ec.message())};
            }
        }

        if (rec.downloaded > rec.size) {
            spdlog::warn("'{}' recorded beyond its size, restarting it", entry.relativePath);
            rec.downloaded = 0;
        }
        if (localSize < rec.downloaded) {
            spdlog::warn("'{}' is shorter on disk than recorded ({} < {}), resuming from disk",
                         entry.relativePath, localSize, rec.downloaded);
            rec.downloaded = localSize;
        } else if (localSize > rec.downloaded) {
            spdlog::warn("'{}' has {} unrecorded bytes, truncating", entry.relativePath,
                         localSize - rec.downloaded);
            fs::resize_file(local, rec.downloaded, ec);
            if (ec) {
                return Error{ErrorCode::IoError, fmt::format("Cannot truncate '{}': {}",
                                                             local.string(), ec.message())};
            }
        }
    }
    return {};
}

const LedgerEntry* TransferLedger::find(const std::string& relativePath) const {
    auto it = entries_.find(relativePath);
    return it == entries_.end() ? nullptr : &it->second;
}

void TransferLedger::addDownloaded(const std::string& relativePath, std::uint64_t bytes) {
    entries_[relativePath].downloaded += bytes;
}

void TransferLedger::reset(const std::string& relativePath) {
    if (auto it = entries_.find(relativePath); it != entries_.end())
        it->second.downloaded = 0;
}

} // namespace gamefetch::client
