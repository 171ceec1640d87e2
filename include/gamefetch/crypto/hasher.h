#pragma once

#include <gamefetch/core/types.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace gamefetch::crypto {

/**
 * Hash algorithms a checksum tag may name. Only SHA-256 is produced by the scanner.
 */
enum class HashAlgo { Sha256 };

/**
 * Checksum descriptor (algorithm + lower-case hex digest), written on the wire as
 * "<algo>:<hex>", e.g. "sha256:9f86d0...".
 */
struct Checksum {
    HashAlgo algo{HashAlgo::Sha256};
    std::string hex;

    [[nodiscard]] std::string toString() const;

    // Returns std::nullopt for unknown tags or non-hex digests.
    static std::optional<Checksum> parse(std::string_view tagged);

    bool operator==(const Checksum&) const = default;
};

// Interface for content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    // Stream-based hashing
    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    // Streams the file through update() in fixed-size chunks.
    virtual Result<std::string> hashFile(const std::filesystem::path& path) = 0;

    using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;
    virtual void setProgressCallback(ProgressCallback callback) = 0;
};

// SHA-256 implementation (OpenSSL EVP)
class SHA256Hasher : public IContentHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher() override;

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    Result<std::string> hashFile(const std::filesystem::path& path) override;

    void setProgressCallback(ProgressCallback callback) override;

    // Static utility for one-shot hashing
    static std::string hash(std::span<const std::byte> data);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Factory function
std::unique_ptr<IContentHasher> createSHA256Hasher();

} // namespace gamefetch::crypto
