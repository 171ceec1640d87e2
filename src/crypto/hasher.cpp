#include <gamefetch/crypto/hasher.h>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <vector>

namespace gamefetch::crypto {

namespace {

constexpr std::string_view kSha256Tag = "sha256";

std::string toHexLower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

} // namespace

std::string Checksum::toString() const {
    std::string out(kSha256Tag);
    out.push_back(':');
    out.append(hex);
    return out;
}

std::optional<Checksum> Checksum::parse(std::string_view tagged) {
    auto colon = tagged.find(':');
    if (colon == std::string_view::npos)
        return std::nullopt;

    std::string tag(tagged.substr(0, colon));
    std::transform(tag.begin(), tag.end(), tag.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (tag != kSha256Tag)
        return std::nullopt;

    auto digest = tagged.substr(colon + 1);
    if (digest.size() != 64)
        return std::nullopt;

    Checksum out;
    out.algo = HashAlgo::Sha256;
    out.hex.reserve(digest.size());
    for (unsigned char c : digest) {
        if (!std::isxdigit(c))
            return std::nullopt;
        out.hex.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

struct SHA256Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;
    ProgressCallback progressCallback;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

SHA256Hasher::SHA256Hasher() : pImpl(std::make_unique<Impl>()) {
    init();
}

SHA256Hasher::~SHA256Hasher() = default;

SHA256Hasher::SHA256Hasher(SHA256Hasher&&) noexcept = default;
SHA256Hasher& SHA256Hasher::operator=(SHA256Hasher&&) noexcept = default;

void SHA256Hasher::init() {
    if (EVP_DigestInit_ex(pImpl->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA256");
    }
}

void SHA256Hasher::update(std::span<const std::byte> data) {
    if (data.empty())
        return;
    if (EVP_DigestUpdate(pImpl->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA256");
    }
}

std::string SHA256Hasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, digest.data(), &digestLen) != 1) {
        throw std::runtime_error("Failed to finalize SHA256");
    }

    auto result = toHexLower(digest.data(), digestLen);

    // Reset for potential reuse
    init();

    return result;
}

Result<std::string> SHA256Hasher::hashFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::IoError, fmt::format("Failed to open file: {}", path.string())};
    }

    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error{ErrorCode::IoError,
                     fmt::format("Failed to stat {}: {}", path.string(), ec.message())};
    }

    try {
        init();

        std::vector<std::byte> buffer(DEFAULT_CHUNK_SIZE);
        std::uint64_t processed = 0;

        while (file) {
            file.read(reinterpret_cast<char*>(buffer.data()),
                      static_cast<std::streamsize>(buffer.size()));
            auto bytesRead = file.gcount();

            if (bytesRead > 0) {
                update(std::span{buffer.data(), static_cast<std::size_t>(bytesRead)});
                processed += static_cast<std::uint64_t>(bytesRead);

                if (pImpl->progressCallback) {
                    pImpl->progressCallback(processed, fileSize);
                }
            }
        }
        if (file.bad()) {
            return Error{ErrorCode::IoError, fmt::format("Read failed: {}", path.string())};
        }

        return finalize();
    } catch (const std::exception& e) {
        spdlog::error("Failed to hash file {}: {}", path.string(), e.what());
        return Error{ErrorCode::IoError, e.what()};
    }
}

void SHA256Hasher::setProgressCallback(ProgressCallback callback) {
    pImpl->progressCallback = std::move(callback);
}

std::string SHA256Hasher::hash(std::span<const std::byte> data) {
    SHA256Hasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

std::unique_ptr<IContentHasher> createSHA256Hasher() {
    return std::make_unique<SHA256Hasher>();
}

} // namespace gamefetch::crypto
