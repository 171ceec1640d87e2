#pragma once

#include <gamefetch/catalog/catalog.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace gamefetch::catalog {

// Fraction of a file's share at or beyond which the file counts as finished.
inline constexpr double kSkipAheadFraction = 0.95;

struct ResumePoint {
    std::size_t fileIndex{0};
    std::uint64_t byteOffset{0};

    bool operator==(const ResumePoint&) const = default;
};

/**
 * Map an overall completion percentage onto (file index, byte offset).
 *
 * Every file owns an equal 100/n share of the scale regardless of its size. Within the
 * share, the fractional position scales the file's size; a fraction of 0.95 or more
 * skips to the start of the next file. progress <= 0 gives (0, 0); progress >= 100 or
 * an empty list gives (n, 0), meaning nothing is left to send.
 *
 * Server and client both call this so their resume points agree exactly.
 */
ResumePoint resolveResumePoint(std::span<const std::uint64_t> fileSizes, double progressPercent);

ResumePoint resolveResumePoint(const std::vector<CatalogEntry>& entries, double progressPercent);

// Start of file index's share on the 0..100 scale.
double shareStartPercent(std::size_t fileIndex, std::size_t fileCount) noexcept;

} // namespace gamefetch::catalog
