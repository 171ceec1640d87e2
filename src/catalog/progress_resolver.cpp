#include <gamefetch/catalog/progress_resolver.h>

#include <cmath>

namespace gamefetch::catalog {

ResumePoint resolveResumePoint(std::span<const std::uint64_t> fileSizes, double progressPercent) {
    const std::size_t fileCount = fileSizes.size();
    if (fileCount == 0)
        return {0, 0};

    // Also catches NaN.
    if (!(progressPercent > 0.0))
        return {0, 0};

    if (progressPercent >= 100.0)
        return {fileCount, 0};

    const double share = 100.0 / static_cast<double>(fileCount);

    auto fileIndex = static_cast<std::size_t>(std::floor(progressPercent / share));
    if (fileIndex >= fileCount)
        fileIndex = fileCount - 1;

    const double fileFraction =
        (progressPercent - static_cast<double>(fileIndex) * share) / share;

    if (fileFraction >= kSkipAheadFraction)
        return {fileIndex + 1, 0};

    const auto fileSize = fileSizes[fileIndex];
    auto offset =
        static_cast<std::uint64_t>(std::floor(static_cast<double>(fileSize) * fileFraction));
    if (offset > fileSize)
        offset = fileSize;
    return {fileIndex, offset};
}

ResumePoint resolveResumePoint(const std::vector<CatalogEntry>& entries, double progressPercent) {
    std::vector<std::uint64_t> sizes;
    sizes.reserve(entries.size());
    for (const auto& e : entries)
        sizes.push_back(e.sizeBytes);
    return resolveResumePoint(std::span<const std::uint64_t>(sizes), progressPercent);
}

double shareStartPercent(std::size_t fileIndex, std::size_t fileCount) noexcept {
    if (fileCount == 0)
        return 0.0;
    return static_cast<double>(fileIndex) * (100.0 / static_cast<double>(fileCount));
}

} // namespace gamefetch::catalog
