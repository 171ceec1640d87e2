#include <gamefetch/catalog/path_guard.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace fs = std::filesystem;

namespace gamefetch::catalog {

bool isWithinRoot(const fs::path& canonicalRoot, const fs::path& canonicalCandidate) {
    auto rootIt = canonicalRoot.begin();
    auto candIt = canonicalCandidate.begin();
    for (; rootIt != canonicalRoot.end(); ++rootIt, ++candIt) {
        // A trailing separator shows up as an empty final element.
        if (rootIt->empty() && std::next(rootIt) == canonicalRoot.end())
            break;
        if (candIt == canonicalCandidate.end() || *rootIt != *candIt)
            return false;
    }
    return true;
}

Result<fs::path> resolveUnderRoot(const fs::path& root, std::string_view relativePath) {
    if (relativePath.empty()) {
        return Error{ErrorCode::PathViolation, "Empty file path"};
    }
    if (relativePath.front() == '/' || relativePath.find('\\') != std::string_view::npos) {
        return Error{ErrorCode::PathViolation, "Path must be relative and use '/' separators"};
    }

    std::size_t start = 0;
    while (start <= relativePath.size()) {
        auto end = relativePath.find('/', start);
        if (end == std::string_view::npos)
            end = relativePath.size();
        auto segment = relativePath.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            return Error{ErrorCode::PathViolation, "Path contains a forbidden segment"};
        }
        start = end + 1;
    }

    std::error_code ec;
    auto canonicalRoot = fs::canonical(root, ec);
    if (ec) {
        return Error{ErrorCode::NotFound,
                     fmt::format("Game directory unavailable: {}", ec.message())};
    }

    auto resolved = fs::weakly_canonical(canonicalRoot / fs::path(std::string(relativePath)), ec);
    if (ec) {
        return Error{ErrorCode::IoError, fmt::format("Cannot resolve path: {}", ec.message())};
    }

    if (!isWithinRoot(canonicalRoot, resolved) || resolved == canonicalRoot) {
        spdlog::warn("Rejected path escaping game root: '{}'", relativePath);
        return Error{ErrorCode::PathViolation};
    }
    return resolved;
}

} // namespace gamefetch::catalog
