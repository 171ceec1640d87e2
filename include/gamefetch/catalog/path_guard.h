#pragma once

#include <gamefetch/core/types.h>

#include <filesystem>
#include <string_view>

namespace gamefetch::catalog {

// True when candidate equals root or lies beneath it. Both paths must already be canonical.
bool isWithinRoot(const std::filesystem::path& canonicalRoot,
                  const std::filesystem::path& canonicalCandidate);

/**
 * Resolve a client-supplied relative path against a game root.
 *
 * Rejects with PathViolation, before touching the filesystem entry itself, any path that is
 * absolute, contains a backslash, or has an empty, "." or ".." segment. The joined path is
 * then canonicalised (following symlinks) and must still be a descendant of the canonical
 * root. The returned path may not exist; existence is the caller's check.
 */
Result<std::filesystem::path> resolveUnderRoot(const std::filesystem::path& root,
                                               std::string_view relativePath);

} // namespace gamefetch::catalog
