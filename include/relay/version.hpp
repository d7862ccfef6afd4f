#pragma once

/**
 * @file version.hpp
 * @brief Dotted numeric version comparison
 *
 * Versions published in the remote manifest and written to the local
 * version marker are free-form dotted strings ("1.4", "2.0.1", "v3.1-beta").
 * Only fully-numeric segments take part in a comparison; everything else is
 * dropped, so malformed input degrades to an empty (oldest) version instead
 * of failing.
 *
 * @example
 * ```cpp
 * #include <relay/version.hpp>
 *
 * if (relay::is_newer(manifest.version, installed_version)) {
 *     // download the new build
 * }
 * ```
 */

#include <cstdint>
#include <string>
#include <vector>

namespace relay {

/// Parsed numeric segments of a version, trailing zero segments removed
using VersionSegments = std::vector<std::uint64_t>;

/**
 * @brief Parse a dotted version string into its numeric segments
 *
 * Segments are split on '.', surrounding whitespace is trimmed and a segment
 * is kept only if it consists entirely of ASCII digits and fits in 64 bits.
 * Trailing zero segments are removed so "1.2", "1.2.0" and "1.2.0.0" parse
 * to the same sequence.
 */
VersionSegments parse_version_segments(const std::string& version);

/**
 * @brief Three-way comparison of two version strings
 * @return -1 if a < b, 0 if equal, 1 if a > b
 *
 * Lexicographic over the parsed segments; a strict prefix compares as less.
 */
int compare_versions(const std::string& a, const std::string& b);

/// True if @p a is strictly newer than @p b
bool is_newer(const std::string& a, const std::string& b);

/// True if neither version is newer than the other
bool same_version(const std::string& a, const std::string& b);

} // namespace relay
