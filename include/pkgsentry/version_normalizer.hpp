#pragma once

/**
 * @file version_normalizer.hpp
 * @brief Reduce version expressions to the concrete version token they name
 *
 * No range resolution is performed: "1.x" stays "1.x" and simply never matches an
 * advisory, which lists concrete versions only.
 */

#include <string>
#include <string_view>
#include <vector>

namespace pkgsentry::version {

/// Leading characters removed from declared versions
inline constexpr std::string_view kComparatorChars = "^~>=< \t";

/// Leading characters removed from advisory version cells
inline constexpr std::string_view kAdvisoryPrefixChars = "= ";

/// Separator between alternatives inside one advisory version cell
inline constexpr std::string_view kAlternativeSeparator = "||";

/**
 * Strip the leading comparator run and keep the token up to the next whitespace.
 *
 *   "^1.2.3"          -> "1.2.3"
 *   ">=1.0.0 <2.0.0"  -> "1.0.0"
 *   "   = 2.0.0"      -> "2.0.0"
 */
[[nodiscard]] std::string normalize_version(std::string_view raw);

/**
 * Normalize one advisory version cell: trim whitespace, then strip leading '=' and spaces.
 */
[[nodiscard]] std::string normalize_advisory_version(std::string_view cell);

/**
 * Split an advisory cell on "||" and normalize every alternative.
 * Empty alternatives are dropped; a cell without "||" yields one element.
 */
[[nodiscard]] std::vector<std::string> split_advisory_versions(std::string_view cell);

/**
 * True when the token is an exact release (digit first, no x/X/* wildcard segment).
 * Informational only; matching never depends on it.
 */
[[nodiscard]] bool is_concrete_version(std::string_view token);

}  // namespace pkgsentry::version
