#pragma once

/**
 * @file advisory.hpp
 * @brief Known-compromised package feed (CSV) loading
 */

#include "pkgsentry/common.hpp"
#include "pkgsentry/package.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace pkgsentry::advisory {

/// Exact (name, version) pairs; duplicates collapse.
using AdvisorySet = std::set<PackageRef>;

using CsvRecord = std::vector<std::string>;

/**
 * Split CSV text into records (RFC 4180: quoted fields, "" escapes, LF or CRLF).
 * A blank line is a record with no fields.
 * @return AdvisoryMalformed on an unterminated quoted field
 */
[[nodiscard]] Result<std::vector<CsvRecord>> parse_csv(std::string_view text);

/**
 * Build the advisory set from feed text "package,version[,...]".
 *
 * The header record is skipped, as is every record with fewer than two fields.
 * A version cell may hold several alternatives joined by "||".
 * @return AdvisoryMalformed if the text has no header record or is not valid CSV
 */
[[nodiscard]] Result<AdvisorySet> parse_advisories(std::string_view csv_text);

/**
 * Read and parse a feed file.
 * @return AdvisoryMalformed if the file cannot be read or parsed
 */
[[nodiscard]] Result<AdvisorySet> load_advisories(const std::filesystem::path& path);

}  // namespace pkgsentry::advisory
