#pragma once

/**
 * @file report.hpp
 * @brief Presentation of scan results: console text and scan_report.v1 JSON
 */

#include "pkgsentry/common.hpp"
#include "pkgsentry/scan.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pkgsentry::report {

struct TextStyle
{
    bool color = true;  ///< emit ANSI color sequences
};

/**
 * Title banner printed before a text-mode scan.
 */
[[nodiscard]] std::vector<std::string> render_banner();

/**
 * One progress line, e.g. "[lock] Found 12 packages in package-lock.json ...".
 */
[[nodiscard]] std::string render_event(const scan::ScanEvent& event, const TextStyle& style);

/**
 * Result section: each infection, the summary and remediation steps when infected.
 */
[[nodiscard]] std::vector<std::string> render_results(const scan::ScanReport& report,
                                                      const TextStyle& style);

/**
 * "Error: ..." followed by guidance lines for errors the user can act on.
 */
[[nodiscard]] std::vector<std::string> render_error(const Error& error, const TextStyle& style);

/**
 * Build a scan_report.v1 document.
 */
[[nodiscard]] nlohmann::json build_json_report(const scan::ScanReport& report,
                                               const std::string& generated_at);

/**
 * Validate against scan_report.v1.schema.json in @p schema_dir.
 */
[[nodiscard]] VoidResult validate_json_report(const nlohmann::json& document,
                                              const std::filesystem::path& schema_dir);

/**
 * Validate, then write the report (2-space indented) to @p output_path.
 */
[[nodiscard]] VoidResult write_json_report(const nlohmann::json& document,
                                           const std::filesystem::path& output_path,
                                           const std::filesystem::path& schema_dir);

[[nodiscard]] std::string current_time_utc();

}  // namespace pkgsentry::report
