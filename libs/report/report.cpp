/**
 * @file report.cpp
 * @brief Console and JSON rendering of scan results
 */

#include "pkgsentry/report.hpp"

#include "pkgsentry/schema_validate.hpp"
#include "pkgsentry/version.hpp"

#include <array>
#include <chrono>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace pkgsentry::report {

namespace {

constexpr std::string_view kRed = "\033[0;31m";
constexpr std::string_view kGreen = "\033[0;32m";
constexpr std::string_view kYellow = "\033[1;33m";
constexpr std::string_view kReset = "\033[0m";
constexpr std::size_t kRuleWidth = 51;

constexpr std::array<std::string_view, 4> kRemediationSteps = {
    "1. Do NOT run any scripts or code from these packages",
    "2. Remove these packages immediately",
    "3. Review your system for potential compromises",
    "4. Rotate any credentials that may have been exposed",
};

[[nodiscard]] std::string paint(std::string_view text, std::string_view color, const TextStyle& style)
{
    if (!style.color) {
        return std::string(text);
    }
    return std::format("{}{}{}", color, text, kReset);
}

[[nodiscard]] std::string rule()
{
    return std::string(kRuleWidth, '=');
}

void append_heading(std::vector<std::string>& lines, std::string_view title)
{
    lines.push_back(rule());
    lines.push_back(std::format("  {}", title));
    lines.push_back(rule());
}

[[nodiscard]] std::vector<std::string_view> guidance_for(std::string_view code)
{
    if (code == error_code::kAdvisoryCacheMissing) {
        return {"Test mode needs a local advisory file with a header row, e.g.:",
                "  package,version",
                "  react,19.1.1",
                "Add a package from your package.json to the CSV for testing."};
    }
    if (code == error_code::kManifestMissing) {
        return {"Run pkgsentry from the project directory, or pass --manifest FILE."};
    }
    if (code == error_code::kFeedUnavailable) {
        return {"Check network access, or rerun with --test to use the local advisory file."};
    }
    return {};
}

}  // namespace

std::vector<std::string> render_banner()
{
    std::vector<std::string> lines;
    append_heading(lines, std::format("pkgsentry {} - npm supply-chain scanner", kVersion));
    return lines;
}

std::string render_event(const scan::ScanEvent& event, const TextStyle& style)
{
    const auto marker = event.level == scan::EventLevel::kWarning ? paint("!", kYellow, style)
                                                                  : paint("+", kGreen, style);
    return std::format("[{}] {} {}", scan::to_string(event.stage), marker, event.message);
}

std::vector<std::string> render_results(const scan::ScanReport& report, const TextStyle& style)
{
    std::vector<std::string> lines;
    for (const auto& package : report.infections) {
        lines.push_back(std::format("{} {}",
                                    paint("INFECTED PACKAGE FOUND:", kRed, style),
                                    to_string(package)));
    }
    lines.emplace_back();
    append_heading(lines, "Scan Results");
    lines.push_back(std::format("Packages scanned: {} ({} declared, {} from lock file {})",
                                report.total_count,
                                report.manifest_count,
                                report.lock_count,
                                scan::to_string(report.lock_status)));
    lines.push_back(std::format("Advisory entries: {} ({})",
                                report.advisory_count,
                                scan::to_string(report.advisory_source)));

    if (!report.infected()) {
        lines.push_back(paint("No infected packages found!", kGreen, style));
        lines.emplace_back("Your dependencies appear to be safe.");
        return lines;
    }

    lines.push_back(
        paint(std::format("Found {} infected package(s)!", report.infections.size()), kRed, style));
    lines.emplace_back();
    lines.emplace_back("IMMEDIATE ACTIONS REQUIRED:");
    for (const auto step : kRemediationSteps) {
        lines.emplace_back(step);
    }
    lines.emplace_back();
    lines.emplace_back("Infected packages:");
    for (const auto& package : report.infections) {
        lines.push_back(paint(std::format("  * {}", to_string(package)), kRed, style));
    }
    return lines;
}

std::vector<std::string> render_error(const Error& error, const TextStyle& style)
{
    std::vector<std::string> lines;
    lines.push_back(std::format("{} {}", paint("Error:", kRed, style), error.message));
    for (const auto hint : guidance_for(error.code)) {
        lines.emplace_back(hint);
    }
    return lines;
}

nlohmann::json build_json_report(const scan::ScanReport& report, const std::string& generated_at)
{
    nlohmann::json infections = nlohmann::json::array();
    for (const auto& package : report.infections) {
        infections.push_back({
            {   "name",    package.name},
            {"version", package.version}
        });
    }
    nlohmann::json summary = {
        {    "manifest_packages",                 report.manifest_count},
        {          "lock_status", std::string(scan::to_string(report.lock_status))},
        {        "lock_packages",                     report.lock_count},
        {       "total_packages",                    report.total_count},
        {     "advisory_entries",                 report.advisory_count},
        {      "advisory_source", std::string(scan::to_string(report.advisory_source))},
        {"non_concrete_versions",             report.non_concrete_count},
        {       "infected_count",            report.infections.size()},
        {             "infected",                     report.infected()}
    };
    return {
        {"schema_version",                    std::string(kReportSchemaVersion)},
        {          "tool", {{"name", "pkgsentry"}, {"version", std::string(kVersion)}}},
        {  "generated_at",                                         generated_at},
        {       "summary",                                              summary},
        {    "infections",                                           infections},
        {      "warnings",                                      report.warnings}
    };
}

VoidResult validate_json_report(const nlohmann::json& document,
                                const std::filesystem::path& schema_dir)
{
    const auto schema_path = schema_dir / (std::string(kReportSchemaVersion) + ".schema.json");
    return common::validate_json(document, schema_path);
}

VoidResult write_json_report(const nlohmann::json& document,
                             const std::filesystem::path& output_path,
                             const std::filesystem::path& schema_dir)
{
    if (auto validation = validate_json_report(document, schema_dir); !validation) {
        return std::unexpected(validation.error());
    }
    return common::write_text_file(output_path, document.dump(2) + "\n");
}

std::string current_time_utc()
{
    const auto now = std::chrono::system_clock::now();
    return std::format("{:%Y-%m-%dT%H:%M:%SZ}", std::chrono::floor<std::chrono::seconds>(now));
}

}  // namespace pkgsentry::report
