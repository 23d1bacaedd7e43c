/**
 * @file main.cpp
 * @brief pkgsentry CLI entry point
 *
 * Scans package.json / package-lock.json in the current directory against a list of
 * known-compromised npm releases.
 *
 * Exit status:
 *   0 - no infected package found
 *   1 - at least one infected package found
 *   2 - fatal error (missing manifest, feed unavailable or malformed, bad arguments)
 */

#include "pkgsentry/common.hpp"
#include "pkgsentry/config.hpp"
#include "pkgsentry/feed.hpp"
#include "pkgsentry/report.hpp"
#include "pkgsentry/require_cpp23.hpp"
#include "pkgsentry/scan.hpp"
#include "pkgsentry/version.hpp"

#include <charconv>
#include <chrono>
#include <cstdio>
#include <exception>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#if !defined(PKGSENTRY_DEFAULT_SCHEMA_DIR)
    #define PKGSENTRY_DEFAULT_SCHEMA_DIR "schemas"
#endif

namespace {

constexpr int kExitClean = 0;
constexpr int kExitInfected = 1;
constexpr int kExitFatal = 2;

enum class OutputFormat { kText, kJson };

struct ScanOptions
{
    bool offline;
    std::optional<std::string> feed_url;
    std::optional<std::string> cache_path;
    std::optional<std::string> manifest_path;
    std::optional<std::string> lock_path;
    std::optional<long long> timeout_seconds;
    std::optional<std::string> config_path;
    std::optional<std::string> output;
    std::string schema_dir;
    OutputFormat format;
    bool color;
    bool show_help;
    bool show_version;
};

void print_version()
{
    std::println("pkgsentry {} ({})", pkgsentry::kVersion, pkgsentry::kBuildId);
    std::println("  report schema: {}", pkgsentry::kReportSchemaVersion);
    std::println("  config schema: {}", pkgsentry::kConfigSchemaVersion);
}

void print_help()
{
    std::print(R"(pkgsentry - scan npm dependencies for known-compromised releases

Usage: pkgsentry [options]

Reads package.json (required) and package-lock.json (optional) from the current
directory and matches every resolved (package, version) against the advisory feed.

Options:
  --test, --offline      Use the local advisory file instead of downloading it
  --url URL              Advisory feed URL (CSV: package,version[,...])
  --cache FILE           Local advisory file (default: shai-hulud-2-packages.csv)
  --manifest FILE        Declared manifest (default: package.json)
  --lock FILE            Lock file (default: package-lock.json)
  --timeout SECONDS      Download timeout (default: 30)
  --config FILE          JSON configuration file (config.v1)
  --format text|json     Output format (default: text)
  --out FILE, -o FILE    Write the JSON report to FILE
  --schema-dir DIR       Path to schema directory
  --no-color             Disable ANSI colors
  --help, -h             Show this help message
  --version, -v          Show version information

Exit status: 0 clean, 1 infected package found, 2 fatal error.
)");
}

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> pkgsentry::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            pkgsentry::Error::make("MissingArgument",
                                   std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] pkgsentry::Result<long long> parse_timeout_value(std::string_view value)
{
    long long parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed <= 0) {
        return std::unexpected(
            pkgsentry::Error::make("InvalidArgument",
                                   std::string("Invalid --timeout value: ") + std::string(value)));
    }
    return parsed;
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto set_value_option(std::string_view arg,
                                    std::span<char*> args,
                                    std::size_t idx,
                                    ScanOptions& options) -> pkgsentry::Result<bool>
{
    std::optional<std::string>* target = nullptr;
    if (arg == "--url") {
        target = &options.feed_url;
    } else if (arg == "--cache") {
        target = &options.cache_path;
    } else if (arg == "--manifest") {
        target = &options.manifest_path;
    } else if (arg == "--lock") {
        target = &options.lock_path;
    } else if (arg == "--config") {
        target = &options.config_path;
    } else if (arg == "--out" || arg == "-o") {
        target = &options.output;
    } else if (arg != "--timeout" && arg != "--format" && arg != "--schema-dir") {
        return pkgsentry::Result<bool>{false};
    }

    auto value = read_option_value(args, idx, arg);
    if (!value) {
        return std::unexpected(value.error());
    }
    if (target != nullptr) {
        *target = std::move(*value);
        return pkgsentry::Result<bool>{true};
    }
    if (arg == "--timeout") {
        auto parsed = parse_timeout_value(*value);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.timeout_seconds = *parsed;
    } else if (arg == "--format") {
        if (*value == "text") {
            options.format = OutputFormat::kText;
        } else if (*value == "json") {
            options.format = OutputFormat::kJson;
        } else {
            return std::unexpected(
                pkgsentry::Error::make("InvalidArgument", "Invalid --format value: " + *value));
        }
    } else {
        options.schema_dir = std::move(*value);
    }
    return pkgsentry::Result<bool>{true};
}

[[nodiscard]] pkgsentry::Result<ScanOptions> parse_scan_args(std::span<char*> args)
{
    ScanOptions options{.offline = false,
                        .feed_url = std::nullopt,
                        .cache_path = std::nullopt,
                        .manifest_path = std::nullopt,
                        .lock_path = std::nullopt,
                        .timeout_seconds = std::nullopt,
                        .config_path = std::nullopt,
                        .output = std::nullopt,
                        .schema_dir = PKGSENTRY_DEFAULT_SCHEMA_DIR,
                        .format = OutputFormat::kText,
                        .color = isatty(STDOUT_FILENO) != 0,
                        .show_help = false,
                        .show_version = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--version" || arg == "-v") {
            options.show_version = true;
            continue;
        }
        if (arg == "--test" || arg == "--offline") {
            options.offline = true;
            continue;
        }
        if (arg == "--no-color") {
            options.color = false;
            continue;
        }
        auto handled = set_value_option(arg, args, idx, options);
        if (!handled) {
            return std::unexpected(handled.error());
        }
        if (!*handled) {
            return std::unexpected(
                pkgsentry::Error::make("InvalidArgument", "Unknown option: " + std::string(arg)));
        }
        skip_next = true;
    }
    return options;
}

[[nodiscard]] pkgsentry::Result<pkgsentry::config::ScanConfig>
resolve_config(const ScanOptions& options)
{
    pkgsentry::config::ScanConfig config;
    if (options.config_path) {
        auto loaded = pkgsentry::config::load_config_file(*options.config_path, options.schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    if (options.feed_url) {
        config.feed_url = *options.feed_url;
    }
    if (options.cache_path) {
        config.cache_path = *options.cache_path;
    }
    if (options.manifest_path) {
        config.manifest_path = *options.manifest_path;
    }
    if (options.lock_path) {
        config.lock_path = *options.lock_path;
    }
    if (options.timeout_seconds) {
        config.timeout = std::chrono::seconds(*options.timeout_seconds);
    }
    if (options.offline) {
        config.offline = true;
    }
    return config;
}

void print_lines(FILE* stream, const std::vector<std::string>& lines)
{
    for (const auto& line : lines) {
        std::println(stream, "{}", line);
    }
}

[[nodiscard]] int emit_json_report(const ScanOptions& options,
                                   const pkgsentry::scan::ScanReport& report)
{
    const auto document =
        pkgsentry::report::build_json_report(report, pkgsentry::report::current_time_utc());
    if (options.output) {
        if (auto write =
                pkgsentry::report::write_json_report(document, *options.output, options.schema_dir);
            !write) {
            std::println(stderr, "Error: failed to write scan report: {}", write.error().message);
            return kExitFatal;
        }
        std::println(stderr, "[report] Wrote {}", *options.output);
    } else {
        if (auto validation =
                pkgsentry::report::validate_json_report(document, options.schema_dir);
            !validation) {
            std::println(stderr, "Error: scan report is invalid: {}", validation.error().message);
            return kExitFatal;
        }
        std::println("{}", document.dump(2));
    }
    return report.infected() ? kExitInfected : kExitClean;
}

[[nodiscard]] int run_scan_command(const ScanOptions& options)
{
    const pkgsentry::report::TextStyle style{.color = options.color};
    auto config = resolve_config(options);
    if (!config) {
        print_lines(stderr, pkgsentry::report::render_error(config.error(), style));
        return kExitFatal;
    }

    const bool text_mode = options.format == OutputFormat::kText;
    bool banner_printed = false;
    const pkgsentry::scan::ScanObserver observer =
        [&](const pkgsentry::scan::ScanEvent& event) {
            if (!text_mode) {
                if (event.level == pkgsentry::scan::EventLevel::kWarning) {
                    std::println(stderr, "Warning: {}", event.message);
                }
                return;
            }
            if (!banner_printed) {
                print_lines(stdout, pkgsentry::report::render_banner());
                banner_printed = true;
            }
            std::println("{}", pkgsentry::report::render_event(event, style));
        };

    // Ctrl-C only needs catching while a download can be in flight.
    std::optional<pkgsentry::feed::InterruptGuard> interrupt_guard;
    if (!config->offline) {
        interrupt_guard.emplace();
    }
    pkgsentry::feed::CurlHttpClient client(interrupt_guard ? interrupt_guard->cancel_flag()
                                                           : nullptr);
    auto report = pkgsentry::scan::run_scan(*config, client, observer);
    interrupt_guard.reset();
    if (!report) {
        print_lines(stderr, pkgsentry::report::render_error(report.error(), style));
        return kExitFatal;
    }

    if (!text_mode) {
        return emit_json_report(options, *report);
    }
    print_lines(stdout, pkgsentry::report::render_results(*report, style));
    if (options.output) {
        const auto document =
            pkgsentry::report::build_json_report(*report, pkgsentry::report::current_time_utc());
        if (auto write =
                pkgsentry::report::write_json_report(document, *options.output, options.schema_dir);
            !write) {
            std::println(stderr, "Error: failed to write scan report: {}", write.error().message);
            return kExitFatal;
        }
    }
    return report->infected() ? kExitInfected : kExitClean;
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        auto args = std::span<char*>(argv, static_cast<std::size_t>(argc)).subspan(1);
        auto options = parse_scan_args(args);
        if (!options) {
            std::println(stderr, "Error: {}", options.error().message);
            print_help();
            return kExitFatal;
        }
        if (options->show_help) {
            print_help();
            return kExitClean;
        }
        if (options->show_version) {
            print_version();
            return kExitClean;
        }
        return run_scan_command(*options);
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return kExitFatal;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return kExitFatal;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
