#pragma once

/**
 * @file version.hpp
 * @brief pkgsentry version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace pkgsentry {

/// pkgsentry version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema versions of the JSON documents pkgsentry reads and writes
constexpr const char* kReportSchemaVersion = "scan_report.v1";
constexpr const char* kConfigSchemaVersion = "config.v1";

}  // namespace pkgsentry
