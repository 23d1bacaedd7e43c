#pragma once

/**
 * @file scan.hpp
 * @brief Scan pipeline: manifest + lock -> installed set, feed -> advisories, then match
 */

#include "pkgsentry/common.hpp"
#include "pkgsentry/config.hpp"
#include "pkgsentry/feed.hpp"
#include "pkgsentry/package.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace pkgsentry::scan {

enum class ScanStage : std::uint8_t { kManifest, kLock, kFeed, kAdvisory, kMatch };

enum class EventLevel : std::uint8_t { kInfo, kWarning };

enum class LockStatus : std::uint8_t {
    kAbsent,    ///< no lock file; only declared packages were scanned
    kParsed,    ///< lock file contributed to the installed set
    kMalformed  ///< lock file present but unusable; only declared packages were scanned
};

enum class AdvisorySource : std::uint8_t { kNetwork, kCache };

[[nodiscard]] std::string_view to_string(ScanStage stage) noexcept;
[[nodiscard]] std::string_view to_string(LockStatus status) noexcept;
[[nodiscard]] std::string_view to_string(AdvisorySource source) noexcept;

struct ScanEvent
{
    ScanStage stage;
    EventLevel level;
    std::string message;
};

/// Progress sink; the pipeline itself never writes to the console.
using ScanObserver = std::function<void(const ScanEvent&)>;

struct ScanReport
{
    std::size_t manifest_count = 0;
    LockStatus lock_status = LockStatus::kAbsent;
    std::size_t lock_count = 0;
    std::size_t total_count = 0;
    std::size_t advisory_count = 0;
    std::size_t non_concrete_count = 0;
    AdvisorySource advisory_source = AdvisorySource::kNetwork;
    std::vector<PackageRef> infections;  ///< installed-set order
    std::vector<std::string> warnings;

    [[nodiscard]] bool infected() const noexcept { return !infections.empty(); }
};

/**
 * Run one scan.
 *
 * Fatal conditions (missing or malformed manifest, unavailable or malformed feed) are
 * returned as errors. A malformed lock file is reported as a warning and the scan
 * continues with the declared packages only.
 *
 * @param client Used only when config.offline is false
 */
[[nodiscard]] Result<ScanReport> run_scan(const config::ScanConfig& config,
                                          feed::IHttpClient& client,
                                          const ScanObserver& observer = {});

}  // namespace pkgsentry::scan
