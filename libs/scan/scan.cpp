/**
 * @file scan.cpp
 * @brief Scan pipeline orchestration
 */

#include "pkgsentry/scan.hpp"

#include "pkgsentry/advisory.hpp"
#include "pkgsentry/manifest.hpp"
#include "pkgsentry/matcher.hpp"
#include "pkgsentry/version_normalizer.hpp"

#include <format>
#include <string>
#include <utility>

namespace pkgsentry::scan {

namespace {

constexpr std::size_t kMaxListedExamples = 3;

class Notifier
{
public:
    Notifier(const ScanObserver& observer, ScanReport& report)
        : m_observer(observer)
        , m_report(report)
    {}

    void info(ScanStage stage, std::string message) const
    {
        emit(ScanEvent{.stage = stage, .level = EventLevel::kInfo, .message = std::move(message)});
    }

    void warning(ScanStage stage, std::string message) const
    {
        m_report.warnings.push_back(message);
        emit(ScanEvent{.stage = stage, .level = EventLevel::kWarning, .message = std::move(message)});
    }

private:
    void emit(const ScanEvent& event) const
    {
        if (m_observer) {
            m_observer(event);
        }
    }

    const ScanObserver& m_observer;
    ScanReport& m_report;
};

[[nodiscard]] std::string join_shapes(const std::vector<manifest::LockShape>& shapes)
{
    std::string joined;
    for (const auto shape : shapes) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += manifest::to_string(shape);
    }
    return joined.empty() ? std::string("no dependency sections") : joined;
}

void check_concrete_versions(const PackageMap& declared,
                             const config::ScanConfig& config,
                             const Notifier& notify,
                             ScanReport& report)
{
    std::vector<std::string> examples;
    for (const auto& package : declared) {
        if (version::is_concrete_version(package.version)) {
            continue;
        }
        ++report.non_concrete_count;
        if (examples.size() < kMaxListedExamples) {
            examples.push_back(std::format("{}@{}", package.name, package.version));
        }
    }
    if (report.non_concrete_count == 0) {
        return;
    }
    std::string listed;
    for (const auto& example : examples) {
        listed += (listed.empty() ? "" : ", ") + example;
    }
    notify.warning(ScanStage::kManifest,
                   std::format("{} declared version(s) in {} are not exact releases ({}); they "
                               "cannot match any advisory entry",
                               report.non_concrete_count,
                               config.manifest_path.string(),
                               listed));
}

[[nodiscard]] PackageMap resolve_lock(const config::ScanConfig& config,
                                      const Notifier& notify,
                                      ScanReport& report)
{
    const auto lock_name = config.lock_path.string();
    auto lock = manifest::load_lockfile(config.lock_path);
    if (!lock) {
        report.lock_status = LockStatus::kMalformed;
        notify.warning(ScanStage::kLock,
                       std::format("Failed to parse {}: {}; scanning declared packages only",
                                   lock_name,
                                   lock.error().message));
        return {};
    }
    if (!lock->present) {
        report.lock_status = LockStatus::kAbsent;
        notify.warning(ScanStage::kLock,
                       std::format("No {} found, scanning declared packages only", lock_name));
        return {};
    }
    report.lock_status = LockStatus::kParsed;
    report.lock_count = lock->packages.size();
    notify.info(ScanStage::kLock,
                std::format("Found {} packages in {} ({}), including transitive dependencies",
                            report.lock_count,
                            lock_name,
                            join_shapes(lock->shapes)));
    return std::move(lock->packages);
}

[[nodiscard]] Result<std::string> acquire_feed(const config::ScanConfig& config,
                                               feed::IHttpClient& client,
                                               const Notifier& notify,
                                               ScanReport& report)
{
    if (config.offline) {
        report.advisory_source = AdvisorySource::kCache;
        notify.info(ScanStage::kFeed,
                    "Test mode: using local advisory file " + config.cache_path.string());
        return feed::read_cached_feed(config.cache_path);
    }
    report.advisory_source = AdvisorySource::kNetwork;
    notify.info(ScanStage::kFeed, "Downloading latest infected packages list from " + config.feed_url);
    auto text = feed::fetch_feed(
        client,
        feed::FeedOptions{.url = config.feed_url,
                          .cache_path = config.cache_path,
                          .timeout = config.timeout});
    if (text) {
        notify.info(ScanStage::kFeed,
                    std::format("Downloaded {} bytes to {}", text->size(), config.cache_path.string()));
    }
    return text;
}

}  // namespace

std::string_view to_string(ScanStage stage) noexcept
{
    switch (stage) {
        case ScanStage::kManifest:
            return "manifest";
        case ScanStage::kLock:
            return "lock";
        case ScanStage::kFeed:
            return "feed";
        case ScanStage::kAdvisory:
            return "advisory";
        case ScanStage::kMatch:
            return "scan";
    }
    return "scan";
}

std::string_view to_string(LockStatus status) noexcept
{
    switch (status) {
        case LockStatus::kAbsent:
            return "absent";
        case LockStatus::kParsed:
            return "parsed";
        case LockStatus::kMalformed:
            return "malformed";
    }
    return "absent";
}

std::string_view to_string(AdvisorySource source) noexcept
{
    switch (source) {
        case AdvisorySource::kNetwork:
            return "network";
        case AdvisorySource::kCache:
            return "cache";
    }
    return "network";
}

Result<ScanReport> run_scan(const config::ScanConfig& config,
                            feed::IHttpClient& client,
                            const ScanObserver& observer)
{
    ScanReport report;
    const Notifier notify(observer, report);

    // The manifest is required; check it before touching the network.
    auto declared = manifest::load_manifest(config.manifest_path);
    if (!declared) {
        return std::unexpected(declared.error());
    }
    report.manifest_count = declared->packages.size();
    notify.info(ScanStage::kManifest,
                std::format("Found {} packages in {}",
                            report.manifest_count,
                            config.manifest_path.string()));
    check_concrete_versions(declared->packages, config, notify, report);

    const PackageMap locked = resolve_lock(config, notify, report);
    const PackageMap installed = manifest::build_installed_set(declared->packages, locked);
    report.total_count = installed.size();
    notify.info(ScanStage::kLock,
                std::format("Total unique packages to scan: {}", report.total_count));

    auto feed_text = acquire_feed(config, client, notify, report);
    if (!feed_text) {
        return std::unexpected(feed_text.error());
    }
    auto advisories = advisory::parse_advisories(*feed_text);
    if (!advisories) {
        return std::unexpected(advisories.error());
    }
    report.advisory_count = advisories->size();
    notify.info(ScanStage::kAdvisory,
                std::format("Loaded {} infected package entries", report.advisory_count));

    notify.info(ScanStage::kMatch, "Scanning for infected packages...");
    report.infections = matcher::match_installed(installed, *advisories);
    return report;
}

}  // namespace pkgsentry::scan
