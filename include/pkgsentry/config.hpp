#pragma once

/**
 * @file config.hpp
 * @brief Scan configuration: defaults, JSON config file overlay
 */

#include "pkgsentry/common.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace pkgsentry::config {

inline constexpr std::string_view kDefaultFeedUrl =
    "https://raw.githubusercontent.com/wiz-sec-public/wiz-research-iocs/main/reports/"
    "shai-hulud-2-packages.csv";
inline constexpr std::string_view kDefaultCachePath = "shai-hulud-2-packages.csv";
inline constexpr std::string_view kDefaultManifestPath = "package.json";
inline constexpr std::string_view kDefaultLockPath = "package-lock.json";
inline constexpr std::chrono::seconds kDefaultTimeout{30};

struct ScanConfig
{
    std::string feed_url{kDefaultFeedUrl};
    std::filesystem::path cache_path{kDefaultCachePath};
    std::filesystem::path manifest_path{kDefaultManifestPath};
    std::filesystem::path lock_path{kDefaultLockPath};
    std::chrono::seconds timeout{kDefaultTimeout};
    bool offline = false;  ///< read cache_path instead of downloading
};

/**
 * Overlay the keys present in a config.v1 document on @p base.
 * The document is expected to be schema-valid already.
 */
[[nodiscard]] Result<ScanConfig> apply_config(const nlohmann::json& document, ScanConfig base);

/**
 * Read a JSON config file, validate it against config.v1.schema.json in @p schema_dir and
 * overlay it on @p base.
 */
[[nodiscard]] Result<ScanConfig> load_config_file(const std::filesystem::path& path,
                                                  const std::filesystem::path& schema_dir,
                                                  ScanConfig base = {});

}  // namespace pkgsentry::config
