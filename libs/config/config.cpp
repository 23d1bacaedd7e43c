/**
 * @file config.cpp
 * @brief JSON config file loading
 */

#include "pkgsentry/config.hpp"

#include "pkgsentry/schema_validate.hpp"
#include "pkgsentry/version.hpp"

#include <exception>
#include <string>
#include <utility>

namespace pkgsentry::config {

namespace {

[[nodiscard]] Error invalid(std::string message)
{
    return Error::make(error_code::kConfigInvalid, std::move(message));
}

}  // namespace

Result<ScanConfig> apply_config(const nlohmann::json& document, ScanConfig base)
{
    if (!document.is_object()) {
        return std::unexpected(invalid("Config must be a JSON object"));
    }
    try {
        if (document.contains("feed_url")) {
            base.feed_url = document.at("feed_url").get<std::string>();
        }
        if (document.contains("cache_path")) {
            base.cache_path = document.at("cache_path").get<std::string>();
        }
        if (document.contains("manifest_path")) {
            base.manifest_path = document.at("manifest_path").get<std::string>();
        }
        if (document.contains("lock_path")) {
            base.lock_path = document.at("lock_path").get<std::string>();
        }
        if (document.contains("timeout_seconds")) {
            const auto seconds = document.at("timeout_seconds").get<long long>();
            if (seconds <= 0) {
                return std::unexpected(invalid("timeout_seconds must be positive"));
            }
            base.timeout = std::chrono::seconds(seconds);
        }
        if (document.contains("offline")) {
            base.offline = document.at("offline").get<bool>();
        }
    } catch (const std::exception& ex) {
        return std::unexpected(invalid(std::string("Invalid config value: ") + ex.what()));
    }
    return base;
}

Result<ScanConfig> load_config_file(const std::filesystem::path& path,
                                    const std::filesystem::path& schema_dir,
                                    ScanConfig base)
{
    auto text = common::read_text_file(path);
    if (!text) {
        return std::unexpected(
            Error::make(error_code::kConfigOpenFailed, text.error().message));
    }
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(*text);
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(error_code::kConfigParseFailed,
                                           "Failed to parse config file " + path.string() + ": "
                                               + ex.what()));
    }
    const auto schema_path = schema_dir / (std::string(kConfigSchemaVersion) + ".schema.json");
    if (auto validation = common::validate_json(document, schema_path); !validation) {
        if (validation.error().code != error_code::kSchemaInvalid) {
            return std::unexpected(validation.error());
        }
        return std::unexpected(invalid("Config schema validation failed: "
                                       + validation.error().message));
    }
    return apply_config(document, std::move(base));
}

}  // namespace pkgsentry::config
