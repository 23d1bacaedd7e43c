/**
 * @file manifest.cpp
 * @brief package.json dependency extraction
 */

#include "pkgsentry/manifest.hpp"

#include "pkgsentry/version_normalizer.hpp"

#include <exception>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace pkgsentry::manifest {

namespace {

[[nodiscard]] Error malformed(std::string message)
{
    return Error::make(error_code::kManifestMalformed, std::move(message));
}

}  // namespace

Result<ManifestContents> parse_manifest(const nlohmann::ordered_json& document)
{
    if (!document.is_object()) {
        return std::unexpected(malformed("package.json must contain a JSON object"));
    }
    ManifestContents contents;
    for (const auto category : kDependencyCategories) {
        const auto it = document.find(std::string(category));
        if (it == document.end()) {
            continue;
        }
        if (!it->is_object()) {
            return std::unexpected(
                malformed(std::string(category) + " must map package names to versions"));
        }
        for (const auto& [name, raw_version] : it->items()) {
            if (!raw_version.is_string()) {
                return std::unexpected(malformed("Version of " + name + " in "
                                                 + std::string(category) + " is not a string"));
            }
            contents.packages.assign(
                name,
                version::normalize_version(raw_version.get_ref<const std::string&>()));
        }
        contents.categories.push_back(CategoryCount{.category = category, .count = it->size()});
    }
    return contents;
}

Result<ManifestContents> load_manifest(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::unexpected(Error::make(error_code::kManifestMissing,
                                           path.string() + " not found in current directory"));
    }
    auto text = common::read_text_file(path);
    if (!text) {
        return std::unexpected(malformed(text.error().message));
    }
    nlohmann::ordered_json document;
    try {
        document = nlohmann::ordered_json::parse(*text);
    } catch (const std::exception& ex) {
        return std::unexpected(
            malformed("Failed to parse " + path.string() + ": " + ex.what()));
    }
    return parse_manifest(document);
}

}  // namespace pkgsentry::manifest
