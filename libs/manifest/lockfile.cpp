/**
 * @file lockfile.cpp
 * @brief package-lock.json resolution for path-keyed and nested-tree layouts
 */

#include "pkgsentry/manifest.hpp"

#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace pkgsentry::manifest {

namespace {

constexpr std::string_view kInstallRoot = "node_modules/";
constexpr std::string_view kPackagesKey = "packages";
constexpr std::string_view kDependenciesKey = "dependencies";
constexpr std::string_view kVersionKey = "version";

[[nodiscard]] Error malformed(std::string message)
{
    return Error::make(error_code::kLockMalformed, std::move(message));
}

/**
 * Offset just past the last "node_modules/" that starts a path segment, or npos.
 */
[[nodiscard]] std::size_t last_install_root_end(std::string_view path)
{
    auto pos = path.rfind(kInstallRoot);
    while (pos != std::string_view::npos) {
        if (pos == 0 || path[pos - 1] == '/') {
            return pos + kInstallRoot.size();
        }
        pos = path.rfind(kInstallRoot, pos - 1);
    }
    return std::string_view::npos;
}

[[nodiscard]] std::optional<std::string> string_field(const nlohmann::ordered_json& object,
                                                      std::string_view key)
{
    const auto it = object.find(std::string(key));
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

[[nodiscard]] std::string_view section_key(LockShape shape) noexcept
{
    switch (shape) {
        case LockShape::kPathKeyed:
            return kPackagesKey;
        case LockShape::kNestedTree:
            return kDependenciesKey;
    }
    return {};
}

}  // namespace

std::string_view to_string(LockShape shape) noexcept
{
    switch (shape) {
        case LockShape::kPathKeyed:
            return "path-keyed";
        case LockShape::kNestedTree:
            return "nested-tree";
    }
    return "unknown";
}

std::vector<LockShape> detect_lock_shapes(const nlohmann::ordered_json& document)
{
    std::vector<LockShape> shapes;
    if (!document.is_object()) {
        return shapes;
    }
    if (document.contains(std::string(kPackagesKey))) {
        shapes.push_back(LockShape::kPathKeyed);
    }
    if (document.contains(std::string(kDependenciesKey))) {
        shapes.push_back(LockShape::kNestedTree);
    }
    return shapes;
}

std::string canonical_package_name(std::string_view install_path)
{
    const auto root_end = last_install_root_end(install_path);
    if (root_end == std::string_view::npos) {
        return std::string(install_path);
    }
    std::string_view name = install_path.substr(root_end);
    auto cut = name.find('/');
    if (name.starts_with('@') && cut != std::string_view::npos) {
        cut = name.find('/', cut + 1);
    }
    return std::string(name.substr(0, cut));
}

Result<PackageMap> resolve_path_keyed(const nlohmann::ordered_json& packages)
{
    if (!packages.is_object()) {
        return std::unexpected(malformed("\"packages\" must be an object"));
    }
    PackageMap resolved;
    for (const auto& [install_path, info] : packages.items()) {
        if (install_path.empty() || !info.is_object()) {
            continue;
        }
        if (auto version = string_field(info, kVersionKey)) {
            resolved.assign(canonical_package_name(install_path), std::move(*version));
        }
    }
    return resolved;
}

Result<PackageMap> resolve_nested_tree(const nlohmann::ordered_json& dependencies)
{
    if (!dependencies.is_object()) {
        return std::unexpected(malformed("\"dependencies\" must be an object"));
    }
    PackageMap flat;
    for (const auto& [name, info] : dependencies.items()) {
        if (!info.is_object()) {
            continue;
        }
        if (auto version = string_field(info, kVersionKey)) {
            flat.assign(name, std::move(*version));
        }
        const auto nested = info.find(std::string(kDependenciesKey));
        if (nested == info.end()) {
            continue;
        }
        auto children = resolve_nested_tree(*nested);
        if (!children) {
            return std::unexpected(children.error());
        }
        flat.merge(*children);
    }
    return flat;
}

Result<LockResolution> resolve_lockfile(const nlohmann::ordered_json& document)
{
    if (!document.is_object()) {
        return std::unexpected(malformed("package-lock.json must contain a JSON object"));
    }
    LockResolution resolution;
    resolution.present = true;
    resolution.shapes = detect_lock_shapes(document);
    for (const auto shape : resolution.shapes) {
        const auto& section = document.at(std::string(section_key(shape)));
        Result<PackageMap> extracted = shape == LockShape::kPathKeyed
                                           ? resolve_path_keyed(section)
                                           : resolve_nested_tree(section);
        if (!extracted) {
            return std::unexpected(extracted.error());
        }
        resolution.packages.merge(*extracted);
    }
    return resolution;
}

Result<LockResolution> load_lockfile(const std::filesystem::path& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return LockResolution{};
    }
    auto text = common::read_text_file(path);
    if (!text) {
        return std::unexpected(malformed(text.error().message));
    }
    nlohmann::ordered_json document;
    try {
        document = nlohmann::ordered_json::parse(*text);
    } catch (const std::exception& ex) {
        return std::unexpected(malformed("Failed to parse " + path.string() + ": " + ex.what()));
    }
    return resolve_lockfile(document);
}

}  // namespace pkgsentry::manifest
