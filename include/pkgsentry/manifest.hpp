#pragma once

/**
 * @file manifest.hpp
 * @brief Declared manifest (package.json), lock file (package-lock.json) and their merge
 */

#include "pkgsentry/common.hpp"
#include "pkgsentry/package.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace pkgsentry::manifest {

// Documents are parsed as ordered_json so packages keep their file order.

// ============================================================================
// Declared manifest
// ============================================================================

/// Dependency categories in merge order; later categories win on name collision.
inline constexpr std::array<std::string_view, 4> kDependencyCategories = {
    "dependencies",
    "devDependencies",
    "peerDependencies",
    "optionalDependencies",
};

struct CategoryCount
{
    std::string_view category;
    std::size_t count = 0;
};

struct ManifestContents
{
    PackageMap packages;                  ///< name -> normalized version
    std::vector<CategoryCount> categories;  ///< present categories, in merge order
};

/**
 * Merge all dependency categories of a parsed package.json.
 * @return ManifestMalformed if the document, a category or a version has the wrong type
 */
[[nodiscard]] Result<ManifestContents> parse_manifest(const nlohmann::ordered_json& document);

/**
 * Read and parse a package.json file.
 * @return ManifestMissing if the file does not exist, ManifestMalformed otherwise on failure
 */
[[nodiscard]] Result<ManifestContents> load_manifest(const std::filesystem::path& path);

// ============================================================================
// Lock file
// ============================================================================

/**
 * Lock file layouts. A document may carry both.
 */
enum class LockShape : std::uint8_t {
    kPathKeyed,   ///< "packages": install path -> metadata (lockfileVersion 2/3)
    kNestedTree,  ///< "dependencies": name -> {version, dependencies} (lockfileVersion 1)
};

[[nodiscard]] std::string_view to_string(LockShape shape) noexcept;

struct LockResolution
{
    bool present = false;          ///< false when no lock file exists
    std::vector<LockShape> shapes;  ///< shapes found, in the order they were applied
    PackageMap packages;
};

/**
 * Shapes present at the top level of @p document, path-keyed first.
 */
[[nodiscard]] std::vector<LockShape> detect_lock_shapes(const nlohmann::ordered_json& document);

/**
 * Package name for an install path such as "node_modules/@scope/pkg".
 *
 * The path is cut at its last "node_modules/" segment; a scoped remainder keeps
 * "@scope/name", an unscoped one keeps its first segment. Paths without an install
 * root (workspace links) are returned unchanged.
 */
[[nodiscard]] std::string canonical_package_name(std::string_view install_path);

/**
 * Extract the path-keyed "packages" section. Root entry "" is skipped.
 */
[[nodiscard]] Result<PackageMap> resolve_path_keyed(const nlohmann::ordered_json& packages);

/**
 * Flatten a nested "dependencies" tree of arbitrary depth.
 * Deeper occurrences overwrite shallower ones.
 */
[[nodiscard]] Result<PackageMap> resolve_nested_tree(const nlohmann::ordered_json& dependencies);

/**
 * Apply every detected shape to a parsed lock document.
 * @return LockMalformed if the document or a section has the wrong structure
 */
[[nodiscard]] Result<LockResolution> resolve_lockfile(const nlohmann::ordered_json& document);

/**
 * Read and resolve a lock file. A missing file is not an error.
 */
[[nodiscard]] Result<LockResolution> load_lockfile(const std::filesystem::path& path);

// ============================================================================
// Installed set
// ============================================================================

/**
 * Manifest entries first, then lock entries whose names the manifest does not declare.
 */
[[nodiscard]] PackageMap build_installed_set(const PackageMap& declared, const PackageMap& locked);

}  // namespace pkgsentry::manifest
