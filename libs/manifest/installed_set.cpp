/**
 * @file installed_set.cpp
 * @brief Merge of declared and lock-resolved packages
 */

#include "pkgsentry/manifest.hpp"

namespace pkgsentry::manifest {

PackageMap build_installed_set(const PackageMap& declared, const PackageMap& locked)
{
    // Declared intent wins; the lock file only contributes names the manifest never mentions.
    PackageMap installed = declared;
    for (const auto& entry : locked) {
        installed.insert_if_absent(entry.name, entry.version);
    }
    return installed;
}

}  // namespace pkgsentry::manifest
