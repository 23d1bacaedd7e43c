#pragma once

/**
 * @file matcher.hpp
 * @brief Exact (name, version) intersection of the installed set with the advisory set
 */

#include "pkgsentry/advisory.hpp"
#include "pkgsentry/package.hpp"

#include <string>
#include <vector>

namespace pkgsentry::matcher {

struct MatchEntry
{
    std::string name;
    std::string version;
    bool infected = false;
};

/**
 * Installed packages present in @p advisories, in installed-set order.
 */
[[nodiscard]] std::vector<PackageRef> match_installed(const PackageMap& installed,
                                                      const advisory::AdvisorySet& advisories);

/**
 * One entry per installed package with its membership flag, in installed-set order.
 */
[[nodiscard]] std::vector<MatchEntry> evaluate_installed(const PackageMap& installed,
                                                         const advisory::AdvisorySet& advisories);

}  // namespace pkgsentry::matcher
