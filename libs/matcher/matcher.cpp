/**
 * @file matcher.cpp
 * @brief Installed set vs. advisory set matching
 */

#include "pkgsentry/matcher.hpp"

#include <algorithm>
#include <iterator>

namespace pkgsentry::matcher {

std::vector<MatchEntry> evaluate_installed(const PackageMap& installed,
                                           const advisory::AdvisorySet& advisories)
{
    std::vector<MatchEntry> entries;
    entries.reserve(installed.size());
    for (const auto& package : installed) {
        entries.push_back(MatchEntry{.name = package.name,
                                     .version = package.version,
                                     .infected = advisories.contains(package)});
    }
    return entries;
}

std::vector<PackageRef> match_installed(const PackageMap& installed,
                                        const advisory::AdvisorySet& advisories)
{
    std::vector<PackageRef> matches;
    std::ranges::copy_if(installed, std::back_inserter(matches), [&advisories](const auto& package) {
        return advisories.contains(package);
    });
    return matches;
}

}  // namespace pkgsentry::matcher
