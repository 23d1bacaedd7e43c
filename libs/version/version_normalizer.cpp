/**
 * @file version_normalizer.cpp
 * @brief Version expression normalization
 */

#include "pkgsentry/version_normalizer.hpp"

#include "pkgsentry/common.hpp"

#include <cctype>
#include <ranges>
#include <utility>

namespace pkgsentry::version {

namespace {

constexpr std::string_view kWhitespace = " \t\r\n\f\v";

[[nodiscard]] bool is_wildcard_segment(std::string_view segment) noexcept
{
    return segment == "x" || segment == "X" || segment == "*";
}

}  // namespace

std::string normalize_version(std::string_view raw)
{
    std::string_view rest = common::trim_left_of(raw, kComparatorChars);
    return std::string(rest.substr(0, rest.find_first_of(kWhitespace)));
}

std::string normalize_advisory_version(std::string_view cell)
{
    return std::string(common::trim_left_of(common::trim(cell), kAdvisoryPrefixChars));
}

std::vector<std::string> split_advisory_versions(std::string_view cell)
{
    std::vector<std::string> versions;
    std::size_t start = 0;
    while (start <= cell.size()) {
        const auto sep = cell.find(kAlternativeSeparator, start);
        const auto end = sep == std::string_view::npos ? cell.size() : sep;
        std::string normalized = normalize_advisory_version(cell.substr(start, end - start));
        if (!normalized.empty()) {
            versions.push_back(std::move(normalized));
        }
        if (sep == std::string_view::npos) {
            break;
        }
        start = sep + kAlternativeSeparator.size();
    }
    return versions;
}

bool is_concrete_version(std::string_view token)
{
    if (token.empty() || std::isdigit(static_cast<unsigned char>(token.front())) == 0) {
        return false;
    }
    // Build metadata and prerelease tags may contain anything; only the core is checked.
    const auto core = token.substr(0, token.find_first_of("-+"));
    for (auto part : core | std::views::split('.')) {
        if (is_wildcard_segment(std::string_view(part.begin(), part.end()))) {
            return false;
        }
    }
    return true;
}

}  // namespace pkgsentry::version
