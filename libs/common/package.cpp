/**
 * @file package.cpp
 * @brief PackageMap implementation
 */

#include "pkgsentry/package.hpp"

#include <utility>

namespace pkgsentry {

std::string to_string(const PackageRef& package)
{
    return package.name + "@" + package.version;
}

void PackageMap::assign(std::string name, std::string version)
{
    if (auto it = m_index.find(name); it != m_index.end()) {
        m_entries[it->second].version = std::move(version);
        return;
    }
    m_index.emplace(name, m_entries.size());
    m_entries.push_back(PackageRef{.name = std::move(name), .version = std::move(version)});
}

bool PackageMap::insert_if_absent(std::string name, std::string version)
{
    if (m_index.contains(name)) {
        return false;
    }
    m_index.emplace(name, m_entries.size());
    m_entries.push_back(PackageRef{.name = std::move(name), .version = std::move(version)});
    return true;
}

void PackageMap::merge(const PackageMap& other)
{
    for (const auto& entry : other) {
        assign(entry.name, entry.version);
    }
}

bool PackageMap::contains(std::string_view name) const
{
    return m_index.find(name) != m_index.end();
}

std::optional<std::string_view> PackageMap::find(std::string_view name) const
{
    auto it = m_index.find(name);
    if (it == m_index.end()) {
        return std::nullopt;
    }
    return std::string_view(m_entries[it->second].version);
}

}  // namespace pkgsentry
