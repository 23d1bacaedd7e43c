#pragma once

/**
 * @file package.hpp
 * @brief Package identity and the insertion-ordered package map
 */

#include <compare>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pkgsentry {

/**
 * @brief One (name, version) pair: an installed package, an advisory entry or a match
 *
 * Equality and ordering are structural over both fields.
 */
struct PackageRef
{
    std::string name;
    std::string version;

    [[nodiscard]] auto operator<=>(const PackageRef&) const = default;
};

/**
 * Format as "name@version"
 */
[[nodiscard]] std::string to_string(const PackageRef& package);

/**
 * @brief Mapping package name -> version that iterates in first-insertion order
 *
 * Re-assigning a known name replaces its version without moving it.
 */
class PackageMap
{
public:
    using const_iterator = std::vector<PackageRef>::const_iterator;

    /**
     * Insert or overwrite (later assignment wins, position kept)
     */
    void assign(std::string name, std::string version);

    /**
     * Insert only when @p name is not present
     * @return true if the entry was added
     */
    bool insert_if_absent(std::string name, std::string version);

    /**
     * Assign every entry of @p other in its order
     */
    void merge(const PackageMap& other);

    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] std::optional<std::string_view> find(std::string_view name) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }
    [[nodiscard]] const_iterator begin() const noexcept { return m_entries.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return m_entries.end(); }

private:
    struct NameHash
    {
        using is_transparent = void;

        [[nodiscard]] std::size_t operator()(std::string_view name) const noexcept
        {
            return std::hash<std::string_view>{}(name);
        }
    };

    std::vector<PackageRef> m_entries;
    std::unordered_map<std::string, std::size_t, NameHash, std::equal_to<>> m_index;
};

}  // namespace pkgsentry
