#include "pkgsentry/package.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace pkgsentry::test {

namespace {

std::vector<std::string> names_of(const PackageMap& map)
{
    std::vector<std::string> names;
    for (const auto& entry : map) {
        names.push_back(entry.name);
    }
    return names;
}

}  // namespace

TEST(PackageRef, FormatsAsNameAtVersion)
{
    EXPECT_EQ(to_string(PackageRef{.name = "@scope/pkg", .version = "1.0.0"}), "@scope/pkg@1.0.0");
}

TEST(PackageRef, EqualityIsStructural)
{
    const PackageRef a{.name = "left-pad", .version = "1.3.0"};
    EXPECT_EQ(a, (PackageRef{.name = "left-pad", .version = "1.3.0"}));
    EXPECT_NE(a, (PackageRef{.name = "left-pad", .version = "1.3.1"}));
    EXPECT_NE(a, (PackageRef{.name = "right-pad", .version = "1.3.0"}));
}

TEST(PackageMap, AssignKeepsFirstInsertionPosition)
{
    PackageMap map;
    map.assign("a", "1.0.0");
    map.assign("b", "1.0.0");
    map.assign("a", "2.0.0");

    EXPECT_EQ(map.size(), 2U);
    EXPECT_EQ(names_of(map), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(map.find("a"), "2.0.0");
}

TEST(PackageMap, InsertIfAbsentNeverOverwrites)
{
    PackageMap map;
    EXPECT_TRUE(map.insert_if_absent("a", "1.0.0"));
    EXPECT_FALSE(map.insert_if_absent("a", "2.0.0"));
    EXPECT_EQ(map.find("a"), "1.0.0");
}

TEST(PackageMap, MergeAppendsNewNamesAndOverwritesKnownOnes)
{
    PackageMap base;
    base.assign("a", "1.0.0");
    base.assign("b", "1.0.0");
    PackageMap other;
    other.assign("c", "3.0.0");
    other.assign("a", "9.9.9");

    base.merge(other);

    EXPECT_EQ(names_of(base), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(base.find("a"), "9.9.9");
    EXPECT_EQ(base.find("c"), "3.0.0");
}

TEST(PackageMap, FindMissingNameIsEmpty)
{
    PackageMap map;
    EXPECT_TRUE(map.empty());
    EXPECT_FALSE(map.contains("react"));
    EXPECT_FALSE(map.find("react").has_value());
}

}  // namespace pkgsentry::test
