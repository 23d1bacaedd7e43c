#include "pkgsentry/manifest.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace pkgsentry::manifest::test {

namespace {

using json = nlohmann::ordered_json;

std::vector<std::string> names_of(const PackageMap& map)
{
    std::vector<std::string> names;
    for (const auto& entry : map) {
        names.push_back(entry.name);
    }
    return names;
}

}  // namespace

TEST(CanonicalName, StripsInstallRoot)
{
    EXPECT_EQ(canonical_package_name("node_modules/react"), "react");
    EXPECT_EQ(canonical_package_name("node_modules/@scope/pkg"), "@scope/pkg");
}

TEST(CanonicalName, NestedCopiesUseInnermostPackage)
{
    EXPECT_EQ(canonical_package_name("node_modules/a/node_modules/b"), "b");
    EXPECT_EQ(canonical_package_name("node_modules/@scope/pkg/node_modules/sub"), "sub");
    EXPECT_EQ(canonical_package_name("node_modules/@scope/pkg/node_modules/@other/dep"),
              "@other/dep");
}

TEST(CanonicalName, PathWithoutInstallRootIsKept)
{
    EXPECT_EQ(canonical_package_name("packages/app"), "packages/app");
    // "xnode_modules/" is not a path segment.
    EXPECT_EQ(canonical_package_name("libs/xnode_modules/dep"), "libs/xnode_modules/dep");
}

TEST(PathKeyed, SkipsRootAndKeepsScopedNamesDistinct)
{
    const json packages = {
        {                                         "", {{"name", "app"}, {"version", "1.0.0"}}},
        {                  "node_modules/@scope/pkg",                    {{"version", "2.0.0"}}},
        {"node_modules/@scope/pkg/node_modules/sub",                    {{"version", "3.0.0"}}}
    };

    auto resolved = resolve_path_keyed(packages);
    ASSERT_TRUE(resolved.has_value()) << resolved.error().message;
    EXPECT_EQ(resolved->size(), 2U);
    EXPECT_EQ(resolved->find("@scope/pkg"), "2.0.0");
    EXPECT_EQ(resolved->find("sub"), "3.0.0");
    EXPECT_FALSE(resolved->contains("app"));
}

TEST(PathKeyed, LaterNestedCopyWins)
{
    const json packages = {
        {                  "node_modules/debug", {{"version", "4.3.4"}}},
        {"node_modules/a/node_modules/debug", {{"version", "2.6.9"}}}
    };

    auto resolved = resolve_path_keyed(packages);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->size(), 1U);
    EXPECT_EQ(resolved->find("debug"), "2.6.9");
}

TEST(PathKeyed, EntriesWithoutVersionAreIgnored)
{
    const json packages = {
        {"node_modules/linked", {{"resolved", "../linked"}, {"link", true}}},
        {  "node_modules/react",                       {{"version", "19.1.1"}}}
    };

    auto resolved = resolve_path_keyed(packages);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(names_of(*resolved), (std::vector<std::string>{"react"}));
}

TEST(NestedTree, RecursesToArbitraryDepth)
{
    const auto dependencies = json::parse(R"({
        "a": {
            "version": "1.0.0",
            "dependencies": {
                "b": {
                    "version": "2.0.0",
                    "dependencies": {
                        "c": {
                            "version": "3.0.0",
                            "dependencies": {"d": {"version": "4.0.0"}}
                        }
                    }
                }
            }
        }
    })");

    auto resolved = resolve_nested_tree(dependencies);
    ASSERT_TRUE(resolved.has_value()) << resolved.error().message;
    EXPECT_EQ(resolved->size(), 4U);
    EXPECT_EQ(resolved->find("c"), "3.0.0");
    EXPECT_EQ(resolved->find("d"), "4.0.0");
}

TEST(NestedTree, DeeperOccurrenceWins)
{
    const json dependencies = {
        {"debug", {{"version", "4.3.4"}}},
        {    "a", {{"version", "1.0.0"}, {"dependencies", {{"debug", {{"version", "2.6.9"}}}}}}}
    };

    auto resolved = resolve_nested_tree(dependencies);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->find("debug"), "2.6.9");
}

TEST(NestedTree, NonObjectDependenciesIsMalformed)
{
    auto resolved = resolve_nested_tree(json::array());
    ASSERT_FALSE(resolved.has_value());
    EXPECT_EQ(resolved.error().code, error_code::kLockMalformed);

    const json nested_bad = {
        {"a", {{"version", "1.0.0"}, {"dependencies", "oops"}}}
    };
    auto nested = resolve_nested_tree(nested_bad);
    ASSERT_FALSE(nested.has_value());
    EXPECT_EQ(nested.error().code, error_code::kLockMalformed);
}

TEST(LockFile, DetectsBothShapes)
{
    const json document = {
        {"lockfileVersion",                                                  2},
        {       "packages",   {{"node_modules/react", {{"version", "19.1.1"}}}}},
        {   "dependencies", {{"react", {{"version", "19.1.1"}}}, {"x", {{"version", "1.0.0"}}}}}
    };

    const auto shapes = detect_lock_shapes(document);
    ASSERT_EQ(shapes.size(), 2U);
    EXPECT_EQ(shapes[0], LockShape::kPathKeyed);
    EXPECT_EQ(shapes[1], LockShape::kNestedTree);

    auto resolution = resolve_lockfile(document);
    ASSERT_TRUE(resolution.has_value()) << resolution.error().message;
    EXPECT_TRUE(resolution->present);
    EXPECT_EQ(names_of(resolution->packages), (std::vector<std::string>{"react", "x"}));
}

TEST(LockFile, NoKnownSectionsYieldsEmptyResolution)
{
    auto resolution = resolve_lockfile(json{{"lockfileVersion", 3}});
    ASSERT_TRUE(resolution.has_value());
    EXPECT_TRUE(resolution->present);
    EXPECT_TRUE(resolution->shapes.empty());
    EXPECT_TRUE(resolution->packages.empty());
}

TEST(LockFile, ShapeNames)
{
    EXPECT_EQ(to_string(LockShape::kPathKeyed), "path-keyed");
    EXPECT_EQ(to_string(LockShape::kNestedTree), "nested-tree");
}

TEST(LockFile, MissingFileIsNotAnError)
{
    auto resolution = load_lockfile(std::filesystem::temp_directory_path()
                                    / "pkgsentry_no_such_dir" / "package-lock.json");
    ASSERT_TRUE(resolution.has_value());
    EXPECT_FALSE(resolution->present);
    EXPECT_TRUE(resolution->packages.empty());
}

TEST(LockFile, UnparseableFileIsLockMalformed)
{
    const auto path = std::filesystem::temp_directory_path() / "pkgsentry_bad_lock.json";
    {
        std::ofstream out(path, std::ios::binary);
        out << "{ not json";
    }
    auto resolution = load_lockfile(path);
    ASSERT_FALSE(resolution.has_value());
    EXPECT_EQ(resolution.error().code, error_code::kLockMalformed);

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace pkgsentry::manifest::test
