#include "pkgsentry/manifest.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace pkgsentry::manifest::test {

namespace {

using json = nlohmann::ordered_json;

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

void write_file(const std::filesystem::path& path, const std::string& content)
{
    std::ofstream out(path, std::ios::binary);
    out << content;
}

}  // namespace

TEST(Manifest, LaterCategoryWinsOnCollision)
{
    const json document = {
        {   "dependencies", {{"a", "1.0.0"}}},
        {"devDependencies", {{"a", "2.0.0"}}}
    };

    auto contents = parse_manifest(document);
    ASSERT_TRUE(contents.has_value()) << contents.error().message;
    EXPECT_EQ(contents->packages.size(), 1U);
    EXPECT_EQ(contents->packages.find("a"), "2.0.0");
}

TEST(Manifest, MergingIsIdempotent)
{
    const json document = {
        {        "dependencies", {{"a", "^1.0.0"}, {"b", "~2.0.0"}}},
        {"optionalDependencies",                   {{"b", "2.1.0"}}}
    };

    auto first = parse_manifest(document);
    auto second = parse_manifest(document);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(std::ranges::equal(first->packages, second->packages));
}

TEST(Manifest, NormalizesEveryVersion)
{
    const json document = {
        {    "dependencies", {{"react", "^19.1.1"}}},
        {"peerDependencies",  {{"vue", ">= 3.4.0"}}}
    };

    auto contents = parse_manifest(document);
    ASSERT_TRUE(contents.has_value());
    EXPECT_EQ(contents->packages.find("react"), "19.1.1");
    EXPECT_EQ(contents->packages.find("vue"), "3.4.0");
}

TEST(Manifest, CountsPresentCategoriesInMergeOrder)
{
    const json document = {
        {"optionalDependencies",                 {{"c", "1.0.0"}}},
        {        "dependencies", {{"a", "1.0.0"}, {"b", "1.0.0"}}},
        {             "scripts",          {{"test", "jest"}}}
    };

    auto contents = parse_manifest(document);
    ASSERT_TRUE(contents.has_value());
    ASSERT_EQ(contents->categories.size(), 2U);
    EXPECT_EQ(contents->categories[0].category, "dependencies");
    EXPECT_EQ(contents->categories[0].count, 2U);
    EXPECT_EQ(contents->categories[1].category, "optionalDependencies");
    EXPECT_EQ(contents->categories[1].count, 1U);
    EXPECT_EQ(contents->packages.size(), 3U);
}

TEST(Manifest, NoDependencySectionsIsEmpty)
{
    auto contents = parse_manifest(json{{"name", "app"}});
    ASSERT_TRUE(contents.has_value());
    EXPECT_TRUE(contents->packages.empty());
}

TEST(Manifest, WrongTypesAreMalformed)
{
    auto not_object = parse_manifest(json::array());
    ASSERT_FALSE(not_object.has_value());
    EXPECT_EQ(not_object.error().code, error_code::kManifestMalformed);

    auto bad_section = parse_manifest(json{{"dependencies", json::array({"react"})}});
    ASSERT_FALSE(bad_section.has_value());
    EXPECT_EQ(bad_section.error().code, error_code::kManifestMalformed);

    auto bad_version = parse_manifest(json{{"dependencies", {{"react", 19}}}});
    ASSERT_FALSE(bad_version.has_value());
    EXPECT_EQ(bad_version.error().code, error_code::kManifestMalformed);
}

TEST(Manifest, LoadMissingFileIsManifestMissing)
{
    TempDir dir("pkgsentry_manifest_missing");
    auto contents = load_manifest(dir.path() / "package.json");
    ASSERT_FALSE(contents.has_value());
    EXPECT_EQ(contents.error().code, error_code::kManifestMissing);
}

TEST(Manifest, LoadInvalidJsonIsManifestMalformed)
{
    TempDir dir("pkgsentry_manifest_invalid");
    write_file(dir.path() / "package.json", "{\"dependencies\": {");
    auto contents = load_manifest(dir.path() / "package.json");
    ASSERT_FALSE(contents.has_value());
    EXPECT_EQ(contents.error().code, error_code::kManifestMalformed);
}

TEST(Manifest, LoadReadsFile)
{
    TempDir dir("pkgsentry_manifest_load");
    write_file(dir.path() / "package.json", R"({"dependencies": {"left-pad": "1.0.0"}})");
    auto contents = load_manifest(dir.path() / "package.json");
    ASSERT_TRUE(contents.has_value()) << contents.error().message;
    EXPECT_EQ(contents->packages.find("left-pad"), "1.0.0");
}

}  // namespace pkgsentry::manifest::test
