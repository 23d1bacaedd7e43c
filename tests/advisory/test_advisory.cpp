#include "pkgsentry/advisory.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

namespace pkgsentry::advisory::test {

namespace {

bool has_entry(const AdvisorySet& set, const std::string& name, const std::string& version)
{
    return set.contains(PackageRef{.name = name, .version = version});
}

}  // namespace

TEST(Csv, SplitsRecordsAndFields)
{
    auto records = parse_csv("package,version\nreact,19.1.1\r\nvue,3.4.0");
    ASSERT_TRUE(records.has_value()) << records.error().message;
    ASSERT_EQ(records->size(), 3U);
    EXPECT_EQ((*records)[1], (CsvRecord{"react", "19.1.1"}));
    EXPECT_EQ((*records)[2], (CsvRecord{"vue", "3.4.0"}));
}

TEST(Csv, QuotedFieldsKeepCommasAndEscapedQuotes)
{
    auto records = parse_csv("package,version,note\n\"@scope/pkg\",\"1.0.0\",\"says \"\"hi\"\", then, leaves\"\n");
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 2U);
    EXPECT_EQ((*records)[1],
              (CsvRecord{"@scope/pkg", "1.0.0", "says \"hi\", then, leaves"}));
}

TEST(Csv, BlankLineIsEmptyRecord)
{
    auto records = parse_csv("package,version\n\nreact,19.1.1\n");
    ASSERT_TRUE(records.has_value());
    ASSERT_EQ(records->size(), 3U);
    EXPECT_TRUE((*records)[1].empty());
}

TEST(Csv, UnterminatedQuoteIsMalformed)
{
    auto records = parse_csv("package,version\n\"react,19.1.1\n");
    ASSERT_FALSE(records.has_value());
    EXPECT_EQ(records.error().code, error_code::kAdvisoryMalformed);
}

TEST(Advisories, SkipsHeaderAndShortRows)
{
    auto set = parse_advisories("package,version\nlonely\n\nleft-pad,1.3.0\n");
    ASSERT_TRUE(set.has_value()) << set.error().message;
    EXPECT_EQ(set->size(), 1U);
    EXPECT_TRUE(has_entry(*set, "left-pad", "1.3.0"));
    EXPECT_FALSE(has_entry(*set, "package", "version"));
}

TEST(Advisories, ExtraColumnsAreIgnored)
{
    auto set = parse_advisories("package,version,reason\nevil-pkg,1.0.0,malware\n");
    ASSERT_TRUE(set.has_value());
    EXPECT_EQ(set->size(), 1U);
    EXPECT_TRUE(has_entry(*set, "evil-pkg", "1.0.0"));
}

TEST(Advisories, NormalizesVersionCells)
{
    auto set = parse_advisories("package,version\n a , = 1.0.0 \nb,==2.0.0\n");
    ASSERT_TRUE(set.has_value());
    EXPECT_TRUE(has_entry(*set, "a", "1.0.0"));
    EXPECT_TRUE(has_entry(*set, "b", "2.0.0"));
}

TEST(Advisories, ExpandsAlternativeVersions)
{
    auto set = parse_advisories("Package,Version\n@ctrl/tinycolor,= 4.1.1 || = 4.1.2\n");
    ASSERT_TRUE(set.has_value());
    EXPECT_EQ(set->size(), 2U);
    EXPECT_TRUE(has_entry(*set, "@ctrl/tinycolor", "4.1.1"));
    EXPECT_TRUE(has_entry(*set, "@ctrl/tinycolor", "4.1.2"));
}

TEST(Advisories, SingleVersionCellIsInsertedAsNormalized)
{
    auto set = parse_advisories("package,version\nevil,1.0.0|2.0.0\nplain, = 3.1.4 \n");
    ASSERT_TRUE(set.has_value()) << set.error().message;
    EXPECT_EQ(*set, (AdvisorySet{PackageRef{.name = "evil", .version = "1.0.0|2.0.0"},
                                 PackageRef{.name = "plain", .version = "3.1.4"}}));
}

TEST(Advisories, DuplicatesCollapse)
{
    auto set = parse_advisories("package,version\nreact,19.1.1\nreact,= 19.1.1\n");
    ASSERT_TRUE(set.has_value());
    EXPECT_EQ(set->size(), 1U);
}

TEST(Advisories, EmptyNameOrVersionIsSkipped)
{
    auto set = parse_advisories("package,version\n,1.0.0\nreact,\n");
    ASSERT_TRUE(set.has_value());
    EXPECT_TRUE(set->empty());
}

TEST(Advisories, HeaderOnlyIsEmptySet)
{
    auto set = parse_advisories("package,version\n");
    ASSERT_TRUE(set.has_value());
    EXPECT_TRUE(set->empty());
}

TEST(Advisories, EmptyTextIsMalformed)
{
    auto set = parse_advisories("");
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(set.error().code, error_code::kAdvisoryMalformed);
}

TEST(Advisories, LoadUnreadableFileIsMalformed)
{
    auto set = load_advisories(std::filesystem::temp_directory_path() / "pkgsentry_no_such_dir"
                               / "feed.csv");
    ASSERT_FALSE(set.has_value());
    EXPECT_EQ(set.error().code, error_code::kAdvisoryMalformed);
}

TEST(Advisories, LoadReadsFile)
{
    const auto path = std::filesystem::temp_directory_path() / "pkgsentry_feed_test.csv";
    {
        std::ofstream out(path, std::ios::binary);
        out << "package,version\r\nreact,19.1.1\r\n";
    }
    auto set = load_advisories(path);
    ASSERT_TRUE(set.has_value()) << set.error().message;
    EXPECT_TRUE(has_entry(*set, "react", "19.1.1"));

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

}  // namespace pkgsentry::advisory::test
