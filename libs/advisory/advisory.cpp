/**
 * @file advisory.cpp
 * @brief Advisory feed CSV parsing
 */

#include "pkgsentry/advisory.hpp"

#include "pkgsentry/version_normalizer.hpp"

#include <ranges>
#include <utility>

namespace pkgsentry::advisory {

namespace {

constexpr std::size_t kMinimumColumns = 2;

class CsvReader
{
public:
    explicit CsvReader(std::string_view text)
        : m_text(text)
    {}

    [[nodiscard]] Result<std::vector<CsvRecord>> read()
    {
        for (std::size_t i = 0; i < m_text.size(); ++i) {
            const char c = m_text[i];
            if (m_in_quotes) {
                if (c != '"') {
                    m_field.push_back(c);
                } else if (i + 1 < m_text.size() && m_text[i + 1] == '"') {
                    m_field.push_back('"');
                    ++i;
                } else {
                    m_in_quotes = false;
                }
                continue;
            }
            switch (c) {
                case '"':
                    m_in_quotes = true;
                    m_has_content = true;
                    break;
                case ',':
                    m_record.push_back(std::exchange(m_field, {}));
                    m_has_content = true;
                    break;
                case '\r':
                    break;
                case '\n':
                    finish_record();
                    break;
                default:
                    m_field.push_back(c);
                    m_has_content = true;
                    break;
            }
        }
        if (m_in_quotes) {
            return std::unexpected(Error::make(error_code::kAdvisoryMalformed,
                                               "Unterminated quoted field in advisory feed"));
        }
        if (m_has_content) {
            finish_record();
        }
        return std::move(m_records);
    }

private:
    void finish_record()
    {
        if (m_has_content) {
            m_record.push_back(std::exchange(m_field, {}));
        }
        m_records.push_back(std::exchange(m_record, {}));
        m_has_content = false;
    }

    std::string_view m_text;
    std::vector<CsvRecord> m_records;
    CsvRecord m_record;
    std::string m_field;
    bool m_in_quotes = false;
    bool m_has_content = false;
};

}  // namespace

Result<std::vector<CsvRecord>> parse_csv(std::string_view text)
{
    return CsvReader(text).read();
}

Result<AdvisorySet> parse_advisories(std::string_view csv_text)
{
    auto records = parse_csv(csv_text);
    if (!records) {
        return std::unexpected(records.error());
    }
    if (records->empty()) {
        return std::unexpected(
            Error::make(error_code::kAdvisoryMalformed, "Advisory feed has no header row"));
    }
    AdvisorySet advisories;
    for (const auto& record : *records | std::views::drop(1)) {
        if (record.size() < kMinimumColumns) {
            continue;
        }
        const std::string name(common::trim(record[0]));
        if (name.empty()) {
            continue;
        }
        for (auto& version : version::split_advisory_versions(record[1])) {
            advisories.insert(PackageRef{.name = name, .version = std::move(version)});
        }
    }
    return advisories;
}

Result<AdvisorySet> load_advisories(const std::filesystem::path& path)
{
    auto text = common::read_text_file(path);
    if (!text) {
        return std::unexpected(Error::make(error_code::kAdvisoryMalformed,
                                           "Failed to read advisory feed: "
                                               + text.error().message));
    }
    return parse_advisories(*text);
}

}  // namespace pkgsentry::advisory
