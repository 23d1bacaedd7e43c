/**
 * @file text.cpp
 * @brief Whitespace trimming helpers
 */

#include "pkgsentry/common.hpp"

#include <cctype>
#include <string_view>

namespace pkgsentry::common {

namespace {

[[nodiscard]] bool is_space(char c) noexcept
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::string_view trim(std::string_view input)
{
    std::size_t start = 0;
    while (start < input.size() && is_space(input[start])) {
        ++start;
    }
    std::size_t end = input.size();
    while (end > start && is_space(input[end - 1])) {
        --end;
    }
    return input.substr(start, end - start);
}

std::string_view trim_left_of(std::string_view input, std::string_view chars)
{
    const auto start = input.find_first_not_of(chars);
    if (start == std::string_view::npos) {
        return {};
    }
    return input.substr(start);
}

}  // namespace pkgsentry::common
