/**
 * @file file_io.cpp
 * @brief Whole-file read/write helpers
 */

#include "pkgsentry/common.hpp"

#include <fstream>
#include <iterator>
#include <string>

namespace pkgsentry::common {

Result<std::string> read_text_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            Error::make(error_code::kIOError, "Failed to open file: " + path.string()));
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        return std::unexpected(
            Error::make(error_code::kIOError, "Failed to read file: " + path.string()));
    }
    return content;
}

VoidResult write_text_file(const std::filesystem::path& path, std::string_view content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(
            Error::make(error_code::kIOError, "Failed to open output file: " + path.string()));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        return std::unexpected(
            Error::make(error_code::kIOError, "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace pkgsentry::common
