#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error/result types, error codes, text and file helpers
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

namespace pkgsentry {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string_view code, std::string message)
    {
        return Error{.code = std::string(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/**
 * Error codes shared across modules.
 *
 * Fatal: everything except kLockMalformed, which the scan downgrades to a warning.
 */
namespace error_code {

inline constexpr std::string_view kManifestMissing = "ManifestMissing";
inline constexpr std::string_view kManifestMalformed = "ManifestMalformed";
inline constexpr std::string_view kLockMalformed = "LockMalformed";
inline constexpr std::string_view kAdvisoryMalformed = "AdvisoryMalformed";
inline constexpr std::string_view kAdvisoryCacheMissing = "AdvisoryCacheMissing";
inline constexpr std::string_view kFeedUnavailable = "FeedUnavailable";
inline constexpr std::string_view kCacheWriteFailed = "CacheWriteFailed";
inline constexpr std::string_view kConfigOpenFailed = "ConfigOpenFailed";
inline constexpr std::string_view kConfigParseFailed = "ConfigParseFailed";
inline constexpr std::string_view kConfigInvalid = "ConfigInvalid";
inline constexpr std::string_view kIOError = "IOError";
inline constexpr std::string_view kSchemaInvalid = "SchemaInvalid";

}  // namespace error_code

}  // namespace pkgsentry

namespace pkgsentry::common {

// ============================================================================
// Text helpers
// ============================================================================

/**
 * Remove leading and trailing ASCII whitespace
 */
[[nodiscard]] std::string_view trim(std::string_view input);

/**
 * Remove the leading run of characters contained in @p chars
 */
[[nodiscard]] std::string_view trim_left_of(std::string_view input, std::string_view chars);

// ============================================================================
// File I/O
// ============================================================================

/**
 * Read a whole file as bytes
 * @return File content, or IOError when the file cannot be opened or read
 */
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path& path);

/**
 * Write bytes to a file, replacing any previous content
 * @return Empty on success, IOError on failure
 */
[[nodiscard]] VoidResult write_text_file(const std::filesystem::path& path,
                                         std::string_view content);

}  // namespace pkgsentry::common
