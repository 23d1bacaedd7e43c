/**
 * @file feed.cpp
 * @brief Feed download and cache handling
 */

#include "pkgsentry/feed.hpp"

#include <format>
#include <system_error>
#include <utility>

namespace pkgsentry::feed {

Result<std::string> fetch_feed(IHttpClient& client, const FeedOptions& options)
{
    if (options.url.empty()) {
        return std::unexpected(
            Error::make(error_code::kFeedUnavailable, "No advisory feed URL configured"));
    }
    auto response = client.get(HttpRequest{.url = options.url, .timeout = options.timeout});
    if (!response) {
        return std::unexpected(response.error());
    }
    if (!response->ok()) {
        return std::unexpected(
            Error::make(error_code::kFeedUnavailable,
                        std::format("HTTP status {} from {}", response->status, options.url)));
    }
    if (auto written = common::write_text_file(options.cache_path, response->body); !written) {
        return std::unexpected(
            Error::make(error_code::kCacheWriteFailed, written.error().message));
    }
    return std::move(response->body);
}

Result<std::string> read_cached_feed(const std::filesystem::path& cache_path)
{
    std::error_code ec;
    if (!std::filesystem::exists(cache_path, ec)) {
        return std::unexpected(Error::make(error_code::kAdvisoryCacheMissing,
                                           "Advisory file not found: " + cache_path.string()));
    }
    auto text = common::read_text_file(cache_path);
    if (!text) {
        return std::unexpected(
            Error::make(error_code::kAdvisoryMalformed, text.error().message));
    }
    return text;
}

}  // namespace pkgsentry::feed
