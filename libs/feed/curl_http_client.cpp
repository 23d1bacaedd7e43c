/**
 * @file curl_http_client.cpp
 * @brief IHttpClient implementation on top of libcurl
 */

#include "pkgsentry/feed.hpp"
#include "pkgsentry/version.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <memory>
#include <string>
#include <utility>

#include <curl/curl.h>

namespace pkgsentry::feed {

namespace {

constexpr long kMaxConnectSeconds = 10;
constexpr long kMaxRedirects = 5;

struct CurlEasyDeleter
{
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

using CurlEasy = std::unique_ptr<CURL, CurlEasyDeleter>;

std::size_t append_body(char* data, std::size_t size, std::size_t count, void* user)
{
    auto* body = static_cast<std::string*>(user);
    body->append(data, size * count);
    return size * count;
}

int check_cancelled(void* user, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
    const auto* flag = static_cast<const std::atomic<bool>*>(user);
    return flag != nullptr && flag->load() ? 1 : 0;
}

[[nodiscard]] CURLcode ensure_global_init()
{
    static const CURLcode kInitResult = curl_global_init(CURL_GLOBAL_DEFAULT);
    return kInitResult;
}

[[nodiscard]] Error unavailable(std::string message)
{
    return Error::make(error_code::kFeedUnavailable, std::move(message));
}

}  // namespace

CurlHttpClient::CurlHttpClient(std::atomic<bool>* cancel_flag)
    : m_cancel_flag(cancel_flag)
{}

Result<HttpResponse> CurlHttpClient::get(const HttpRequest& request)
{
    if (const CURLcode init = ensure_global_init(); init != CURLE_OK) {
        return std::unexpected(
            unavailable(std::string("libcurl initialization failed: ") + curl_easy_strerror(init)));
    }
    CurlEasy handle(curl_easy_init());
    if (!handle) {
        return std::unexpected(unavailable("Failed to create libcurl handle"));
    }

    const long total_seconds = static_cast<long>(request.timeout.count());
    const std::string user_agent = std::format("pkgsentry/{}", kVersion);
    std::array<char, CURL_ERROR_SIZE> error_buffer{};
    HttpResponse response;

    CURL* curl = handle.get();
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, kMaxRedirects);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, total_seconds);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, std::min(total_seconds, kMaxConnectSeconds));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, error_buffer.data());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, check_cancelled);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, m_cancel_flag);

    const CURLcode rc = curl_easy_perform(curl);
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected(unavailable("Download of " + request.url + " was cancelled"));
    }
    if (rc == CURLE_OPERATION_TIMEDOUT) {
        return std::unexpected(unavailable(
            std::format("Download of {} timed out after {}s", request.url, total_seconds)));
    }
    if (rc != CURLE_OK) {
        const std::string detail =
            error_buffer.front() != '\0' ? std::string(error_buffer.data()) : curl_easy_strerror(rc);
        return std::unexpected(unavailable("Failed to download " + request.url + ": " + detail));
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

}  // namespace pkgsentry::feed
