#pragma once

/**
 * @file feed.hpp
 * @brief Advisory feed acquisition: HTTP download with local cache, or offline cache read
 */

#include "pkgsentry/common.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>

namespace pkgsentry::feed {

struct HttpRequest
{
    std::string url;
    std::chrono::seconds timeout{30};
};

struct HttpResponse
{
    long status = 0;
    std::string body;

    [[nodiscard]] bool ok() const noexcept { return status >= 200 && status < 300; }
};

/**
 * @brief Transport used for the feed download
 *
 * Implementations return FeedUnavailable for transport failures (DNS, TLS, timeout,
 * cancellation). A completed exchange is returned as-is, whatever its status.
 */
class IHttpClient
{
public:
    IHttpClient() = default;
    virtual ~IHttpClient() = default;

    IHttpClient(const IHttpClient&) = delete;
    IHttpClient& operator=(const IHttpClient&) = delete;
    IHttpClient(IHttpClient&&) = delete;
    IHttpClient& operator=(IHttpClient&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse> get(const HttpRequest& request) = 0;
};

/**
 * @brief libcurl-backed client
 *
 * The transfer is aborted once @p cancel_flag becomes true.
 */
class CurlHttpClient final : public IHttpClient
{
public:
    explicit CurlHttpClient(std::atomic<bool>* cancel_flag = nullptr);

    [[nodiscard]] Result<HttpResponse> get(const HttpRequest& request) override;

private:
    std::atomic<bool>* m_cancel_flag;
};

/**
 * @brief Routes SIGINT to a cancel flag while the guard is alive
 *
 * Meant to wrap a network scan so Ctrl-C aborts the download; the previous SIGINT
 * disposition is restored on destruction. Only one guard may exist at a time.
 */
class InterruptGuard
{
public:
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;
    InterruptGuard(InterruptGuard&&) = delete;
    InterruptGuard& operator=(InterruptGuard&&) = delete;

    /// Raised once SIGINT arrives; suitable for CurlHttpClient.
    [[nodiscard]] std::atomic<bool>* cancel_flag() const noexcept;

private:
    using SignalHandler = void (*)(int);

    SignalHandler m_previous;
};

struct FeedOptions
{
    std::string url;
    std::filesystem::path cache_path;
    std::chrono::seconds timeout{30};
};

/**
 * Download the feed and persist it to options.cache_path.
 * @return Feed bytes; FeedUnavailable on transport failure or non-2xx status,
 *         CacheWriteFailed if the cache file cannot be written
 */
[[nodiscard]] Result<std::string> fetch_feed(IHttpClient& client, const FeedOptions& options);

/**
 * Read a previously downloaded (or hand-written) feed.
 * @return AdvisoryCacheMissing if the file does not exist, AdvisoryMalformed if unreadable
 */
[[nodiscard]] Result<std::string> read_cached_feed(const std::filesystem::path& cache_path);

}  // namespace pkgsentry::feed
