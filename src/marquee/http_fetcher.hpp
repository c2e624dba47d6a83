#pragma once

#include <gio/gio.h>
#include <libsoup/soup.h>
#include <functional>
#include <string>

namespace Marquee {

/**
 * Transport used by the fetch pipeline.
 * Implementations invoke the callback exactly once, on the default main context,
 * with either a body (error empty) or an error message.
 */
class HttpFetcher {
public:
    using FetchCallback = std::function<void(const std::string& body, const std::string& error)>;

    virtual ~HttpFetcher() = default;

    virtual void fetch(const std::string& url,
                       guint timeout_ms,
                       GCancellable* cancellable,
                       FetchCallback callback) = 0;
};

/**
 * libsoup-backed fetcher. The session timeout is fixed at construction and
 * shared by all requests; per-request bounds are left to the caller.
 */
class SoupFetcher : public HttpFetcher {
public:
    explicit SoupFetcher(const std::string& user_agent = "Marquee/1.0", guint timeout_ms = 10 * 1000);
    ~SoupFetcher() override;

    SoupFetcher(const SoupFetcher&) = delete;
    SoupFetcher& operator=(const SoupFetcher&) = delete;

    void fetch(const std::string& url,
               guint timeout_ms,
               GCancellable* cancellable,
               FetchCallback callback) override;

    guint timeout_seconds() const;

private:
    SoupSession* session_;
};

} // namespace Marquee
