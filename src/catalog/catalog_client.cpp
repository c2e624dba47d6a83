#include "catalog_client.hpp"
#include "catalog_parser.hpp"
#include "marquee/main_loop.hpp"
#include <glib.h>
#include <set>

namespace Catalog {

using Marquee::Error;
using Marquee::ErrorCode;

struct Client::PendingFetch {
    std::string source_id;
    std::string source_url;
    FragmentCallback callback;

    GCancellable* request_cancellable = nullptr;
    guint timeout_id = 0;
    gint64 started_us = 0;
    bool done = false;

    ~PendingFetch() {
        if (request_cancellable) {
            g_object_unref(request_cancellable);
        }
    }
};

Client::Client(Marquee::HttpFetcher& fetcher,
               const Marquee::Clock& clock,
               SourceRegistry* registry,
               int failure_threshold,
               int history_limit)
    : fetcher_(fetcher)
    , clock_(clock)
    , registry_(registry)
    , failure_threshold_(failure_threshold)
    , history_limit_(history_limit) {
}

Client::~Client() {
    // Late transport answers find their fetch already done
    std::set<std::shared_ptr<PendingFetch>> pending = std::move(pending_);
    for (const auto& fetch : pending) {
        fetch->done = true;
        Marquee::cancel_source(fetch->timeout_id);
        g_cancellable_cancel(fetch->request_cancellable);
    }
}

void Client::fetch_and_parse(const ConfigSource& source,
                             guint timeout_ms,
                             GCancellable* cancellable,
                             FragmentCallback callback) {
    if (cancellable && g_cancellable_is_cancelled(cancellable)) {
        callback(std::nullopt, Error(ErrorCode::Cancelled, "Fetch cancelled"));
        return;
    }

    auto pending = std::make_shared<PendingFetch>();
    pending->source_id = source.id;
    pending->source_url = source.url;
    pending->callback = std::move(callback);
    pending->request_cancellable = g_cancellable_new();
    pending->started_us = g_get_monotonic_time();
    pending_.insert(pending);

    // Armed before the request so a transport that never answers is still bounded
    pending->timeout_id = Marquee::schedule_timeout(timeout_ms, [this, pending, timeout_ms]() {
        pending->timeout_id = 0;
        if (pending->done) return;

        finish(pending, std::nullopt,
               Error(ErrorCode::SourceFetch, "Request timed out after " + std::to_string(timeout_ms) + " ms"));
        g_cancellable_cancel(pending->request_cancellable);
    });

    fetcher_.fetch(source.url, timeout_ms, pending->request_cancellable,
                   [this, pending](const std::string& body, const std::string& error) {
        if (pending->done) return;

        if (!error.empty()) {
            finish(pending, std::nullopt, Error(ErrorCode::SourceFetch, error));
            return;
        }

        std::string parse_error;
        auto fragment = Parser::parse_fragment(body, parse_error);
        if (!fragment) {
            finish(pending, std::nullopt, Error(ErrorCode::SourceParse, parse_error));
            return;
        }

        fragment->source_id = pending->source_id;
        fragment->source_url = pending->source_url;
        fragment->fetched_at = clock_.now_ms();
        finish(pending, std::move(fragment), Error());
    });
}

void Client::finish(const std::shared_ptr<PendingFetch>& pending,
                    std::optional<CatalogFragment> fragment,
                    const Error& error) {
    if (pending->done) return;
    pending->done = true;
    pending_.erase(pending);
    Marquee::cancel_source(pending->timeout_id);

    FetchRecord record;
    record.at = clock_.now_ms();
    record.success = error.ok();
    record.latency_ms = (g_get_monotonic_time() - pending->started_us) / 1000;

    if (error) {
        g_warning("[Client] Fetch of %s failed: %s",
                  pending->source_url.c_str(), error.to_string().c_str());
    } else {
        g_debug("[Client] Fetched %s: %zu sites in %" G_GINT64_FORMAT " ms",
                pending->source_url.c_str(), fragment->sites.size(), record.latency_ms);
    }

    if (registry_) {
        Error record_error = registry_->record_fetch(pending->source_id, record,
                                                     failure_threshold_, history_limit_);
        if (record_error) {
            // Source removed while the fetch was in flight
            g_debug("[Client] Not recording fetch: %s", record_error.message.c_str());
        }
    }

    pending->callback(std::move(fragment), error);
}

} // namespace Catalog
