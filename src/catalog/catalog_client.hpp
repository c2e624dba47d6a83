#pragma once

#include "catalog_types.hpp"
#include "source_registry.hpp"
#include "marquee/clock.hpp"
#include "marquee/error.hpp"
#include "marquee/http_fetcher.hpp"
#include <gio/gio.h>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace Catalog {

/**
 * Fetch and parse pipeline for a single config source.
 *
 * Every outcome is recorded in the registry (when one is given) so health,
 * last fetch time and history stay current. Destroying the client cancels
 * the requests still in flight; their callbacks are not called.
 */
class Client {
public:
    using FragmentCallback = std::function<void(std::optional<CatalogFragment>, const Marquee::Error& error)>;

    Client(Marquee::HttpFetcher& fetcher,
           const Marquee::Clock& clock,
           SourceRegistry* registry,
           int failure_threshold,
           int history_limit);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /**
     * Fetch a source document and parse it into a fragment.
     * @param source Source to fetch
     * @param timeout_ms Upper bound for the whole request; the transport
     *        request is cancelled when it expires
     * @param cancellable Checked before the request is issued, may be null
     * @param callback Called once with the fragment, or with a SourceFetch,
     *        SourceParse or Cancelled error
     */
    void fetch_and_parse(const ConfigSource& source,
                         guint timeout_ms,
                         GCancellable* cancellable,
                         FragmentCallback callback);

private:
    struct PendingFetch;

    Marquee::HttpFetcher& fetcher_;
    const Marquee::Clock& clock_;
    SourceRegistry* registry_;
    int failure_threshold_;
    int history_limit_;
    std::set<std::shared_ptr<PendingFetch>> pending_;

    void finish(const std::shared_ptr<PendingFetch>& pending,
                std::optional<CatalogFragment> fragment,
                const Marquee::Error& error);
};

} // namespace Catalog
