#pragma once

#include "blob_store.hpp"
#include "clock.hpp"
#include "error.hpp"
#include "http_fetcher.hpp"
#include "settings.hpp"
#include "catalog/aggregator.hpp"
#include "catalog/catalog_client.hpp"
#include "catalog/catalog_types.hpp"
#include "catalog/scorer.hpp"
#include "catalog/source_registry.hpp"
#include "catalog/ttl_cache.hpp"
#include "resolver/executor.hpp"
#include "resolver/plugin_registry.hpp"
#include <gio/gio.h>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Marquee {

/**
 * Directory and fetch statistics
 */
struct Statistics {
    int total_sources = 0;
    int active_sources = 0;
    int total_sites = 0;                  // before deduplication
    int unique_sites = 0;
    int64_t last_aggregation = 0;         // 0 if no directory yet
    double average_response_time_ms = 0.0;
    double success_rate = 0.0;            // over recorded fetch history
    double cache_hit_rate = 0.0;
};

/**
 * Result of an on-demand source check
 */
struct SourceHealth {
    std::string source_id;
    Catalog::HealthStatus status = Catalog::HealthStatus::Unknown;
    int consecutive_failures = 0;
    int64_t last_fetched_at = 0;
    double reliability = 0.0;
    int site_count = 0;                   // sites in the fetched document
    Error error;                          // why the check fetch failed
};

struct SiteMatch {
    Catalog::AggregatedSiteEntry entry;
    double relevance = 0.0;
};

/**
 * Entry point tying the source registry, aggregation, caching and stream
 * resolution together.
 *
 * All callbacks run on the default main context. Destroying the service
 * drops the requests still pending; their callbacks are not called.
 *
 * Example:
 * @code
 * Marquee::SoupFetcher fetcher;
 * Marquee::FileBlobStore store;
 * Marquee::SystemClock clock;
 * Marquee::CatalogService service(fetcher, store, clock, nullptr);
 * service.open();
 * service.register_source("https://example.com/config.json", "Example");
 * service.get_directory(false, nullptr, [](Catalog::DirectoryPtr dir, bool stale, const Marquee::Error& error) {
 *     if (dir) g_print("%d sites\n", dir->unique_site_count());
 * });
 * @endcode
 */
class CatalogService {
public:
    using DirectoryCallback = std::function<void(Catalog::DirectoryPtr directory, bool stale, const Error& error)>;
    using ResolveCallback = Resolver::Executor::ResultCallback;
    using HealthCallback = std::function<void(std::optional<SourceHealth> health, const Error& error)>;

    CatalogService(HttpFetcher& fetcher,
                   BlobStore& store,
                   const Clock& clock,
                   std::shared_ptr<Resolver::PluginLoader> loader,
                   Settings settings = Settings());
    ~CatalogService();

    CatalogService(const CatalogService&) = delete;
    CatalogService& operator=(const CatalogService&) = delete;

    /**
     * Restore the registry and the last good directory from the blob store
     */
    void open();

    /**
     * Persist the registry and the current directory
     */
    void close();

    // ============ Sources ============

    /**
     * Subscribe to a config source. The id is derived from the url.
     * @return DuplicateSource if the url is already registered
     */
    Error register_source(const std::string& url, const std::string& name = "", int priority = 0);

    Error remove_source(const std::string& source_id);
    Error set_source_enabled(const std::string& source_id, bool enabled);
    Error set_primary_source(const std::string& source_id);
    Error set_source_priority(const std::string& source_id, int priority);
    Error move_source(const std::string& source_id, int direction);

    std::vector<Catalog::ConfigSource> sources() const;

    /**
     * Fetch the source document now, bypassing the caches, and report the
     * resulting health
     */
    void check_source_health(const std::string& source_id, GCancellable* cancellable, HealthCallback callback);

    // ============ Directory ============

    /**
     * Get the aggregated directory.
     * @param force Re-fetch every source even if the cached directory is live
     * @param callback Receives the directory and whether it is a stale
     *        fallback, or the error when no directory is available
     */
    void get_directory(bool force, GCancellable* cancellable, DirectoryCallback callback);

    /**
     * Last built directory without triggering a rebuild, may be null
     */
    Catalog::DirectoryPtr current_directory() const;

    std::vector<SiteMatch> search_sites(const std::string& keyword) const;
    std::vector<Catalog::AggregatedSiteEntry> sites_by_category(const std::string& category_id) const;

    Statistics get_statistics() const;

    // ============ Resolution ============

    /**
     * Resolve a directory entry by key. Unknown keys yield a result with
     * UnknownEntry.
     */
    void resolve(const std::string& entry_key,
                 const std::optional<Catalog::ResolverHint>& hint,
                 GCancellable* cancellable,
                 ResolveCallback callback);

    Error load_plugin(const Resolver::PluginDescriptor& descriptor, const std::string& bytes);
    Error unload_plugin(const std::string& plugin_id);
    std::vector<Resolver::PluginRecord> plugins() const;

    const Settings& settings() const { return settings_; }
    uint64_t aggregations_started() const { return aggregator_.cycles_started(); }

    // "src_" + first 12 hex digits of the url's SHA-1
    static std::string make_source_id(const std::string& url);

private:
    HttpFetcher& fetcher_;
    BlobStore& store_;
    const Clock& clock_;
    Settings settings_;

    Catalog::SourceRegistry registry_;
    Catalog::Scorer scorer_;
    Catalog::Client client_;
    Catalog::FragmentCache fragments_;
    Catalog::TtlCache<Catalog::AggregatedDirectory> directory_;
    Catalog::Aggregator aggregator_;

    Resolver::PluginRegistry plugins_;
    Resolver::Executor executor_;

    void save_sources();
    void save_directory(const Catalog::AggregatedDirectory& directory);
};

} // namespace Marquee
