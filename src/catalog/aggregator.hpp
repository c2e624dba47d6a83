#pragma once

#include "catalog_client.hpp"
#include "catalog_types.hpp"
#include "scorer.hpp"
#include "source_registry.hpp"
#include "ttl_cache.hpp"
#include "marquee/clock.hpp"
#include "marquee/error.hpp"
#include <gio/gio.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace Catalog {

using FragmentCache = TtlCache<CatalogFragment>;

/**
 * Builds the aggregated directory from all enabled config sources.
 *
 * Fragments are fetched through the fragment cache, at most
 * max_parallel_fetches at a time. Only one aggregation runs at a time;
 * callers arriving while one is running join it and receive the same
 * directory. A caller whose cancellable fires is detached with a Cancelled
 * error; once every caller is gone no further fetches are started.
 * Destroying the aggregator drops running cycles without calling back.
 */
class Aggregator {
public:
    using DirectoryCallback = std::function<void(DirectoryPtr directory, const Marquee::Error& error)>;

    /**
     * One source's input to a merge
     */
    struct Contribution {
        ConfigSource source;
        std::shared_ptr<const CatalogFragment> fragment;
        Score score;
    };

    Aggregator(Client& client,
               FragmentCache& fragments,
               const Scorer& scorer,
               const Marquee::Clock& clock,
               SourceRegistry* registry,
               int max_parallel_fetches,
               guint fetch_timeout_ms);
    ~Aggregator();

    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

    /**
     * Aggregate the enabled sources among the given ones.
     * @param cancellable Detaches this caller when cancelled, may be null
     * @param callback Receives the directory, or AggregationFailed when every
     *        enabled source failed, or Cancelled
     */
    void aggregate(const std::vector<ConfigSource>& sources,
                   GCancellable* cancellable,
                   DirectoryCallback callback);

    bool in_progress() const { return cycle_ != nullptr; }
    uint64_t cycles_started() const { return cycles_started_; }

    /**
     * Merge fragments into a directory. Sites are deduplicated by key; the
     * highest ranked source wins and the others add their URL to the
     * winner's origin_urls.
     */
    static AggregatedDirectory merge(std::vector<Contribution> contributions, int64_t now);

    // Rank order: priority, quality, last fetch, primary flag, then id
    static bool outranks(const Contribution& a, const Contribution& b);

    static std::string fragment_key(const std::string& url);

private:
    struct Waiter;
    struct Cycle;
    struct CancelData;

    Client& client_;
    FragmentCache& fragments_;
    const Scorer& scorer_;
    const Marquee::Clock& clock_;
    SourceRegistry* registry_;
    int max_parallel_fetches_;
    guint fetch_timeout_ms_;

    std::shared_ptr<Cycle> cycle_;
    std::set<std::shared_ptr<Cycle>> running_;   // unfinished, including abandoned ones
    uint64_t cycles_started_ = 0;
    uint64_t next_waiter_id_ = 0;

    void add_waiter(const std::shared_ptr<Cycle>& cycle, GCancellable* cancellable, DirectoryCallback callback);
    void detach_waiter(const std::shared_ptr<Cycle>& cycle, uint64_t waiter_id);
    void release_waiter(Waiter& waiter);

    void pump(const std::shared_ptr<Cycle>& cycle);
    void start_fetch(const std::shared_ptr<Cycle>& cycle, size_t index);
    void on_fragment(const std::shared_ptr<Cycle>& cycle,
                     size_t index,
                     const FragmentCache::Lookup& lookup,
                     const Marquee::Error& error);
    void finish_cycle(const std::shared_ptr<Cycle>& cycle);

    static void on_cancelled(GCancellable* cancellable, gpointer user_data);
};

} // namespace Catalog
