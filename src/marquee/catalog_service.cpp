#include "catalog_service.hpp"
#include "catalog/catalog_codec.hpp"
#include <glib.h>
#include <algorithm>

namespace Marquee {

namespace {

const char* const kSourcesKey = "sources";
const char* const kDirectoryKey = "directory";

std::string lowercase(const std::string& text) {
    gchar* lower = g_utf8_strdown(text.c_str(), -1);
    std::string result = lower ? lower : "";
    g_free(lower);
    return result;
}

Settings normalized(Settings settings) {
    settings.normalize();
    return settings;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return lowercase(haystack).find(needle) != std::string::npos;
}

} // namespace

CatalogService::CatalogService(HttpFetcher& fetcher,
                               BlobStore& store,
                               const Clock& clock,
                               std::shared_ptr<Resolver::PluginLoader> loader,
                               Settings settings)
    : fetcher_(fetcher)
    , store_(store)
    , clock_(clock)
    , settings_(normalized(std::move(settings)))
    , scorer_(settings_.history_window, settings_.history_decay, settings_.staleness_threshold_ms)
    , client_(fetcher_, clock_, &registry_, settings_.failure_threshold, settings_.history_window)
    , fragments_(clock_, settings_.fragment_ttl_ms)
    , directory_(clock_, settings_.directory_ttl_ms)
    , aggregator_(client_, fragments_, scorer_, clock_, &registry_,
                  settings_.max_parallel_fetches, static_cast<guint>(settings_.fetch_timeout_ms))
    , plugins_(std::move(loader), clock_)
    , executor_(plugins_, static_cast<guint>(settings_.resolve_timeout_ms), settings_.resolve_retries_on_timeout) {

    registry_.on_changed([this]() {
        directory_.invalidate(kDirectoryKey);
        save_sources();
    });

    directory_.on_stored([this](const std::string&, const Catalog::DirectoryPtr& directory, int64_t) {
        save_directory(*directory);
    });
}

CatalogService::~CatalogService() = default;

void CatalogService::open() {
    auto sources_blob = store_.load(kSourcesKey);
    if (sources_blob) {
        std::string error;
        auto sources = Catalog::Codec::parse_sources(*sources_blob, error);
        if (sources) {
            registry_.replace_all(std::move(*sources));
            g_info("[Service] Restored %zu sources", registry_.size());
        } else {
            g_warning("[Service] Ignoring stored sources: %s", error.c_str());
        }
    }

    auto directory_blob = store_.load(kDirectoryKey);
    if (directory_blob) {
        std::string error;
        auto directory = Catalog::Codec::parse_directory(*directory_blob, error);
        if (directory) {
            int64_t stored_at = directory->generated_at;
            directory_.seed(kDirectoryKey,
                            std::make_shared<const Catalog::AggregatedDirectory>(std::move(*directory)),
                            stored_at);
        } else {
            g_warning("[Service] Ignoring stored directory: %s", error.c_str());
        }
    }
}

void CatalogService::close() {
    save_sources();
    if (auto directory = current_directory()) {
        save_directory(*directory);
    }
}

void CatalogService::save_sources() {
    if (!store_.save(kSourcesKey, Catalog::Codec::serialize_sources(registry_.all()))) {
        g_warning("[Service] Failed to persist sources");
    }
}

void CatalogService::save_directory(const Catalog::AggregatedDirectory& directory) {
    if (!store_.save(kDirectoryKey, Catalog::Codec::serialize_directory(directory))) {
        g_warning("[Service] Failed to persist directory");
    }
}

// ============ Sources ============

std::string CatalogService::make_source_id(const std::string& url) {
    gchar* digest = g_compute_checksum_for_string(G_CHECKSUM_SHA1, url.c_str(), -1);
    std::string id = "src_" + std::string(digest).substr(0, 12);
    g_free(digest);
    return id;
}

Error CatalogService::register_source(const std::string& url, const std::string& name, int priority) {
    if (url.empty()) {
        return Error(ErrorCode::InvalidArgument, "Source url is required");
    }

    Catalog::ConfigSource source;
    source.id = make_source_id(url);
    source.url = url;
    source.name = name.empty() ? url : name;
    source.priority = priority;
    source.created_at = clock_.now_ms();

    return registry_.add(std::move(source));
}

Error CatalogService::remove_source(const std::string& source_id) {
    return registry_.remove(source_id);
}

Error CatalogService::set_source_enabled(const std::string& source_id, bool enabled) {
    return registry_.set_enabled(source_id, enabled);
}

Error CatalogService::set_primary_source(const std::string& source_id) {
    return registry_.set_primary(source_id);
}

Error CatalogService::set_source_priority(const std::string& source_id, int priority) {
    return registry_.set_priority(source_id, priority);
}

Error CatalogService::move_source(const std::string& source_id, int direction) {
    return registry_.move(source_id, direction);
}

std::vector<Catalog::ConfigSource> CatalogService::sources() const {
    return registry_.all();
}

void CatalogService::check_source_health(const std::string& source_id,
                                         GCancellable* cancellable,
                                         HealthCallback callback) {
    auto source = registry_.get(source_id);
    if (!source) {
        callback(std::nullopt, Error(ErrorCode::UnknownSource, "Unknown source: " + source_id));
        return;
    }

    client_.fetch_and_parse(*source, static_cast<guint>(settings_.fetch_timeout_ms), cancellable,
                            [this, source_id, callback](std::optional<Catalog::CatalogFragment> fragment,
                                                        const Error& error) {
        if (error.code == ErrorCode::Cancelled) {
            callback(std::nullopt, error);
            return;
        }

        save_sources();

        auto current = registry_.get(source_id);
        if (!current) {
            callback(std::nullopt, Error(ErrorCode::UnknownSource, "Source removed: " + source_id));
            return;
        }

        SourceHealth health;
        health.source_id = source_id;
        health.status = current->health_status;
        health.consecutive_failures = current->consecutive_failures;
        health.last_fetched_at = current->last_fetched_at;
        health.reliability = scorer_.reliability(current->history);
        health.site_count = fragment ? static_cast<int>(fragment->sites.size()) : 0;
        health.error = error;
        callback(health, Error());
    });
}

// ============ Directory ============

void CatalogService::get_directory(bool force, GCancellable* cancellable, DirectoryCallback callback) {
    if (cancellable && g_cancellable_is_cancelled(cancellable)) {
        callback(nullptr, false, Error(ErrorCode::Cancelled, "Request cancelled"));
        return;
    }

    if (force) {
        fragments_.invalidate_all();
        directory_.invalidate(kDirectoryKey);
    }

    // The rebuild is shared between callers, so it runs without a caller's cancellable
    auto producer = [this](Catalog::TtlCache<Catalog::AggregatedDirectory>::ProduceCallback done) {
        aggregator_.aggregate(registry_.all(), nullptr,
                              [this, done](Catalog::DirectoryPtr directory, const Error& error) {
            save_sources();
            done(std::move(directory), error);
        });
    };

    GCancellable* held = cancellable ? G_CANCELLABLE(g_object_ref(cancellable)) : nullptr;
    directory_.get(kDirectoryKey, producer,
                   [held, callback](const Catalog::TtlCache<Catalog::AggregatedDirectory>::Lookup& lookup,
                                    const Error& error) {
        bool cancelled = held && g_cancellable_is_cancelled(held);
        if (held) g_object_unref(held);

        if (cancelled) {
            callback(nullptr, false, Error(ErrorCode::Cancelled, "Request cancelled"));
            return;
        }
        callback(lookup.payload, lookup.stale, error);
    });
}

Catalog::DirectoryPtr CatalogService::current_directory() const {
    auto lookup = directory_.peek(kDirectoryKey);
    return lookup ? lookup->payload : nullptr;
}

std::vector<SiteMatch> CatalogService::search_sites(const std::string& keyword) const {
    std::vector<SiteMatch> matches;
    auto directory = current_directory();
    if (!directory || keyword.empty()) return matches;

    std::string needle = lowercase(keyword);

    for (const auto& entry : directory->sites) {
        double relevance = 0.0;
        if (contains(entry.site.name, needle)) relevance += 3.0;
        if (contains(entry.site.key, needle)) relevance += 2.0;
        if (entry.site.ext.kind == Catalog::Extension::Kind::Text && contains(entry.site.ext.value, needle)) {
            relevance += 1.0;
        }
        if (relevance <= 0.0) continue;

        relevance += 2.0 * entry.quality_score;
        matches.push_back(SiteMatch{entry, relevance});
    }

    std::stable_sort(matches.begin(), matches.end(), [](const SiteMatch& a, const SiteMatch& b) {
        return a.relevance > b.relevance;
    });
    return matches;
}

std::vector<Catalog::AggregatedSiteEntry> CatalogService::sites_by_category(const std::string& category_id) const {
    auto directory = current_directory();
    if (!directory) return {};
    return directory->by_category(category_id);
}

Statistics CatalogService::get_statistics() const {
    Statistics stats;

    int64_t total_latency = 0;
    int records = 0;
    int successes = 0;

    for (const auto& source : registry_.all()) {
        stats.total_sources++;
        if (source.enabled) stats.active_sources++;

        for (const auto& record : source.history) {
            records++;
            total_latency += record.latency_ms;
            if (record.success) successes++;
        }
    }

    if (records > 0) {
        stats.average_response_time_ms = static_cast<double>(total_latency) / records;
        stats.success_rate = static_cast<double>(successes) / records;
    }

    if (auto directory = current_directory()) {
        stats.total_sites = directory->total_site_count;
        stats.unique_sites = directory->unique_site_count();
        stats.last_aggregation = directory->generated_at;
    }

    const auto& fragment_stats = fragments_.stats();
    const auto& directory_stats = directory_.stats();
    uint64_t hits = fragment_stats.hits + directory_stats.hits;
    uint64_t lookups = hits + fragment_stats.misses + directory_stats.misses;
    if (lookups > 0) {
        stats.cache_hit_rate = static_cast<double>(hits) / static_cast<double>(lookups);
    }

    return stats;
}

// ============ Resolution ============

void CatalogService::resolve(const std::string& entry_key,
                             const std::optional<Catalog::ResolverHint>& hint,
                             GCancellable* cancellable,
                             ResolveCallback callback) {
    GCancellable* held = cancellable ? G_CANCELLABLE(g_object_ref(cancellable)) : nullptr;

    get_directory(false, cancellable,
                  [this, entry_key, hint, held, callback](Catalog::DirectoryPtr directory, bool, const Error& error) {
        Resolver::ResolutionResult result;

        if (!directory) {
            result.state = error.code == ErrorCode::Cancelled
                ? Resolver::ResolutionState::Cancelled
                : Resolver::ResolutionState::Exhausted;
            result.error = error;
            if (held) g_object_unref(held);
            callback(result);
            return;
        }

        const Catalog::AggregatedSiteEntry* entry = directory->find(entry_key);
        if (!entry) {
            result.state = Resolver::ResolutionState::Exhausted;
            result.error = Error(ErrorCode::UnknownEntry, "Unknown entry: " + entry_key);
            if (held) g_object_unref(held);
            callback(result);
            return;
        }

        executor_.resolve(*entry, hint, held, callback);
        if (held) g_object_unref(held);
    });
}

Error CatalogService::load_plugin(const Resolver::PluginDescriptor& descriptor, const std::string& bytes) {
    return plugins_.load(descriptor, bytes);
}

Error CatalogService::unload_plugin(const std::string& plugin_id) {
    return plugins_.unload(plugin_id);
}

std::vector<Resolver::PluginRecord> CatalogService::plugins() const {
    return plugins_.list();
}

} // namespace Marquee
