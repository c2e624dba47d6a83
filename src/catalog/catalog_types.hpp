#pragma once

#include "marquee/error.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Catalog {

enum class HealthStatus {
    Unknown,
    Healthy,
    Warning,
    Error,
};

const char* health_status_to_string(HealthStatus status);
HealthStatus health_status_from_string(const std::string& value);

/**
 * Outcome of a single fetch of a config source
 */
struct FetchRecord {
    int64_t at = 0;          // ms since epoch
    bool success = false;
    int64_t latency_ms = 0;
};

/**
 * A subscribed config source
 */
struct ConfigSource {
    std::string id;
    std::string url;
    std::string name;
    int priority = 0;        // higher wins on conflicts
    bool enabled = true;
    bool is_primary = false;

    int64_t created_at = 0;
    int64_t last_fetched_at = 0;   // last successful fetch, 0 if never
    HealthStatus health_status = HealthStatus::Unknown;
    int consecutive_failures = 0;

    // Oldest first, bounded by Settings::history_window
    std::vector<FetchRecord> history;
};

/**
 * Site extension payload. Object payloads are kept as serialized JSON
 * and passed through untouched.
 */
struct Extension {
    enum class Kind {
        None,
        Text,
        Object,
    };

    Kind kind = Kind::None;
    std::string value;

    bool empty() const { return kind == Kind::None; }
};

/**
 * Resolver selection hint carried by a site or passed to resolve()
 */
struct ResolverHint {
    std::vector<std::string> fallback_parsers;  // plugin ids, in order
    std::optional<std::string> format;          // overrides the site kind
    std::map<std::string, std::string> headers;

    bool empty() const {
        return fallback_parsers.empty() && !format.has_value() && headers.empty();
    }
};

/**
 * Playable content site
 */
struct SiteEntry {
    std::string key;         // dedup identity
    std::string name;
    int type = 0;            // wire type number
    std::string kind;        // derived from type, see kind_for_site_type()
    std::string endpoint;    // wire "api"

    bool searchable = false;
    bool quick_search = false;
    bool filterable = false;
    bool changeable = true;

    Extension ext;
    std::optional<ResolverHint> resolver_hint;
    std::optional<std::string> jar;
    std::optional<std::string> player_type;
    std::map<std::string, std::string> headers;
    std::optional<int> timeout_seconds;
    std::optional<int64_t> updated_at;
};

// 0 -> "video", 1 -> "video_api", 3 -> "video_script", otherwise "other"
std::string kind_for_site_type(int type);
std::string category_display_name(const std::string& kind);

/**
 * URL resolver advertised by a source (wire "parses")
 */
struct ResolverDescriptor {
    std::string name;
    int type = 0;
    std::string url;
    std::vector<std::string> flags;
    std::map<std::string, std::string> headers;
    Extension ext;
};

/**
 * Blocking / sniffing rule (wire "rules")
 */
struct RuleEntry {
    std::string name;
    std::vector<std::string> hosts;
    std::vector<std::string> regex;
    std::vector<std::string> script;
};

/**
 * Live stream playlist (wire "lives")
 */
struct LiveEntry {
    std::string name;
    int type = 0;
    std::string url;
    std::optional<std::string> player_type;
    std::optional<std::string> ua;
    std::optional<std::string> epg;
    std::optional<std::string> logo;
    std::optional<int> timeout_seconds;
    bool boot = false;
};

/**
 * Spider archive reference, from "spider": "path;md5;<checksum>"
 */
struct SpiderDescriptor {
    std::string path;
    std::string md5;
};

/**
 * Parsed output of one config source
 */
struct CatalogFragment {
    std::string source_id;
    std::string source_url;
    int64_t fetched_at = 0;

    std::vector<SiteEntry> sites;
    std::vector<ResolverDescriptor> resolvers;
    std::vector<RuleEntry> rules;
    std::vector<LiveEntry> lives;
    std::vector<std::string> wallpapers;
    std::optional<SpiderDescriptor> spider;
};

/**
 * A site in the merged directory, one per unique key
 */
struct AggregatedSiteEntry {
    SiteEntry site;
    std::set<std::string> origin_urls;
    double quality_score = 0.0;
    double reliability_score = 0.0;
    int64_t last_seen = 0;
    std::string source_id;   // source whose fields won
};

struct CategoryInfo {
    std::string id;          // site kind
    std::string name;
    std::vector<std::string> site_keys;
};

/**
 * Per-source note attached to a directory
 */
struct SourceFailure {
    std::string source_id;
    std::string source_url;
    Marquee::ErrorCode code = Marquee::ErrorCode::None;
    std::string message;
    bool served_stale = false;   // an older fragment was merged instead
};

/**
 * Immutable merged snapshot across all enabled sources
 */
struct AggregatedDirectory {
    std::vector<AggregatedSiteEntry> sites;
    std::vector<CategoryInfo> categories;
    std::vector<ResolverDescriptor> resolvers;
    std::vector<RuleEntry> rules;
    std::vector<LiveEntry> lives;
    std::vector<SourceFailure> failures;

    int64_t generated_at = 0;
    int source_count = 0;        // sources that contributed
    int total_site_count = 0;    // sites before deduplication

    int unique_site_count() const { return static_cast<int>(sites.size()); }

    const AggregatedSiteEntry* find(const std::string& key) const;
    std::vector<AggregatedSiteEntry> by_category(const std::string& category_id) const;
};

using DirectoryPtr = std::shared_ptr<const AggregatedDirectory>;

// Groups sites by kind, largest group first
std::vector<CategoryInfo> build_categories(const std::vector<AggregatedSiteEntry>& sites);

} // namespace Catalog
