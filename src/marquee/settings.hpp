#pragma once

#include <cstdint>
#include <string>

namespace Marquee {

/**
 * Tunables for fetching, scoring, caching and resolution.
 * Durations are in milliseconds.
 */
struct Settings {
    // Aggregation
    int max_parallel_fetches = 8;
    int fetch_timeout_ms = 10 * 1000;
    int failure_threshold = 3;          // consecutive failures before a source is "error"

    // Scoring
    int history_window = 10;            // fetch attempts considered for reliability
    double history_decay = 0.9;         // weight multiplier per older attempt
    int64_t staleness_threshold_ms = 7LL * 24 * 60 * 60 * 1000;

    // Caching (directory TTL must not exceed fragment TTL)
    int64_t fragment_ttl_ms = 30LL * 60 * 1000;
    int64_t directory_ttl_ms = 10LL * 60 * 1000;

    // Resolution
    int resolve_timeout_ms = 8 * 1000;
    int resolve_retries_on_timeout = 1;

    std::string user_agent = "Marquee/1.0";

    /**
     * Clamp out-of-range values, logging a warning for each correction
     */
    void normalize();

    /**
     * Load settings from a JSON file; missing members keep their defaults.
     * A missing or unreadable file yields the defaults.
     */
    static Settings load_from_file(const std::string& path);

    /**
     * Parse settings from JSON text
     */
    static Settings load_from_data(const std::string& json);

    bool save_to_file(const std::string& path) const;

    static std::string default_path();
};

} // namespace Marquee
