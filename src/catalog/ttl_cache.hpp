#pragma once

#include "marquee/clock.hpp"
#include "marquee/error.hpp"
#include <glib.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Catalog {

/**
 * Keyed cache of immutable payloads with a time-to-live.
 *
 * Expired or invalidated entries are rebuilt through a caller-supplied
 * producer. Concurrent gets for the same key share one rebuild; a get that
 * arrives after an invalidation waits for a new rebuild started once the
 * running one completes. When a rebuild fails the previous payload, if any,
 * is served flagged as stale.
 *
 * Runs on the main context; the cache must outlive pending rebuilds.
 */
template <typename T>
class TtlCache {
public:
    using Payload = std::shared_ptr<const T>;

    struct Lookup {
        Payload payload;
        bool stale = false;
        int64_t stored_at = 0;
        Marquee::Error refresh_error;   // why a stale payload was served
    };

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t stale_served = 0;
    };

    using Callback = std::function<void(const Lookup& lookup, const Marquee::Error& error)>;
    using ProduceCallback = std::function<void(Payload payload, const Marquee::Error& error)>;
    using Producer = std::function<void(ProduceCallback done)>;
    using StoredCallback = std::function<void(const std::string& key, const Payload& payload, int64_t stored_at)>;

    TtlCache(const Marquee::Clock& clock, int64_t ttl_ms)
        : clock_(clock), ttl_ms_(ttl_ms) {}

    TtlCache(const TtlCache&) = delete;
    TtlCache& operator=(const TtlCache&) = delete;

    /**
     * Return the live entry for key, or rebuild it with producer.
     * The callback may run before get() returns.
     */
    void get(const std::string& key, Producer producer, Callback callback) {
        auto it = entries_.find(key);
        if (it != entries_.end() && is_live(it->second)) {
            stats_.hits++;
            callback(Lookup{it->second.payload, false, it->second.stored_at, Marquee::Error()}, Marquee::Error());
            return;
        }

        stats_.misses++;

        auto build_it = builds_.find(key);
        if (build_it != builds_.end()) {
            Build& build = *build_it->second;
            if (build.generation == generations_[key]) {
                build.waiters.push_back(std::move(callback));
            } else {
                // That build predates an invalidation; queue a rebuild behind it
                build.followers.push_back(std::move(callback));
                build.follow_producer = std::move(producer);
            }
            return;
        }

        std::vector<Callback> waiters;
        waiters.push_back(std::move(callback));
        start_build(key, std::move(producer), std::move(waiters));
    }

    /**
     * Current entry without rebuilding. stale is set when the entry has
     * expired or was invalidated.
     */
    std::optional<Lookup> peek(const std::string& key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        return Lookup{it->second.payload, !is_live(it->second), it->second.stored_at, Marquee::Error()};
    }

    // The payload is kept as a stale fallback
    void invalidate(const std::string& key) {
        generations_[key]++;
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.invalidated = true;
        }
    }

    void invalidate_all() {
        for (auto& [key, entry] : entries_) {
            entry.invalidated = true;
            generations_[key]++;
        }
        for (auto& [key, build] : builds_) {
            generations_[key]++;
        }
    }

    /**
     * Restore a persisted payload with its original store time
     */
    void seed(const std::string& key, Payload payload, int64_t stored_at) {
        entries_[key] = Entry{std::move(payload), stored_at, false};
    }

    void on_stored(StoredCallback callback) {
        stored_callback_ = std::move(callback);
    }

    bool building(const std::string& key) const {
        return builds_.count(key) > 0;
    }

    const Stats& stats() const { return stats_; }

    double hit_rate() const {
        uint64_t total = stats_.hits + stats_.misses;
        return total == 0 ? 0.0 : static_cast<double>(stats_.hits) / static_cast<double>(total);
    }

    int64_t ttl_ms() const { return ttl_ms_; }

private:
    struct Entry {
        Payload payload;
        int64_t stored_at = 0;
        bool invalidated = false;
    };

    struct Build {
        uint64_t generation = 0;
        std::vector<Callback> waiters;
        std::vector<Callback> followers;   // arrived after an invalidation
        Producer follow_producer;
    };

    const Marquee::Clock& clock_;
    int64_t ttl_ms_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, std::shared_ptr<Build>> builds_;
    std::map<std::string, uint64_t> generations_;
    StoredCallback stored_callback_;
    Stats stats_;

    bool is_live(const Entry& entry) const {
        return !entry.invalidated && clock_.now_ms() - entry.stored_at < ttl_ms_;
    }

    void start_build(const std::string& key, Producer producer, std::vector<Callback> waiters) {
        auto build = std::make_shared<Build>();
        build->generation = generations_[key];
        build->waiters = std::move(waiters);
        builds_[key] = build;

        producer([this, key, build](Payload payload, const Marquee::Error& error) {
            complete(key, build, std::move(payload), error);
        });
    }

    void complete(const std::string& key,
                  const std::shared_ptr<Build>& build,
                  Payload payload,
                  const Marquee::Error& error) {
        auto build_it = builds_.find(key);
        if (build_it != builds_.end() && build_it->second == build) {
            builds_.erase(build_it);
        }

        std::vector<Callback> waiters = std::move(build->waiters);
        std::vector<Callback> followers = std::move(build->followers);
        Producer follow_producer = std::move(build->follow_producer);

        Lookup lookup;
        Marquee::Error failure;

        if (!error && payload) {
            int64_t now = clock_.now_ms();
            // Invalidated while building: hand out the result but rebuild next time
            bool current = generations_[key] == build->generation;
            entries_[key] = Entry{payload, now, !current};

            if (current && stored_callback_) {
                stored_callback_(key, payload, now);
            }
            lookup = Lookup{payload, false, now, Marquee::Error()};
        } else {
            failure = error ? error
                : Marquee::Error(Marquee::ErrorCode::InvalidArgument, "Producer returned no payload");

            auto it = entries_.find(key);
            if (it != entries_.end() && it->second.payload) {
                g_warning("[Cache] Rebuild of %s failed, serving stale entry: %s",
                          key.c_str(), failure.to_string().c_str());
                lookup = Lookup{it->second.payload, true, it->second.stored_at, failure};
                failure = Marquee::Error();
            }
        }

        // Started before the waiters run so a get from a callback joins it
        if (!followers.empty()) {
            start_build(key, std::move(follow_producer), std::move(followers));
        }

        for (auto& waiter : waiters) {
            if (lookup.stale) {
                stats_.stale_served++;
            }
            waiter(lookup, failure);
        }
    }
};

} // namespace Catalog
