#pragma once

#include "catalog_types.hpp"
#include "marquee/error.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Catalog {

/**
 * Ordered set of subscribed config sources.
 *
 * Readers take the last published snapshot without blocking. Writers copy the
 * list, mutate it and publish the copy under a single writer lock. User
 * mutations notify the change listeners after the lock is released;
 * record_fetch() does not.
 */
class SourceRegistry {
public:
    using Snapshot = std::shared_ptr<const std::vector<ConfigSource>>;
    using ChangedCallback = std::function<void()>;

    SourceRegistry();

    SourceRegistry(const SourceRegistry&) = delete;
    SourceRegistry& operator=(const SourceRegistry&) = delete;

    Snapshot snapshot() const;

    std::vector<ConfigSource> all() const;
    std::vector<ConfigSource> enabled_sources() const;
    std::optional<ConfigSource> get(const std::string& id) const;
    std::optional<ConfigSource> primary() const;
    size_t size() const;

    /**
     * Add a source at the end of the list.
     * @return DuplicateSource if the id or url is already registered,
     *         InvalidArgument if either is empty
     */
    Marquee::Error add(ConfigSource source);

    Marquee::Error remove(const std::string& id);
    Marquee::Error set_enabled(const std::string& id, bool enabled);

    /**
     * Mark a source as primary, clearing the flag on every other source
     */
    Marquee::Error set_primary(const std::string& id);

    Marquee::Error set_priority(const std::string& id, int priority);

    /**
     * Move a source one step up (direction < 0) or down (direction > 0).
     * Only the display order changes.
     */
    Marquee::Error move(const std::string& id, int direction);

    /**
     * Replace the whole list, e.g. after loading from storage. Only the first
     * source flagged primary keeps the flag. Listeners are not notified.
     */
    void replace_all(std::vector<ConfigSource> sources);

    /**
     * Append a fetch outcome and update health bookkeeping.
     * @param failure_threshold Consecutive failures that turn a source to Error
     * @param history_limit Maximum records kept per source
     */
    Marquee::Error record_fetch(const std::string& id,
                                const FetchRecord& record,
                                int failure_threshold,
                                int history_limit);

    /**
     * Subscribe to user mutations
     */
    void on_changed(ChangedCallback callback);

private:
    Snapshot sources_;
    mutable std::mutex write_mutex_;
    std::vector<ChangedCallback> change_callbacks_;

    void publish(std::vector<ConfigSource> next);
    void notify_change();

    // Runs fn on a copy of the source with the given id and publishes the copy.
    template <typename Fn>
    Marquee::Error update_source(const std::string& id, Fn fn, bool notify);
};

} // namespace Catalog
