#include "source_registry.hpp"
#include <glib.h>
#include <algorithm>

namespace Catalog {

using Marquee::Error;
using Marquee::ErrorCode;

namespace {

std::vector<ConfigSource>::iterator find_source(std::vector<ConfigSource>& sources, const std::string& id) {
    return std::find_if(sources.begin(), sources.end(),
                        [&id](const ConfigSource& source) { return source.id == id; });
}

Error unknown_source(const std::string& id) {
    return Error(ErrorCode::UnknownSource, "Unknown source: " + id);
}

} // namespace

SourceRegistry::SourceRegistry()
    : sources_(std::make_shared<const std::vector<ConfigSource>>()) {
}

SourceRegistry::Snapshot SourceRegistry::snapshot() const {
    return std::atomic_load_explicit(&sources_, std::memory_order_acquire);
}

void SourceRegistry::publish(std::vector<ConfigSource> next) {
    Snapshot snapshot = std::make_shared<const std::vector<ConfigSource>>(std::move(next));
    std::atomic_store_explicit(&sources_, std::move(snapshot), std::memory_order_release);
}

std::vector<ConfigSource> SourceRegistry::all() const {
    return *snapshot();
}

std::vector<ConfigSource> SourceRegistry::enabled_sources() const {
    std::vector<ConfigSource> enabled;
    for (const auto& source : *snapshot()) {
        if (source.enabled) {
            enabled.push_back(source);
        }
    }
    return enabled;
}

std::optional<ConfigSource> SourceRegistry::get(const std::string& id) const {
    for (const auto& source : *snapshot()) {
        if (source.id == id) {
            return source;
        }
    }
    return std::nullopt;
}

std::optional<ConfigSource> SourceRegistry::primary() const {
    for (const auto& source : *snapshot()) {
        if (source.is_primary) {
            return source;
        }
    }
    return std::nullopt;
}

size_t SourceRegistry::size() const {
    return snapshot()->size();
}

template <typename Fn>
Error SourceRegistry::update_source(const std::string& id, Fn fn, bool notify) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);

        std::vector<ConfigSource> next = *snapshot();
        auto it = find_source(next, id);
        if (it == next.end()) {
            return unknown_source(id);
        }

        fn(*it);
        publish(std::move(next));
    }

    if (notify) {
        notify_change();
    }
    return Error();
}

Error SourceRegistry::add(ConfigSource source) {
    if (source.id.empty() || source.url.empty()) {
        return Error(ErrorCode::InvalidArgument, "Source id and url are required");
    }

    {
        std::lock_guard<std::mutex> lock(write_mutex_);

        std::vector<ConfigSource> next = *snapshot();
        for (const auto& existing : next) {
            if (existing.id == source.id) {
                return Error(ErrorCode::DuplicateSource, "Source already registered: " + source.id);
            }
            if (existing.url == source.url) {
                return Error(ErrorCode::DuplicateSource, "URL already registered: " + source.url);
            }
        }

        if (source.is_primary) {
            for (auto& existing : next) {
                existing.is_primary = false;
            }
        }

        g_info("[Registry] Added source %s (%s)", source.id.c_str(), source.url.c_str());
        next.push_back(std::move(source));
        publish(std::move(next));
    }

    notify_change();
    return Error();
}

Error SourceRegistry::remove(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);

        std::vector<ConfigSource> next = *snapshot();
        auto it = find_source(next, id);
        if (it == next.end()) {
            return unknown_source(id);
        }

        next.erase(it);
        publish(std::move(next));
    }

    g_info("[Registry] Removed source %s", id.c_str());
    notify_change();
    return Error();
}

Error SourceRegistry::set_enabled(const std::string& id, bool enabled) {
    return update_source(id, [enabled](ConfigSource& source) {
        source.enabled = enabled;
    }, true);
}

Error SourceRegistry::set_primary(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);

        std::vector<ConfigSource> next = *snapshot();
        if (find_source(next, id) == next.end()) {
            return unknown_source(id);
        }

        for (auto& source : next) {
            source.is_primary = (source.id == id);
        }
        publish(std::move(next));
    }

    notify_change();
    return Error();
}

Error SourceRegistry::set_priority(const std::string& id, int priority) {
    return update_source(id, [priority](ConfigSource& source) {
        source.priority = priority;
    }, true);
}

Error SourceRegistry::move(const std::string& id, int direction) {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);

        std::vector<ConfigSource> next = *snapshot();
        auto it = find_source(next, id);
        if (it == next.end()) {
            return unknown_source(id);
        }

        size_t index = static_cast<size_t>(std::distance(next.begin(), it));
        size_t new_index = index;

        if (direction < 0 && index > 0) {
            new_index = index - 1;
        } else if (direction > 0 && index + 1 < next.size()) {
            new_index = index + 1;
        } else {
            return Error(ErrorCode::InvalidArgument, "Cannot move source " + id);
        }

        std::swap(next[index], next[new_index]);
        publish(std::move(next));
    }

    notify_change();
    return Error();
}

void SourceRegistry::replace_all(std::vector<ConfigSource> sources) {
    bool seen_primary = false;
    for (auto& source : sources) {
        if (!source.is_primary) continue;
        if (seen_primary) {
            g_warning("[Registry] Clearing extra primary flag on %s", source.id.c_str());
            source.is_primary = false;
        }
        seen_primary = true;
    }

    std::lock_guard<std::mutex> lock(write_mutex_);
    publish(std::move(sources));
}

Error SourceRegistry::record_fetch(const std::string& id,
                                   const FetchRecord& record,
                                   int failure_threshold,
                                   int history_limit) {
    return update_source(id, [&](ConfigSource& source) {
        source.history.push_back(record);
        if (history_limit > 0 && source.history.size() > static_cast<size_t>(history_limit)) {
            source.history.erase(source.history.begin(),
                                 source.history.end() - history_limit);
        }

        if (record.success) {
            source.consecutive_failures = 0;
            source.health_status = HealthStatus::Healthy;
            source.last_fetched_at = record.at;
            return;
        }

        source.consecutive_failures++;
        if (source.consecutive_failures >= failure_threshold) {
            if (source.health_status != HealthStatus::Error) {
                g_warning("[Registry] Source %s marked unhealthy after %d failures",
                          source.id.c_str(), source.consecutive_failures);
            }
            source.health_status = HealthStatus::Error;
        } else {
            source.health_status = HealthStatus::Warning;
        }
    }, false);
}

void SourceRegistry::on_changed(ChangedCallback callback) {
    change_callbacks_.push_back(std::move(callback));
}

void SourceRegistry::notify_change() {
    for (const auto& callback : change_callbacks_) {
        callback();
    }
}

} // namespace Catalog
