#include "aggregator.hpp"
#include "marquee/main_loop.hpp"
#include <glib.h>
#include <algorithm>
#include <map>
#include <set>

namespace Catalog {

using Marquee::Error;
using Marquee::ErrorCode;

struct Aggregator::Waiter {
    uint64_t id = 0;
    GCancellable* cancellable = nullptr;
    gulong handler_id = 0;
    DirectoryCallback callback;
};

struct Aggregator::Cycle {
    Aggregator* owner = nullptr;     // cleared when the aggregator goes away
    std::vector<ConfigSource> sources;
    size_t next = 0;
    int in_flight = 0;
    bool pumping = false;
    bool abandoned = false;
    bool finished = false;

    int succeeded = 0;
    std::vector<Contribution> contributions;
    std::vector<SourceFailure> failures;
    std::vector<Waiter> waiters;
};

struct Aggregator::CancelData {
    std::weak_ptr<Cycle> cycle;
    uint64_t waiter_id = 0;
};

Aggregator::Aggregator(Client& client,
                       FragmentCache& fragments,
                       const Scorer& scorer,
                       const Marquee::Clock& clock,
                       SourceRegistry* registry,
                       int max_parallel_fetches,
                       guint fetch_timeout_ms)
    : client_(client)
    , fragments_(fragments)
    , scorer_(scorer)
    , clock_(clock)
    , registry_(registry)
    , max_parallel_fetches_(std::max(1, max_parallel_fetches))
    , fetch_timeout_ms_(fetch_timeout_ms) {
}

Aggregator::~Aggregator() {
    // Abandoned cycles may still have fetches in flight
    for (const auto& cycle : running_) {
        cycle->owner = nullptr;
        cycle->abandoned = true;
        for (auto& waiter : cycle->waiters) {
            release_waiter(waiter);
        }
        cycle->waiters.clear();
    }
}

std::string Aggregator::fragment_key(const std::string& url) {
    return "fragment:" + url;
}

// ============ Waiters ============

void Aggregator::on_cancelled(GCancellable* /*cancellable*/, gpointer user_data) {
    auto* data = static_cast<CancelData*>(user_data);
    std::weak_ptr<Cycle> weak = data->cycle;
    uint64_t waiter_id = data->waiter_id;

    // May run on the cancelling thread; detach on the main context
    Marquee::schedule_idle([weak, waiter_id]() {
        auto cycle = weak.lock();
        if (cycle && cycle->owner) {
            cycle->owner->detach_waiter(cycle, waiter_id);
        }
    });
}

void Aggregator::add_waiter(const std::shared_ptr<Cycle>& cycle,
                            GCancellable* cancellable,
                            DirectoryCallback callback) {
    Waiter waiter;
    waiter.id = ++next_waiter_id_;
    waiter.callback = std::move(callback);

    if (cancellable) {
        waiter.cancellable = G_CANCELLABLE(g_object_ref(cancellable));
        auto* data = new CancelData{cycle, waiter.id};
        waiter.handler_id = g_cancellable_connect(
            cancellable,
            G_CALLBACK(on_cancelled),
            data,
            [](gpointer p) { delete static_cast<CancelData*>(p); });
    }

    cycle->waiters.push_back(std::move(waiter));
}

void Aggregator::release_waiter(Waiter& waiter) {
    if (waiter.cancellable) {
        if (waiter.handler_id != 0) {
            g_cancellable_disconnect(waiter.cancellable, waiter.handler_id);
            waiter.handler_id = 0;
        }
        g_object_unref(waiter.cancellable);
        waiter.cancellable = nullptr;
    }
}

void Aggregator::detach_waiter(const std::shared_ptr<Cycle>& cycle, uint64_t waiter_id) {
    if (cycle->finished) return;

    auto it = std::find_if(cycle->waiters.begin(), cycle->waiters.end(),
                           [waiter_id](const Waiter& w) { return w.id == waiter_id; });
    if (it == cycle->waiters.end()) return;

    Waiter waiter = std::move(*it);
    cycle->waiters.erase(it);
    release_waiter(waiter);

    if (cycle->waiters.empty()) {
        g_info("[Aggregator] All callers cancelled, stopping after %d in-flight fetches", cycle->in_flight);
        cycle->abandoned = true;
        if (cycle_ == cycle) {
            cycle_.reset();
        }
    }

    waiter.callback(nullptr, Error(ErrorCode::Cancelled, "Aggregation cancelled"));

    if (cycle->abandoned && cycle->in_flight == 0) {
        finish_cycle(cycle);
    }
}

// ============ Cycle ============

void Aggregator::aggregate(const std::vector<ConfigSource>& sources,
                           GCancellable* cancellable,
                           DirectoryCallback callback) {
    if (cancellable && g_cancellable_is_cancelled(cancellable)) {
        callback(nullptr, Error(ErrorCode::Cancelled, "Aggregation cancelled"));
        return;
    }

    if (cycle_ && !cycle_->abandoned) {
        g_debug("[Aggregator] Joining running aggregation");
        add_waiter(cycle_, cancellable, std::move(callback));
        return;
    }

    std::vector<ConfigSource> enabled;
    for (const auto& source : sources) {
        if (source.enabled) {
            enabled.push_back(source);
        }
    }

    cycles_started_++;

    if (enabled.empty()) {
        auto directory = std::make_shared<AggregatedDirectory>();
        directory->generated_at = clock_.now_ms();
        g_info("[Aggregator] No enabled sources, directory is empty");
        callback(directory, Error());
        return;
    }

    auto cycle = std::make_shared<Cycle>();
    cycle->owner = this;
    cycle->sources = std::move(enabled);
    cycle_ = cycle;
    running_.insert(cycle);

    g_info("[Aggregator] Aggregating %zu sources", cycle->sources.size());

    add_waiter(cycle, cancellable, std::move(callback));
    pump(cycle);
}

void Aggregator::pump(const std::shared_ptr<Cycle>& cycle) {
    // Cached fragments complete synchronously and re-enter here
    if (cycle->pumping) return;
    cycle->pumping = true;

    while (!cycle->abandoned &&
           cycle->in_flight < max_parallel_fetches_ &&
           cycle->next < cycle->sources.size()) {
        size_t index = cycle->next++;
        cycle->in_flight++;
        start_fetch(cycle, index);
    }

    cycle->pumping = false;

    bool exhausted = cycle->abandoned || cycle->next >= cycle->sources.size();
    if (exhausted && cycle->in_flight == 0) {
        finish_cycle(cycle);
    }
}

void Aggregator::start_fetch(const std::shared_ptr<Cycle>& cycle, size_t index) {
    ConfigSource source = cycle->sources[index];
    guint timeout_ms = fetch_timeout_ms_;

    FragmentCache::Producer producer = [this, source, timeout_ms](FragmentCache::ProduceCallback done) {
        client_.fetch_and_parse(source, timeout_ms, nullptr,
                                [done](std::optional<CatalogFragment> fragment, const Error& error) {
            if (!fragment) {
                done(nullptr, error);
                return;
            }
            done(std::make_shared<const CatalogFragment>(std::move(*fragment)), Error());
        });
    };

    fragments_.get(fragment_key(source.url), std::move(producer),
                   [cycle, index](const FragmentCache::Lookup& lookup, const Error& error) {
        if (cycle->owner) {
            cycle->owner->on_fragment(cycle, index, lookup, error);
        }
    });
}

void Aggregator::on_fragment(const std::shared_ptr<Cycle>& cycle,
                             size_t index,
                             const FragmentCache::Lookup& lookup,
                             const Error& error) {
    cycle->in_flight--;

    const ConfigSource& requested = cycle->sources[index];

    if (error) {
        SourceFailure failure;
        failure.source_id = requested.id;
        failure.source_url = requested.url;
        failure.code = error.code;
        failure.message = error.message;
        cycle->failures.push_back(std::move(failure));
    } else {
        Contribution contribution;
        // Scores use the health state recorded by the fetch
        contribution.source = requested;
        if (registry_) {
            if (auto current = registry_->get(requested.id)) {
                contribution.source = *current;
            }
        }
        contribution.fragment = lookup.payload;
        cycle->contributions.push_back(std::move(contribution));

        if (lookup.stale) {
            SourceFailure failure;
            failure.source_id = requested.id;
            failure.source_url = requested.url;
            failure.code = lookup.refresh_error.code;
            failure.message = lookup.refresh_error.message;
            failure.served_stale = true;
            cycle->failures.push_back(std::move(failure));
        } else {
            cycle->succeeded++;
        }
    }

    pump(cycle);
}

void Aggregator::finish_cycle(const std::shared_ptr<Cycle>& cycle) {
    if (cycle->finished) return;
    cycle->finished = true;
    running_.erase(cycle);

    if (cycle_ == cycle) {
        cycle_.reset();
    }

    if (cycle->abandoned) {
        return;
    }

    std::vector<Waiter> waiters = std::move(cycle->waiters);
    for (auto& waiter : waiters) {
        release_waiter(waiter);
    }

    if (cycle->succeeded == 0) {
        std::string message = "All " + std::to_string(cycle->sources.size()) + " sources failed";
        if (!cycle->failures.empty()) {
            message += " (first: " + cycle->failures.front().message + ")";
        }
        g_warning("[Aggregator] %s", message.c_str());

        Error error(ErrorCode::AggregationFailed, message);
        for (auto& waiter : waiters) {
            waiter.callback(nullptr, error);
        }
        return;
    }

    int64_t now = clock_.now_ms();
    for (auto& contribution : cycle->contributions) {
        contribution.score = scorer_.score(contribution.source, *contribution.fragment, now);
    }

    auto directory = std::make_shared<AggregatedDirectory>(merge(std::move(cycle->contributions), now));
    directory->failures = std::move(cycle->failures);

    g_info("[Aggregator] Directory built: %d unique sites from %d sources, %zu failures",
           directory->unique_site_count(), directory->source_count, directory->failures.size());

    DirectoryPtr result = directory;
    for (auto& waiter : waiters) {
        waiter.callback(result, Error());
    }
}

// ============ Merge ============

bool Aggregator::outranks(const Contribution& a, const Contribution& b) {
    if (a.source.priority != b.source.priority) {
        return a.source.priority > b.source.priority;
    }
    if (a.score.quality != b.score.quality) {
        return a.score.quality > b.score.quality;
    }
    if (a.source.last_fetched_at != b.source.last_fetched_at) {
        return a.source.last_fetched_at > b.source.last_fetched_at;
    }
    if (a.source.is_primary != b.source.is_primary) {
        return a.source.is_primary;
    }
    return a.source.id < b.source.id;
}

AggregatedDirectory Aggregator::merge(std::vector<Contribution> contributions, int64_t now) {
    std::stable_sort(contributions.begin(), contributions.end(), outranks);

    AggregatedDirectory directory;
    directory.generated_at = now;

    std::map<std::string, size_t> site_index;
    std::set<std::string> resolver_names;
    std::set<std::string> rule_names;
    std::set<std::string> live_names;

    for (const auto& contribution : contributions) {
        if (!contribution.fragment) continue;
        const CatalogFragment& fragment = *contribution.fragment;
        directory.source_count++;

        std::set<std::string> seen_here;
        for (const auto& site : fragment.sites) {
            directory.total_site_count++;

            // Duplicate key inside one fragment: the first occurrence wins
            if (!seen_here.insert(site.key).second) continue;

            auto it = site_index.find(site.key);
            if (it != site_index.end()) {
                AggregatedSiteEntry& existing = directory.sites[it->second];
                existing.origin_urls.insert(contribution.source.url);
                existing.last_seen = std::max(existing.last_seen, fragment.fetched_at);
                continue;
            }

            AggregatedSiteEntry entry;
            entry.site = site;
            entry.origin_urls.insert(contribution.source.url);
            entry.quality_score = contribution.score.quality;
            entry.reliability_score = contribution.score.reliability;
            entry.last_seen = fragment.fetched_at;
            entry.source_id = contribution.source.id;

            site_index[site.key] = directory.sites.size();
            directory.sites.push_back(std::move(entry));
        }

        for (const auto& resolver : fragment.resolvers) {
            if (resolver_names.insert(resolver.name).second) {
                directory.resolvers.push_back(resolver);
            }
        }
        for (const auto& rule : fragment.rules) {
            if (rule_names.insert(rule.name).second) {
                directory.rules.push_back(rule);
            }
        }
        for (const auto& live : fragment.lives) {
            if (live_names.insert(live.name).second) {
                directory.lives.push_back(live);
            }
        }
    }

    directory.categories = build_categories(directory.sites);
    return directory;
}

} // namespace Catalog
