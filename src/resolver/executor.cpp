#include "executor.hpp"
#include "marquee/main_loop.hpp"
#include <glib.h>
#include <set>

namespace Resolver {

using Marquee::Error;
using Marquee::ErrorCode;

struct Executor::Attempt {
    GCancellable* cancellable = nullptr;
    guint timeout_id = 0;
    bool done = false;

    ~Attempt() {
        if (cancellable) {
            g_object_unref(cancellable);
        }
    }
};

struct Executor::Run {
    ResolveRequest request;
    std::vector<PluginRecord> chain;
    size_t index = 0;
    int tries = 0;
    gint64 plugin_started_us = 0;

    GCancellable* cancellable = nullptr;
    ResultCallback callback;
    ResolutionResult result;

    ~Run() {
        if (cancellable) {
            g_object_unref(cancellable);
        }
    }
};

Executor::Executor(const PluginRegistry& registry, guint attempt_timeout_ms, int retries_on_timeout)
    : registry_(registry)
    , attempt_timeout_ms_(attempt_timeout_ms)
    , retries_on_timeout_(retries_on_timeout) {
}

Executor::~Executor() {
    // Calls still running answer into attempts marked done
    std::set<std::shared_ptr<Attempt>> attempts = std::move(attempts_);
    for (const auto& attempt : attempts) {
        attempt->done = true;
        Marquee::cancel_source(attempt->timeout_id);
        g_cancellable_cancel(attempt->cancellable);
    }
}

ResolveRequest Executor::build_request(const Catalog::AggregatedSiteEntry& entry,
                                       const std::optional<Catalog::ResolverHint>& hint) {
    ResolveRequest request;
    request.entry = entry;
    request.format = entry.site.kind;
    request.headers = entry.site.headers;

    // Site hint first, caller hint overrides it
    const auto& site_hint = entry.site.resolver_hint;
    if (site_hint) {
        if (site_hint->format) request.format = *site_hint->format;
        for (const auto& [name, value] : site_hint->headers) {
            request.headers[name] = value;
        }
    }
    if (hint) {
        if (hint->format) request.format = *hint->format;
        for (const auto& [name, value] : hint->headers) {
            request.headers[name] = value;
        }
    }

    return request;
}

std::vector<PluginRecord> Executor::build_chain(const Catalog::AggregatedSiteEntry& entry,
                                                const std::optional<Catalog::ResolverHint>& hint) const {
    const std::vector<std::string>* explicit_ids = nullptr;
    if (hint && !hint->fallback_parsers.empty()) {
        explicit_ids = &hint->fallback_parsers;
    } else if (entry.site.resolver_hint && !entry.site.resolver_hint->fallback_parsers.empty()) {
        explicit_ids = &entry.site.resolver_hint->fallback_parsers;
    }

    if (!explicit_ids) {
        return registry_.loaded_for_format(build_request(entry, hint).format);
    }

    std::vector<PluginRecord> chain;
    std::set<std::string> seen;
    for (const auto& id : *explicit_ids) {
        if (!seen.insert(id).second) continue;

        auto record = registry_.find(id);
        if (!record || record->state != LoadState::Loaded || !record->plugin) {
            g_debug("[Executor] Skipping unavailable plugin %s", id.c_str());
            continue;
        }
        chain.push_back(std::move(*record));
    }
    return chain;
}

void Executor::resolve(const Catalog::AggregatedSiteEntry& entry,
                       const std::optional<Catalog::ResolverHint>& hint,
                       GCancellable* cancellable,
                       ResultCallback callback) {
    auto run = std::make_shared<Run>();
    run->request = build_request(entry, hint);
    run->chain = build_chain(entry, hint);
    run->callback = std::move(callback);
    if (cancellable) {
        run->cancellable = G_CANCELLABLE(g_object_ref(cancellable));
    }

    if (run->chain.empty()) {
        g_info("[Executor] No resolver available for %s (%s)",
               entry.site.key.c_str(), run->request.format.c_str());
        finish(run, ResolutionState::Exhausted,
               Error(ErrorCode::NoResolverAvailable, "No resolver available for " + entry.site.key));
        return;
    }

    next_attempt(run);
}

void Executor::next_attempt(const std::shared_ptr<Run>& run) {
    if (run->cancellable && g_cancellable_is_cancelled(run->cancellable)) {
        finish(run, ResolutionState::Cancelled, Error(ErrorCode::Cancelled, "Resolution cancelled"));
        return;
    }

    if (run->index >= run->chain.size()) {
        finish(run, ResolutionState::Exhausted,
               Error(ErrorCode::ResolutionExhausted,
                     "All " + std::to_string(run->chain.size()) + " resolvers failed for " +
                     run->request.entry.site.key));
        return;
    }

    run->result.state = ResolutionState::Attempting;
    run->tries = 0;
    run->plugin_started_us = g_get_monotonic_time();
    try_plugin(run);
}

void Executor::try_plugin(const std::shared_ptr<Run>& run) {
    const std::string& id = run->chain[run->index].descriptor.id;

    // Unloaded plugins get no new calls, retries included
    auto record = registry_.find(id);
    if (!record || record->state != LoadState::Loaded || !record->plugin) {
        if (run->tries > 0) {
            log_attempt(run, AttemptOutcome::Timeout,
                        "Timed out after " + std::to_string(attempt_timeout_ms_) + " ms, unloaded before retry");
        } else {
            g_info("[Executor] Skipping %s, unloaded since the chain was built", id.c_str());
        }
        run->index++;
        next_attempt(run);
        return;
    }

    run->tries++;

    g_debug("[Executor] Trying %s for %s (try %d)",
            id.c_str(), run->request.entry.site.key.c_str(), run->tries);

    auto attempt = std::make_shared<Attempt>();
    attempt->cancellable = g_cancellable_new();
    attempts_.insert(attempt);

    attempt->timeout_id = Marquee::schedule_timeout(attempt_timeout_ms_, [this, run, attempt]() {
        attempt->timeout_id = 0;
        if (attempt->done) return;
        attempt->done = true;
        attempts_.erase(attempt);

        g_cancellable_cancel(attempt->cancellable);
        on_timeout(run);
    });

    // The call keeps its plugin alive even if it is unloaded meanwhile
    std::shared_ptr<Plugin> plugin = record->plugin;
    plugin->resolve(run->request, attempt->cancellable, [this, run, attempt](const PluginResponse& response) {
        if (attempt->done) return;
        attempt->done = true;
        attempts_.erase(attempt);
        Marquee::cancel_source(attempt->timeout_id);

        on_response(run, response);
    });
}

void Executor::on_timeout(const std::shared_ptr<Run>& run) {
    if (run->tries <= retries_on_timeout_) {
        g_info("[Executor] %s timed out, retrying", run->chain[run->index].descriptor.id.c_str());
        try_plugin(run);
        return;
    }

    log_attempt(run, AttemptOutcome::Timeout,
                "Timed out after " + std::to_string(attempt_timeout_ms_) + " ms");
    run->index++;
    next_attempt(run);
}

void Executor::on_response(const std::shared_ptr<Run>& run, const PluginResponse& response) {
    switch (response.status) {
        case PluginStatus::Success:
            log_attempt(run, AttemptOutcome::Success, response.message);
            run->result.success = true;
            run->result.plugin_id = run->chain[run->index].descriptor.id;
            run->result.stream = response.stream;
            finish(run, ResolutionState::Succeeded, Error());
            return;
        case PluginStatus::NoMatch:
            log_attempt(run, AttemptOutcome::NoMatch, response.message);
            break;
        case PluginStatus::Error:
            log_attempt(run, AttemptOutcome::Error, response.message);
            break;
    }

    run->index++;
    next_attempt(run);
}

void Executor::log_attempt(const std::shared_ptr<Run>& run, AttemptOutcome outcome, const std::string& message) {
    ResolutionAttempt attempt;
    attempt.plugin_id = run->chain[run->index].descriptor.id;
    attempt.outcome = outcome;
    attempt.elapsed_ms = (g_get_monotonic_time() - run->plugin_started_us) / 1000;
    attempt.tries = run->tries;
    attempt.message = message;

    if (outcome != AttemptOutcome::Success) {
        g_info("[Executor] %s: %s %s", attempt.plugin_id.c_str(),
               attempt_outcome_to_string(outcome), message.c_str());
    }

    run->result.attempts.push_back(std::move(attempt));
}

void Executor::finish(const std::shared_ptr<Run>& run, ResolutionState state, const Error& error) {
    run->result.state = state;
    run->result.error = error;
    if (state != ResolutionState::Succeeded) {
        run->result.success = false;
    }

    ResultCallback callback = std::move(run->callback);
    if (callback) {
        callback(run->result);
    }
}

} // namespace Resolver
