#pragma once

#include "plugin_registry.hpp"
#include "resolver_types.hpp"
#include "catalog/catalog_types.hpp"
#include <gio/gio.h>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <vector>

namespace Resolver {

/**
 * Runs a site entry through a chain of resolver plugins until one succeeds.
 *
 * The chain is the explicit fallback list from the hint or the entry when
 * there is one, otherwise every loaded plugin supporting the entry format.
 * Attempts run one after another, each bounded by the attempt timeout; a
 * plugin that times out is retried up to retries_on_timeout times.
 * Eligibility is checked again before every call, so a plugin unloaded
 * while a resolution runs is not called again. The callback always receives
 * a result, also on exhaustion. Destroying the executor drops pending
 * resolutions without calling back.
 */
class Executor {
public:
    using ResultCallback = std::function<void(const ResolutionResult& result)>;

    Executor(const PluginRegistry& registry, guint attempt_timeout_ms, int retries_on_timeout);
    ~Executor();

    Executor(const Executor&) = delete;
    Executor& operator=(const Executor&) = delete;

    /**
     * Resolve a directory entry to a playable stream.
     * @param hint Overrides the entry's fallback list, format and headers
     * @param cancellable Checked before each attempt, may be null
     */
    void resolve(const Catalog::AggregatedSiteEntry& entry,
                 const std::optional<Catalog::ResolverHint>& hint,
                 GCancellable* cancellable,
                 ResultCallback callback);

    std::vector<PluginRecord> build_chain(const Catalog::AggregatedSiteEntry& entry,
                                          const std::optional<Catalog::ResolverHint>& hint) const;

    static ResolveRequest build_request(const Catalog::AggregatedSiteEntry& entry,
                                        const std::optional<Catalog::ResolverHint>& hint);

private:
    struct Run;
    struct Attempt;

    const PluginRegistry& registry_;
    guint attempt_timeout_ms_;
    int retries_on_timeout_;
    std::set<std::shared_ptr<Attempt>> attempts_;   // calls in flight

    void next_attempt(const std::shared_ptr<Run>& run);
    void try_plugin(const std::shared_ptr<Run>& run);
    void on_timeout(const std::shared_ptr<Run>& run);
    void on_response(const std::shared_ptr<Run>& run, const PluginResponse& response);
    void log_attempt(const std::shared_ptr<Run>& run, AttemptOutcome outcome, const std::string& message);
    void finish(const std::shared_ptr<Run>& run, ResolutionState state, const Marquee::Error& error);
};

} // namespace Resolver
