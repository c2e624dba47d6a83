#pragma once

#include "catalog/catalog_types.hpp"
#include "marquee/error.hpp"
#include <gio/gio.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Resolver {

/**
 * Declared identity of a resolver plugin
 */
struct PluginDescriptor {
    std::string id;
    std::string name;
    std::string version;
    std::vector<std::string> supported_formats;   // site kinds, e.g. "video_api"
    std::string checksum;                         // hex digest, optional "sha256:" style prefix
    int priority = 0;

    bool supports(const std::string& format) const {
        for (const auto& f : supported_formats) {
            if (f == format) return true;
        }
        return false;
    }
};

enum class LoadState {
    Unverified,
    Loaded,
    Rejected,
};

const char* load_state_to_string(LoadState state);

/**
 * DRM information attached to a resolved stream
 */
struct DrmDescriptor {
    std::string scheme;        // e.g. "widevine"
    std::string license_url;
    std::map<std::string, std::string> headers;
};

/**
 * Playable stream produced by a plugin
 */
struct StreamDescriptor {
    std::vector<std::string> urls;
    std::map<std::string, std::string> headers;
    std::optional<DrmDescriptor> drm;
};

enum class PluginStatus {
    Success,
    NoMatch,     // plugin does not handle this entry
    Error,
};

struct PluginResponse {
    PluginStatus status = PluginStatus::Error;
    StreamDescriptor stream;
    std::string message;
};

/**
 * What a plugin is asked to resolve
 */
struct ResolveRequest {
    Catalog::AggregatedSiteEntry entry;
    std::string format;                           // entry kind or hint override
    std::map<std::string, std::string> headers;   // site headers merged with hint headers
};

/**
 * Executable body of a resolver plugin
 */
class Plugin {
public:
    using ResponseCallback = std::function<void(const PluginResponse& response)>;

    virtual ~Plugin() = default;

    /**
     * Resolve a request. Implementations call the callback once on the main
     * context and should stop work when the cancellable fires.
     */
    virtual void resolve(const ResolveRequest& request,
                         GCancellable* cancellable,
                         ResponseCallback callback) = 0;
};

/**
 * Turns verified plugin bytes into an executable Plugin
 */
class PluginLoader {
public:
    virtual ~PluginLoader() = default;

    /**
     * @param error Set when instantiation fails
     * @return The plugin, or nullptr on failure
     */
    virtual std::shared_ptr<Plugin> instantiate(const PluginDescriptor& descriptor,
                                                const std::string& bytes,
                                                std::string& error) = 0;
};

struct PluginRecord {
    PluginDescriptor descriptor;
    LoadState state = LoadState::Unverified;
    int64_t loaded_at = 0;
    std::shared_ptr<Plugin> plugin;   // set only when Loaded
};

enum class AttemptOutcome {
    Success,
    Timeout,
    NoMatch,
    Error,
};

const char* attempt_outcome_to_string(AttemptOutcome outcome);

/**
 * One plugin's try at resolving an entry. A plugin retried after a timeout
 * is logged as a single attempt with tries = 2.
 */
struct ResolutionAttempt {
    std::string plugin_id;
    AttemptOutcome outcome = AttemptOutcome::Error;
    int64_t elapsed_ms = 0;
    int tries = 1;
    std::string message;
};

enum class ResolutionState {
    Pending,
    Attempting,
    Succeeded,
    Exhausted,
    Cancelled,
};

const char* resolution_state_to_string(ResolutionState state);

struct ResolutionResult {
    bool success = false;
    ResolutionState state = ResolutionState::Pending;
    std::vector<ResolutionAttempt> attempts;
    std::string plugin_id;          // winning plugin
    StreamDescriptor stream;
    Marquee::Error error;
};

} // namespace Resolver
