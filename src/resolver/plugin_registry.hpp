#pragma once

#include "resolver_types.hpp"
#include "marquee/clock.hpp"
#include "marquee/error.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace Resolver {

/**
 * Registry of resolver plugins.
 *
 * Plugin bytes are verified against the declared checksum before the loader
 * sees them. A mismatch rejects the plugin and freezes the (id, checksum)
 * pair: loading it again fails without looking at the bytes.
 *
 * Readers work on the last published snapshot, so a resolution in progress
 * keeps its plugin reference after unload().
 */
class PluginRegistry {
public:
    using Snapshot = std::shared_ptr<const std::vector<PluginRecord>>;

    PluginRegistry(std::shared_ptr<PluginLoader> loader, const Marquee::Clock& clock);

    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    /**
     * Verify and load a plugin. Replaces a loaded plugin with the same id.
     * @return PluginChecksum on mismatch or frozen pair, PluginLoad when the
     *         loader fails, InvalidArgument for an empty id
     */
    Marquee::Error load(const PluginDescriptor& descriptor, const std::string& bytes);

    Marquee::Error unload(const std::string& id);

    std::optional<PluginRecord> find(const std::string& id) const;

    // Unverified for unknown ids
    LoadState state(const std::string& id) const;

    std::vector<PluginRecord> list() const;

    /**
     * Loaded plugins supporting format, by descending priority then id
     */
    std::vector<PluginRecord> loaded_for_format(const std::string& format) const;

    bool is_frozen(const std::string& id, const std::string& checksum) const;

    Snapshot snapshot() const;

    /**
     * Compare bytes against a hex digest. The algorithm comes from an
     * "md5:", "sha1:" or "sha256:" prefix, else from the digest length.
     */
    static bool verify_checksum(const std::string& bytes, const std::string& declared, std::string& error);

private:
    std::shared_ptr<PluginLoader> loader_;
    const Marquee::Clock& clock_;

    Snapshot records_;
    mutable std::mutex write_mutex_;
    std::set<std::pair<std::string, std::string>> frozen_;

    void publish(std::vector<PluginRecord> next);
    static std::string normalize_checksum(const std::string& checksum);
};

} // namespace Resolver
