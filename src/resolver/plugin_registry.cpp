#include "plugin_registry.hpp"
#include <glib.h>
#include <algorithm>
#include <cstring>

namespace Resolver {

using Marquee::Error;
using Marquee::ErrorCode;

namespace {

struct ChecksumPrefix {
    const char* prefix;
    GChecksumType type;
};

const ChecksumPrefix kPrefixes[] = {
    {"md5:", G_CHECKSUM_MD5},
    {"sha1:", G_CHECKSUM_SHA1},
    {"sha256:", G_CHECKSUM_SHA256},
};

bool checksum_type_for(const std::string& declared, GChecksumType& type, std::string& digest) {
    for (const auto& entry : kPrefixes) {
        if (g_str_has_prefix(declared.c_str(), entry.prefix)) {
            type = entry.type;
            digest = declared.substr(strlen(entry.prefix));
            return true;
        }
    }

    digest = declared;
    switch (declared.size()) {
        case 32: type = G_CHECKSUM_MD5; return true;
        case 40: type = G_CHECKSUM_SHA1; return true;
        case 64: type = G_CHECKSUM_SHA256; return true;
        default: return false;
    }
}

void replace_record(std::vector<PluginRecord>& records, PluginRecord record) {
    auto it = std::find_if(records.begin(), records.end(),
                           [&record](const PluginRecord& r) { return r.descriptor.id == record.descriptor.id; });
    if (it != records.end()) {
        *it = std::move(record);
    } else {
        records.push_back(std::move(record));
    }
}

} // namespace

PluginRegistry::PluginRegistry(std::shared_ptr<PluginLoader> loader, const Marquee::Clock& clock)
    : loader_(std::move(loader))
    , clock_(clock)
    , records_(std::make_shared<const std::vector<PluginRecord>>()) {
}

PluginRegistry::Snapshot PluginRegistry::snapshot() const {
    return std::atomic_load_explicit(&records_, std::memory_order_acquire);
}

void PluginRegistry::publish(std::vector<PluginRecord> next) {
    Snapshot snapshot = std::make_shared<const std::vector<PluginRecord>>(std::move(next));
    std::atomic_store_explicit(&records_, std::move(snapshot), std::memory_order_release);
}

std::string PluginRegistry::normalize_checksum(const std::string& checksum) {
    gchar* lower = g_ascii_strdown(checksum.c_str(), -1);
    std::string result = lower;
    g_free(lower);
    return result;
}

bool PluginRegistry::verify_checksum(const std::string& bytes, const std::string& declared, std::string& error) {
    GChecksumType type;
    std::string expected;
    if (!checksum_type_for(normalize_checksum(declared), type, expected)) {
        error = "Unsupported checksum format: " + declared;
        return false;
    }

    gchar* actual = g_compute_checksum_for_data(type,
                                                reinterpret_cast<const guchar*>(bytes.data()),
                                                bytes.size());
    bool match = actual && g_ascii_strcasecmp(actual, expected.c_str()) == 0;
    if (!match) {
        error = std::string("Checksum mismatch: expected ") + expected + ", got " + (actual ? actual : "");
    }
    g_free(actual);
    return match;
}

Error PluginRegistry::load(const PluginDescriptor& descriptor, const std::string& bytes) {
    if (descriptor.id.empty()) {
        return Error(ErrorCode::InvalidArgument, "Plugin id is required");
    }

    std::string checksum = normalize_checksum(descriptor.checksum);

    std::lock_guard<std::mutex> lock(write_mutex_);

    if (frozen_.count({descriptor.id, checksum})) {
        return Error(ErrorCode::PluginChecksum,
                     "Plugin " + descriptor.id + " was rejected for checksum " + descriptor.checksum);
    }

    std::string error;
    if (!verify_checksum(bytes, checksum, error)) {
        g_warning("[Plugins] Rejecting %s: %s", descriptor.id.c_str(), error.c_str());
        frozen_.insert({descriptor.id, checksum});

        std::vector<PluginRecord> next = *snapshot();
        PluginRecord record;
        record.descriptor = descriptor;
        record.state = LoadState::Rejected;
        replace_record(next, std::move(record));
        publish(std::move(next));

        return Error(ErrorCode::PluginChecksum, error);
    }

    if (!loader_) {
        return Error(ErrorCode::PluginLoad, "No plugin loader configured");
    }

    std::string load_error;
    std::shared_ptr<Plugin> plugin = loader_->instantiate(descriptor, bytes, load_error);
    if (!plugin) {
        g_warning("[Plugins] Failed to instantiate %s: %s", descriptor.id.c_str(), load_error.c_str());
        return Error(ErrorCode::PluginLoad,
                     load_error.empty() ? "Failed to instantiate " + descriptor.id : load_error);
    }

    std::vector<PluginRecord> next = *snapshot();
    PluginRecord record;
    record.descriptor = descriptor;
    record.state = LoadState::Loaded;
    record.loaded_at = clock_.now_ms();
    record.plugin = std::move(plugin);
    replace_record(next, std::move(record));
    publish(std::move(next));

    g_info("[Plugins] Loaded %s %s", descriptor.id.c_str(), descriptor.version.c_str());
    return Error();
}

Error PluginRegistry::unload(const std::string& id) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    std::vector<PluginRecord> next = *snapshot();
    auto it = std::find_if(next.begin(), next.end(),
                           [&id](const PluginRecord& r) { return r.descriptor.id == id; });
    if (it == next.end()) {
        return Error(ErrorCode::InvalidArgument, "Unknown plugin: " + id);
    }

    next.erase(it);
    publish(std::move(next));
    g_info("[Plugins] Unloaded %s", id.c_str());
    return Error();
}

std::optional<PluginRecord> PluginRegistry::find(const std::string& id) const {
    for (const auto& record : *snapshot()) {
        if (record.descriptor.id == id) {
            return record;
        }
    }
    return std::nullopt;
}

LoadState PluginRegistry::state(const std::string& id) const {
    auto record = find(id);
    return record ? record->state : LoadState::Unverified;
}

std::vector<PluginRecord> PluginRegistry::list() const {
    return *snapshot();
}

std::vector<PluginRecord> PluginRegistry::loaded_for_format(const std::string& format) const {
    std::vector<PluginRecord> result;
    for (const auto& record : *snapshot()) {
        if (record.state == LoadState::Loaded && record.descriptor.supports(format)) {
            result.push_back(record);
        }
    }

    std::sort(result.begin(), result.end(), [](const PluginRecord& a, const PluginRecord& b) {
        if (a.descriptor.priority != b.descriptor.priority) {
            return a.descriptor.priority > b.descriptor.priority;
        }
        return a.descriptor.id < b.descriptor.id;
    });
    return result;
}

bool PluginRegistry::is_frozen(const std::string& id, const std::string& checksum) const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return frozen_.count({id, normalize_checksum(checksum)}) > 0;
}

} // namespace Resolver
