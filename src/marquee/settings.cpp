#include "settings.hpp"
#include "blob_store.hpp"
#include <json-glib/json-glib.h>
#include <glib.h>
#include <algorithm>

namespace Marquee {

namespace {

void read_members(JsonObject* obj, Settings& settings) {
    if (json_object_has_member(obj, "max_parallel_fetches"))
        settings.max_parallel_fetches = static_cast<int>(json_object_get_int_member(obj, "max_parallel_fetches"));
    if (json_object_has_member(obj, "fetch_timeout_ms"))
        settings.fetch_timeout_ms = static_cast<int>(json_object_get_int_member(obj, "fetch_timeout_ms"));
    if (json_object_has_member(obj, "failure_threshold"))
        settings.failure_threshold = static_cast<int>(json_object_get_int_member(obj, "failure_threshold"));
    if (json_object_has_member(obj, "history_window"))
        settings.history_window = static_cast<int>(json_object_get_int_member(obj, "history_window"));
    if (json_object_has_member(obj, "history_decay"))
        settings.history_decay = json_object_get_double_member(obj, "history_decay");
    if (json_object_has_member(obj, "staleness_threshold_ms"))
        settings.staleness_threshold_ms = json_object_get_int_member(obj, "staleness_threshold_ms");
    if (json_object_has_member(obj, "fragment_ttl_ms"))
        settings.fragment_ttl_ms = json_object_get_int_member(obj, "fragment_ttl_ms");
    if (json_object_has_member(obj, "directory_ttl_ms"))
        settings.directory_ttl_ms = json_object_get_int_member(obj, "directory_ttl_ms");
    if (json_object_has_member(obj, "resolve_timeout_ms"))
        settings.resolve_timeout_ms = static_cast<int>(json_object_get_int_member(obj, "resolve_timeout_ms"));
    if (json_object_has_member(obj, "resolve_retries_on_timeout"))
        settings.resolve_retries_on_timeout = static_cast<int>(json_object_get_int_member(obj, "resolve_retries_on_timeout"));
    if (json_object_has_member(obj, "user_agent")) {
        const char* s = json_object_get_string_member(obj, "user_agent");
        if (s && *s) settings.user_agent = s;
    }
}

Settings from_parser(JsonParser* parser) {
    Settings settings;

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        g_warning("[Settings] Settings root is not an object, using defaults");
        return settings;
    }

    read_members(json_node_get_object(root), settings);
    settings.normalize();
    return settings;
}

} // namespace

void Settings::normalize() {
    if (max_parallel_fetches < 1) {
        g_warning("[Settings] max_parallel_fetches %d out of range, using 1", max_parallel_fetches);
        max_parallel_fetches = 1;
    }
    if (fetch_timeout_ms < 1) {
        g_warning("[Settings] fetch_timeout_ms %d out of range, using 10000", fetch_timeout_ms);
        fetch_timeout_ms = 10 * 1000;
    }
    if (failure_threshold < 1) {
        g_warning("[Settings] failure_threshold %d out of range, using 1", failure_threshold);
        failure_threshold = 1;
    }
    if (history_window < 1) {
        g_warning("[Settings] history_window %d out of range, using 1", history_window);
        history_window = 1;
    }
    if (history_decay <= 0.0 || history_decay > 1.0) {
        g_warning("[Settings] history_decay %.3f out of range, using 0.9", history_decay);
        history_decay = 0.9;
    }
    if (staleness_threshold_ms < 1) {
        g_warning("[Settings] staleness_threshold_ms out of range, using 7 days");
        staleness_threshold_ms = 7LL * 24 * 60 * 60 * 1000;
    }
    if (fragment_ttl_ms < 0) fragment_ttl_ms = 0;
    if (directory_ttl_ms < 0) directory_ttl_ms = 0;
    if (directory_ttl_ms > fragment_ttl_ms) {
        g_warning("[Settings] directory_ttl_ms (%" G_GINT64_FORMAT ") exceeds fragment_ttl_ms (%" G_GINT64_FORMAT "), clamping",
                  directory_ttl_ms, fragment_ttl_ms);
        directory_ttl_ms = fragment_ttl_ms;
    }
    if (resolve_timeout_ms < 1) {
        g_warning("[Settings] resolve_timeout_ms %d out of range, using 8000", resolve_timeout_ms);
        resolve_timeout_ms = 8 * 1000;
    }
    resolve_retries_on_timeout = std::clamp(resolve_retries_on_timeout, 0, 1);
}

std::string Settings::default_path() {
    return FileBlobStore::default_directory() + "/settings.json";
}

Settings Settings::load_from_file(const std::string& path) {
    g_autoptr(JsonParser) parser = json_parser_new();
    g_autoptr(GError) error = nullptr;

    if (!json_parser_load_from_file(parser, path.c_str(), &error)) {
        g_info("[Settings] No settings loaded from %s: %s",
               path.c_str(), error ? error->message : "unknown error");
        return Settings{};
    }

    return from_parser(parser);
}

Settings Settings::load_from_data(const std::string& json) {
    g_autoptr(JsonParser) parser = json_parser_new();
    g_autoptr(GError) error = nullptr;

    if (!json_parser_load_from_data(parser, json.c_str(), static_cast<gssize>(json.length()), &error)) {
        g_warning("[Settings] Failed to parse settings: %s", error->message);
        return Settings{};
    }

    return from_parser(parser);
}

bool Settings::save_to_file(const std::string& path) const {
    g_autoptr(JsonBuilder) builder = json_builder_new();

    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "max_parallel_fetches");
    json_builder_add_int_value(builder, max_parallel_fetches);

    json_builder_set_member_name(builder, "fetch_timeout_ms");
    json_builder_add_int_value(builder, fetch_timeout_ms);

    json_builder_set_member_name(builder, "failure_threshold");
    json_builder_add_int_value(builder, failure_threshold);

    json_builder_set_member_name(builder, "history_window");
    json_builder_add_int_value(builder, history_window);

    json_builder_set_member_name(builder, "history_decay");
    json_builder_add_double_value(builder, history_decay);

    json_builder_set_member_name(builder, "staleness_threshold_ms");
    json_builder_add_int_value(builder, staleness_threshold_ms);

    json_builder_set_member_name(builder, "fragment_ttl_ms");
    json_builder_add_int_value(builder, fragment_ttl_ms);

    json_builder_set_member_name(builder, "directory_ttl_ms");
    json_builder_add_int_value(builder, directory_ttl_ms);

    json_builder_set_member_name(builder, "resolve_timeout_ms");
    json_builder_add_int_value(builder, resolve_timeout_ms);

    json_builder_set_member_name(builder, "resolve_retries_on_timeout");
    json_builder_add_int_value(builder, resolve_retries_on_timeout);

    json_builder_set_member_name(builder, "user_agent");
    json_builder_add_string_value(builder, user_agent.c_str());

    json_builder_end_object(builder);

    g_autoptr(JsonNode) root = json_builder_get_root(builder);
    g_autoptr(JsonGenerator) gen = json_generator_new();
    json_generator_set_pretty(gen, TRUE);
    json_generator_set_root(gen, root);

    g_autoptr(GError) error = nullptr;
    if (!json_generator_to_file(gen, path.c_str(), &error)) {
        g_warning("[Settings] Failed to save settings: %s", error->message);
        return false;
    }
    return true;
}

} // namespace Marquee
