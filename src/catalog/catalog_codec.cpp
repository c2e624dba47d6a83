#include "catalog_codec.hpp"
#include "catalog_parser.hpp"
#include <glib.h>

namespace Catalog {

namespace {

constexpr int kFormatVersion = 1;

JsonArray* array_member(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) return nullptr;
    JsonNode* node = json_object_get_member(obj, member);
    if (json_node_get_node_type(node) != JSON_NODE_ARRAY) return nullptr;
    return json_node_get_array(node);
}

// Unknown or missing codes from older or edited files count as fetch failures
Marquee::ErrorCode failure_code_from_int(int code) {
    if (code <= static_cast<int>(Marquee::ErrorCode::None) ||
        code > static_cast<int>(Marquee::ErrorCode::Cancelled)) {
        g_warning("[Codec] Stored failure has unknown code %d", code);
        return Marquee::ErrorCode::SourceFetch;
    }
    return static_cast<Marquee::ErrorCode>(code);
}

} // namespace

void Codec::build_string_array(JsonBuilder* builder, const char* member,
                               const std::vector<std::string>& values) {
    json_builder_set_member_name(builder, member);
    json_builder_begin_array(builder);
    for (const auto& value : values) {
        json_builder_add_string_value(builder, value.c_str());
    }
    json_builder_end_array(builder);
}

void Codec::build_string_map(JsonBuilder* builder, const char* member,
                             const std::map<std::string, std::string>& map) {
    if (map.empty()) return;

    json_builder_set_member_name(builder, member);
    json_builder_begin_object(builder);
    for (const auto& [name, value] : map) {
        json_builder_set_member_name(builder, name.c_str());
        json_builder_add_string_value(builder, value.c_str());
    }
    json_builder_end_object(builder);
}

void Codec::build_extension(JsonBuilder* builder, const char* member, const Extension& ext) {
    switch (ext.kind) {
        case Extension::Kind::None:
            return;
        case Extension::Kind::Text:
            json_builder_set_member_name(builder, member);
            json_builder_add_string_value(builder, ext.value.c_str());
            return;
        case Extension::Kind::Object: {
            g_autoptr(GError) error = nullptr;
            JsonNode* node = json_from_string(ext.value.c_str(), &error);
            if (!node) {
                g_warning("[Codec] Dropping unreadable extension: %s", error ? error->message : "empty");
                return;
            }
            json_builder_set_member_name(builder, member);
            json_builder_add_value(builder, node); // takes ownership
            return;
        }
    }
}

void Codec::build_site(JsonBuilder* builder, const SiteEntry& site) {
    json_builder_set_member_name(builder, "key");
    json_builder_add_string_value(builder, site.key.c_str());

    json_builder_set_member_name(builder, "name");
    json_builder_add_string_value(builder, site.name.c_str());

    json_builder_set_member_name(builder, "type");
    json_builder_add_int_value(builder, site.type);

    json_builder_set_member_name(builder, "api");
    json_builder_add_string_value(builder, site.endpoint.c_str());

    json_builder_set_member_name(builder, "searchable");
    json_builder_add_boolean_value(builder, site.searchable);

    json_builder_set_member_name(builder, "quickSearch");
    json_builder_add_boolean_value(builder, site.quick_search);

    json_builder_set_member_name(builder, "filterable");
    json_builder_add_boolean_value(builder, site.filterable);

    json_builder_set_member_name(builder, "changeable");
    json_builder_add_boolean_value(builder, site.changeable);

    build_extension(builder, "ext", site.ext);

    if (site.jar) {
        json_builder_set_member_name(builder, "jar");
        json_builder_add_string_value(builder, site.jar->c_str());
    }
    if (site.player_type) {
        json_builder_set_member_name(builder, "playerType");
        json_builder_add_string_value(builder, site.player_type->c_str());
    }
    build_string_map(builder, "header", site.headers);
    if (site.timeout_seconds) {
        json_builder_set_member_name(builder, "timeout");
        json_builder_add_int_value(builder, *site.timeout_seconds);
    }
    if (site.updated_at) {
        json_builder_set_member_name(builder, "updatedAt");
        json_builder_add_int_value(builder, *site.updated_at);
    }

    if (site.resolver_hint) {
        json_builder_set_member_name(builder, "resolver");
        json_builder_begin_object(builder);
        build_string_array(builder, "fallbackParsers", site.resolver_hint->fallback_parsers);
        if (site.resolver_hint->format) {
            json_builder_set_member_name(builder, "format");
            json_builder_add_string_value(builder, site.resolver_hint->format->c_str());
        }
        build_string_map(builder, "header", site.resolver_hint->headers);
        json_builder_end_object(builder);
    }
}

std::string Codec::to_json(JsonBuilder* builder) {
    g_autoptr(JsonNode) root = json_builder_get_root(builder);
    g_autoptr(JsonGenerator) gen = json_generator_new();
    json_generator_set_pretty(gen, TRUE);
    json_generator_set_root(gen, root);

    gchar* data = json_generator_to_data(gen, nullptr);
    std::string result = data ? data : "";
    g_free(data);
    return result;
}

JsonObject* Codec::root_object(JsonParser* parser, const std::string& json, std::string& error) {
    g_autoptr(GError) parse_error = nullptr;
    if (!json_parser_load_from_data(parser, json.c_str(), static_cast<gssize>(json.length()), &parse_error)) {
        error = std::string("Invalid JSON: ") + parse_error->message;
        return nullptr;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || json_node_get_node_type(root) != JSON_NODE_OBJECT) {
        error = "Document root is not an object";
        return nullptr;
    }
    return json_node_get_object(root);
}

// ============ Sources ============

std::string Codec::serialize_sources(const std::vector<ConfigSource>& sources) {
    g_autoptr(JsonBuilder) builder = json_builder_new();

    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "version");
    json_builder_add_int_value(builder, kFormatVersion);

    json_builder_set_member_name(builder, "sources");
    json_builder_begin_array(builder);

    for (const auto& source : sources) {
        json_builder_begin_object(builder);

        json_builder_set_member_name(builder, "id");
        json_builder_add_string_value(builder, source.id.c_str());

        json_builder_set_member_name(builder, "url");
        json_builder_add_string_value(builder, source.url.c_str());

        json_builder_set_member_name(builder, "name");
        json_builder_add_string_value(builder, source.name.c_str());

        json_builder_set_member_name(builder, "priority");
        json_builder_add_int_value(builder, source.priority);

        json_builder_set_member_name(builder, "enabled");
        json_builder_add_boolean_value(builder, source.enabled);

        json_builder_set_member_name(builder, "isPrimary");
        json_builder_add_boolean_value(builder, source.is_primary);

        json_builder_set_member_name(builder, "createdAt");
        json_builder_add_int_value(builder, source.created_at);

        json_builder_set_member_name(builder, "lastFetchedAt");
        json_builder_add_int_value(builder, source.last_fetched_at);

        json_builder_set_member_name(builder, "healthStatus");
        json_builder_add_string_value(builder, health_status_to_string(source.health_status));

        json_builder_set_member_name(builder, "consecutiveFailures");
        json_builder_add_int_value(builder, source.consecutive_failures);

        json_builder_set_member_name(builder, "history");
        json_builder_begin_array(builder);
        for (const auto& record : source.history) {
            json_builder_begin_object(builder);
            json_builder_set_member_name(builder, "at");
            json_builder_add_int_value(builder, record.at);
            json_builder_set_member_name(builder, "success");
            json_builder_add_boolean_value(builder, record.success);
            json_builder_set_member_name(builder, "latencyMs");
            json_builder_add_int_value(builder, record.latency_ms);
            json_builder_end_object(builder);
        }
        json_builder_end_array(builder);

        json_builder_end_object(builder);
    }

    json_builder_end_array(builder);
    json_builder_end_object(builder);

    return to_json(builder);
}

std::optional<std::vector<ConfigSource>> Codec::parse_sources(const std::string& json, std::string& error) {
    g_autoptr(JsonParser) parser = json_parser_new();
    JsonObject* obj = root_object(parser, json, error);
    if (!obj) return std::nullopt;

    JsonArray* array = array_member(obj, "sources");
    if (!array) {
        error = "Missing 'sources' array";
        return std::nullopt;
    }

    std::vector<ConfigSource> sources;
    guint len = json_array_get_length(array);
    for (guint i = 0; i < len; i++) {
        JsonNode* node = json_array_get_element(array, i);
        if (json_node_get_node_type(node) != JSON_NODE_OBJECT) continue;
        JsonObject* source_obj = json_node_get_object(node);

        ConfigSource source;
        source.id = Parser::get_string(source_obj, "id");
        source.url = Parser::get_string(source_obj, "url");
        if (source.id.empty() || source.url.empty()) {
            g_warning("[Codec] Skipping stored source without id or url");
            continue;
        }

        source.name = Parser::get_string(source_obj, "name");
        source.priority = Parser::get_optional_int(source_obj, "priority").value_or(0);
        source.enabled = Parser::get_optional_bool(source_obj, "enabled").value_or(true);
        source.is_primary = Parser::get_optional_bool(source_obj, "isPrimary").value_or(false);
        source.created_at = Parser::get_optional_int64(source_obj, "createdAt").value_or(0);
        source.last_fetched_at = Parser::get_optional_int64(source_obj, "lastFetchedAt").value_or(0);
        source.health_status = health_status_from_string(Parser::get_string(source_obj, "healthStatus"));
        source.consecutive_failures = Parser::get_optional_int(source_obj, "consecutiveFailures").value_or(0);

        if (JsonArray* history = array_member(source_obj, "history")) {
            guint count = json_array_get_length(history);
            for (guint j = 0; j < count; j++) {
                JsonNode* record_node = json_array_get_element(history, j);
                if (json_node_get_node_type(record_node) != JSON_NODE_OBJECT) continue;
                JsonObject* record_obj = json_node_get_object(record_node);

                FetchRecord record;
                record.at = Parser::get_optional_int64(record_obj, "at").value_or(0);
                record.success = Parser::get_optional_bool(record_obj, "success").value_or(false);
                record.latency_ms = Parser::get_optional_int64(record_obj, "latencyMs").value_or(0);
                source.history.push_back(record);
            }
        }

        sources.push_back(std::move(source));
    }

    return sources;
}

// ============ Directory ============

std::string Codec::serialize_directory(const AggregatedDirectory& directory) {
    g_autoptr(JsonBuilder) builder = json_builder_new();

    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "version");
    json_builder_add_int_value(builder, kFormatVersion);

    json_builder_set_member_name(builder, "generatedAt");
    json_builder_add_int_value(builder, directory.generated_at);

    json_builder_set_member_name(builder, "sourceCount");
    json_builder_add_int_value(builder, directory.source_count);

    json_builder_set_member_name(builder, "totalSiteCount");
    json_builder_add_int_value(builder, directory.total_site_count);

    json_builder_set_member_name(builder, "sites");
    json_builder_begin_array(builder);
    for (const auto& entry : directory.sites) {
        json_builder_begin_object(builder);
        build_site(builder, entry.site);

        json_builder_set_member_name(builder, "originUrls");
        json_builder_begin_array(builder);
        for (const auto& url : entry.origin_urls) {
            json_builder_add_string_value(builder, url.c_str());
        }
        json_builder_end_array(builder);

        json_builder_set_member_name(builder, "qualityScore");
        json_builder_add_double_value(builder, entry.quality_score);

        json_builder_set_member_name(builder, "reliabilityScore");
        json_builder_add_double_value(builder, entry.reliability_score);

        json_builder_set_member_name(builder, "lastSeen");
        json_builder_add_int_value(builder, entry.last_seen);

        json_builder_set_member_name(builder, "sourceId");
        json_builder_add_string_value(builder, entry.source_id.c_str());

        json_builder_end_object(builder);
    }
    json_builder_end_array(builder);

    json_builder_set_member_name(builder, "parses");
    json_builder_begin_array(builder);
    for (const auto& parser : directory.resolvers) {
        json_builder_begin_object(builder);
        json_builder_set_member_name(builder, "name");
        json_builder_add_string_value(builder, parser.name.c_str());
        json_builder_set_member_name(builder, "type");
        json_builder_add_int_value(builder, parser.type);
        json_builder_set_member_name(builder, "url");
        json_builder_add_string_value(builder, parser.url.c_str());
        build_string_array(builder, "flag", parser.flags);
        build_string_map(builder, "header", parser.headers);
        build_extension(builder, "ext", parser.ext);
        json_builder_end_object(builder);
    }
    json_builder_end_array(builder);

    json_builder_set_member_name(builder, "rules");
    json_builder_begin_array(builder);
    for (const auto& rule : directory.rules) {
        json_builder_begin_object(builder);
        json_builder_set_member_name(builder, "name");
        json_builder_add_string_value(builder, rule.name.c_str());
        build_string_array(builder, "hosts", rule.hosts);
        build_string_array(builder, "regex", rule.regex);
        build_string_array(builder, "script", rule.script);
        json_builder_end_object(builder);
    }
    json_builder_end_array(builder);

    json_builder_set_member_name(builder, "lives");
    json_builder_begin_array(builder);
    for (const auto& live : directory.lives) {
        json_builder_begin_object(builder);
        json_builder_set_member_name(builder, "name");
        json_builder_add_string_value(builder, live.name.c_str());
        json_builder_set_member_name(builder, "type");
        json_builder_add_int_value(builder, live.type);
        json_builder_set_member_name(builder, "url");
        json_builder_add_string_value(builder, live.url.c_str());
        if (live.player_type) {
            json_builder_set_member_name(builder, "playerType");
            json_builder_add_string_value(builder, live.player_type->c_str());
        }
        if (live.ua) {
            json_builder_set_member_name(builder, "ua");
            json_builder_add_string_value(builder, live.ua->c_str());
        }
        if (live.epg) {
            json_builder_set_member_name(builder, "epg");
            json_builder_add_string_value(builder, live.epg->c_str());
        }
        if (live.logo) {
            json_builder_set_member_name(builder, "logo");
            json_builder_add_string_value(builder, live.logo->c_str());
        }
        if (live.timeout_seconds) {
            json_builder_set_member_name(builder, "timeout");
            json_builder_add_int_value(builder, *live.timeout_seconds);
        }
        json_builder_set_member_name(builder, "boot");
        json_builder_add_boolean_value(builder, live.boot);
        json_builder_end_object(builder);
    }
    json_builder_end_array(builder);

    json_builder_set_member_name(builder, "failures");
    json_builder_begin_array(builder);
    for (const auto& failure : directory.failures) {
        json_builder_begin_object(builder);
        json_builder_set_member_name(builder, "sourceId");
        json_builder_add_string_value(builder, failure.source_id.c_str());
        json_builder_set_member_name(builder, "sourceUrl");
        json_builder_add_string_value(builder, failure.source_url.c_str());
        json_builder_set_member_name(builder, "code");
        json_builder_add_int_value(builder, static_cast<int>(failure.code));
        json_builder_set_member_name(builder, "message");
        json_builder_add_string_value(builder, failure.message.c_str());
        json_builder_set_member_name(builder, "servedStale");
        json_builder_add_boolean_value(builder, failure.served_stale);
        json_builder_end_object(builder);
    }
    json_builder_end_array(builder);

    json_builder_end_object(builder);

    return to_json(builder);
}

std::optional<AggregatedDirectory> Codec::parse_directory(const std::string& json, std::string& error) {
    g_autoptr(JsonParser) parser = json_parser_new();
    JsonObject* obj = root_object(parser, json, error);
    if (!obj) return std::nullopt;

    JsonArray* sites = array_member(obj, "sites");
    if (!sites) {
        error = "Missing 'sites' array";
        return std::nullopt;
    }

    AggregatedDirectory directory;
    directory.generated_at = Parser::get_optional_int64(obj, "generatedAt").value_or(0);
    directory.source_count = Parser::get_optional_int(obj, "sourceCount").value_or(0);
    directory.total_site_count = Parser::get_optional_int(obj, "totalSiteCount").value_or(0);

    guint len = json_array_get_length(sites);
    for (guint i = 0; i < len; i++) {
        JsonNode* node = json_array_get_element(sites, i);
        if (json_node_get_node_type(node) != JSON_NODE_OBJECT) continue;
        JsonObject* site_obj = json_node_get_object(node);

        auto site = Parser::parse_site(site_obj);
        if (!site) continue;

        AggregatedSiteEntry entry;
        entry.site = std::move(*site);
        for (const auto& url : Parser::get_string_array(site_obj, "originUrls")) {
            entry.origin_urls.insert(url);
        }
        entry.quality_score = Parser::get_optional_double(site_obj, "qualityScore").value_or(0.0);
        entry.reliability_score = Parser::get_optional_double(site_obj, "reliabilityScore").value_or(0.0);
        entry.last_seen = Parser::get_optional_int64(site_obj, "lastSeen").value_or(0);
        entry.source_id = Parser::get_string(site_obj, "sourceId");
        directory.sites.push_back(std::move(entry));
    }

    if (JsonArray* parses = array_member(obj, "parses")) {
        guint count = json_array_get_length(parses);
        for (guint i = 0; i < count; i++) {
            JsonNode* node = json_array_get_element(parses, i);
            if (json_node_get_node_type(node) != JSON_NODE_OBJECT) continue;
            auto descriptor = Parser::parse_resolver_descriptor(json_node_get_object(node));
            if (descriptor) directory.resolvers.push_back(std::move(*descriptor));
        }
    }

    if (JsonArray* rules = array_member(obj, "rules")) {
        guint count = json_array_get_length(rules);
        for (guint i = 0; i < count; i++) {
            JsonNode* node = json_array_get_element(rules, i);
            if (json_node_get_node_type(node) != JSON_NODE_OBJECT) continue;
            directory.rules.push_back(Parser::parse_rule(json_node_get_object(node)));
        }
    }

    if (JsonArray* lives = array_member(obj, "lives")) {
        guint count = json_array_get_length(lives);
        for (guint i = 0; i < count; i++) {
            JsonNode* node = json_array_get_element(lives, i);
            if (json_node_get_node_type(node) != JSON_NODE_OBJECT) continue;
            auto live = Parser::parse_live(json_node_get_object(node));
            if (live) directory.lives.push_back(std::move(*live));
        }
    }

    if (JsonArray* failures = array_member(obj, "failures")) {
        guint count = json_array_get_length(failures);
        for (guint i = 0; i < count; i++) {
            JsonNode* node = json_array_get_element(failures, i);
            if (json_node_get_node_type(node) != JSON_NODE_OBJECT) continue;
            JsonObject* failure_obj = json_node_get_object(node);

            SourceFailure failure;
            failure.source_id = Parser::get_string(failure_obj, "sourceId");
            failure.source_url = Parser::get_string(failure_obj, "sourceUrl");
            failure.code = failure_code_from_int(Parser::get_optional_int(failure_obj, "code").value_or(0));
            failure.message = Parser::get_string(failure_obj, "message");
            failure.served_stale = Parser::get_optional_bool(failure_obj, "servedStale").value_or(false);
            directory.failures.push_back(std::move(failure));
        }
    }

    directory.categories = build_categories(directory.sites);
    return directory;
}

} // namespace Catalog
