#include "catalog_parser.hpp"
#include <glib.h>

namespace Catalog {

std::string Parser::get_string(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) return "";
    JsonNode* node = json_object_get_member(obj, member);
    if (json_node_get_node_type(node) != JSON_NODE_VALUE) return "";
    return json_node_get_string(node) ? json_node_get_string(node) : "";
}

std::optional<std::string> Parser::get_optional_string(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) return std::nullopt;
    JsonNode* node = json_object_get_member(obj, member);
    if (json_node_get_node_type(node) != JSON_NODE_VALUE) return std::nullopt;
    const char* str = json_node_get_string(node);
    if (!str) return std::nullopt;
    return std::string(str);
}

std::optional<std::string> Parser::get_optional_scalar(JsonObject* obj, const char* member) {
    // Some sources publish numeric fields as strings and vice versa
    if (!json_object_has_member(obj, member)) return std::nullopt;
    JsonNode* node = json_object_get_member(obj, member);
    if (json_node_get_node_type(node) != JSON_NODE_VALUE) return std::nullopt;

    GType type = json_node_get_value_type(node);
    if (type == G_TYPE_STRING) {
        return std::string(json_node_get_string(node));
    }
    if (type == G_TYPE_INT64) {
        return std::to_string(json_node_get_int(node));
    }
    if (type == G_TYPE_BOOLEAN) {
        return std::string(json_node_get_boolean(node) ? "true" : "false");
    }
    return std::nullopt;
}

std::optional<int> Parser::get_optional_int(JsonObject* obj, const char* member) {
    auto value = get_optional_int64(obj, member);
    if (!value) return std::nullopt;
    return static_cast<int>(*value);
}

std::optional<int64_t> Parser::get_optional_int64(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) return std::nullopt;
    JsonNode* node = json_object_get_member(obj, member);
    if (json_node_get_node_type(node) != JSON_NODE_VALUE) return std::nullopt;

    if (json_node_get_value_type(node) == G_TYPE_STRING) {
        const char* str = json_node_get_string(node);
        gchar* end = nullptr;
        gint64 parsed = g_ascii_strtoll(str, &end, 10);
        if (end == str || *end != '\0') return std::nullopt;
        return parsed;
    }
    return json_node_get_int(node);
}

std::optional<bool> Parser::get_optional_bool(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) return std::nullopt;
    JsonNode* node = json_object_get_member(obj, member);
    if (json_node_get_node_type(node) != JSON_NODE_VALUE) return std::nullopt;
    return json_node_get_boolean(node);
}

std::optional<double> Parser::get_optional_double(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) return std::nullopt;
    JsonNode* node = json_object_get_member(obj, member);
    if (json_node_get_node_type(node) != JSON_NODE_VALUE) return std::nullopt;
    return json_node_get_double(node);
}

std::vector<std::string> Parser::get_string_array(JsonObject* obj, const char* member) {
    std::vector<std::string> result;
    JsonArray* array = get_array(obj, member);
    if (!array) return result;

    guint len = json_array_get_length(array);
    for (guint i = 0; i < len; i++) {
        JsonNode* elem = json_array_get_element(array, i);
        if (json_node_get_node_type(elem) == JSON_NODE_VALUE) {
            const char* str = json_node_get_string(elem);
            if (str) result.push_back(str);
        }
    }

    return result;
}

std::map<std::string, std::string> Parser::get_string_map(JsonObject* obj, const char* member) {
    std::map<std::string, std::string> result;
    if (!json_object_has_member(obj, member)) return result;

    JsonNode* node = json_object_get_member(obj, member);
    if (json_node_get_node_type(node) != JSON_NODE_OBJECT) return result;

    JsonObject* map_obj = json_node_get_object(node);
    GList* members = json_object_get_members(map_obj);
    for (GList* l = members; l != nullptr; l = l->next) {
        const char* name = static_cast<const char*>(l->data);
        auto value = get_optional_scalar(map_obj, name);
        if (value) {
            result[name] = *value;
        }
    }
    g_list_free(members);

    return result;
}

Extension Parser::get_extension(JsonObject* obj, const char* member) {
    Extension ext;
    if (!json_object_has_member(obj, member)) return ext;

    JsonNode* node = json_object_get_member(obj, member);
    switch (json_node_get_node_type(node)) {
        case JSON_NODE_VALUE:
            if (json_node_get_value_type(node) == G_TYPE_STRING) {
                ext.kind = Extension::Kind::Text;
                ext.value = json_node_get_string(node);
            }
            break;
        case JSON_NODE_OBJECT:
        case JSON_NODE_ARRAY: {
            gchar* raw = json_to_string(node, FALSE);
            ext.kind = Extension::Kind::Object;
            ext.value = raw ? raw : "";
            g_free(raw);
            break;
        }
        case JSON_NODE_NULL:
            break;
    }

    return ext;
}

JsonArray* Parser::get_array(JsonObject* obj, const char* member) {
    if (!json_object_has_member(obj, member)) return nullptr;
    JsonNode* node = json_object_get_member(obj, member);
    if (json_node_get_node_type(node) != JSON_NODE_ARRAY) return nullptr;
    return json_node_get_array(node);
}

ResolverHint Parser::parse_resolver_hint(JsonObject* obj) {
    ResolverHint hint;
    hint.fallback_parsers = get_string_array(obj, "fallbackParsers");
    hint.format = get_optional_string(obj, "format");
    hint.headers = get_string_map(obj, "header");
    return hint;
}

std::optional<SiteEntry> Parser::parse_site(JsonObject* obj) {
    SiteEntry site;
    site.key = get_string(obj, "key");
    site.name = get_string(obj, "name");
    site.endpoint = get_string(obj, "api");

    if (site.key.empty() || site.name.empty() || site.endpoint.empty()) {
        return std::nullopt;
    }

    site.type = get_optional_int(obj, "type").value_or(0);
    site.kind = kind_for_site_type(site.type);

    site.searchable = get_optional_bool(obj, "searchable").value_or(false);
    site.quick_search = get_optional_bool(obj, "quickSearch").value_or(false);
    site.filterable = get_optional_bool(obj, "filterable").value_or(false);
    site.changeable = get_optional_bool(obj, "changeable").value_or(true);

    site.ext = get_extension(obj, "ext");
    site.jar = get_optional_string(obj, "jar");
    site.player_type = get_optional_scalar(obj, "playerType");
    site.headers = get_string_map(obj, "header");
    site.timeout_seconds = get_optional_int(obj, "timeout");
    site.updated_at = get_optional_int64(obj, "updatedAt");

    if (json_object_has_member(obj, "resolver")) {
        JsonNode* hint_node = json_object_get_member(obj, "resolver");
        if (json_node_get_node_type(hint_node) == JSON_NODE_OBJECT) {
            ResolverHint hint = parse_resolver_hint(json_node_get_object(hint_node));
            if (!hint.empty()) {
                site.resolver_hint = hint;
            }
        }
    }

    return site;
}

std::optional<ResolverDescriptor> Parser::parse_resolver_descriptor(JsonObject* obj) {
    ResolverDescriptor parser;
    parser.name = get_string(obj, "name");
    parser.url = get_string(obj, "url");

    if (parser.name.empty() || parser.url.empty()) {
        return std::nullopt;
    }

    parser.type = get_optional_int(obj, "type").value_or(0);
    parser.flags = get_string_array(obj, "flag");
    parser.headers = get_string_map(obj, "header");
    parser.ext = get_extension(obj, "ext");
    return parser;
}

RuleEntry Parser::parse_rule(JsonObject* obj) {
    RuleEntry rule;
    rule.name = get_string(obj, "name");
    rule.hosts = get_string_array(obj, "hosts");
    rule.regex = get_string_array(obj, "regex");
    rule.script = get_string_array(obj, "script");
    return rule;
}

std::optional<LiveEntry> Parser::parse_live(JsonObject* obj) {
    LiveEntry live;
    live.name = get_string(obj, "name");
    live.url = get_string(obj, "url");

    if (live.name.empty() || live.url.empty()) {
        return std::nullopt;
    }

    live.type = get_optional_int(obj, "type").value_or(0);
    live.player_type = get_optional_scalar(obj, "playerType");
    live.ua = get_optional_string(obj, "ua");
    live.epg = get_optional_string(obj, "epg");
    live.logo = get_optional_string(obj, "logo");
    live.timeout_seconds = get_optional_int(obj, "timeout");
    live.boot = get_optional_bool(obj, "boot").value_or(false);
    return live;
}

std::optional<SpiderDescriptor> Parser::parse_spider(const std::string& spider) {
    gchar** parts = g_strsplit(spider.c_str(), ";", -1);
    guint count = g_strv_length(parts);

    std::optional<SpiderDescriptor> result;
    if (count >= 3 && parts[0][0] != '\0' && parts[2][0] != '\0') {
        result = SpiderDescriptor{parts[0], parts[2]};
    }

    g_strfreev(parts);
    return result;
}

std::optional<CatalogFragment> Parser::parse_fragment(const std::string& json, std::string& error) {
    g_autoptr(JsonParser) parser = json_parser_new();
    g_autoptr(GError) parse_error = nullptr;

    if (!json_parser_load_from_data(parser, json.c_str(), static_cast<gssize>(json.length()), &parse_error)) {
        error = std::string("Invalid JSON: ") + parse_error->message;
        return std::nullopt;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || json_node_get_node_type(root) != JSON_NODE_OBJECT) {
        error = "Document root is not an object";
        return std::nullopt;
    }

    JsonObject* obj = json_node_get_object(root);

    JsonArray* sites_array = get_array(obj, "sites");
    if (!sites_array) {
        error = "Missing required member 'sites'";
        return std::nullopt;
    }

    CatalogFragment fragment;

    guint len = json_array_get_length(sites_array);
    for (guint i = 0; i < len; i++) {
        JsonNode* site_node = json_array_get_element(sites_array, i);
        if (json_node_get_node_type(site_node) != JSON_NODE_OBJECT) continue;

        auto site = parse_site(json_node_get_object(site_node));
        if (site) {
            fragment.sites.push_back(std::move(*site));
        }
    }

    if (JsonArray* parses = get_array(obj, "parses")) {
        guint count = json_array_get_length(parses);
        for (guint i = 0; i < count; i++) {
            JsonNode* node = json_array_get_element(parses, i);
            if (json_node_get_node_type(node) != JSON_NODE_OBJECT) continue;

            auto descriptor = parse_resolver_descriptor(json_node_get_object(node));
            if (descriptor) {
                fragment.resolvers.push_back(std::move(*descriptor));
            }
        }
    }

    if (JsonArray* rules = get_array(obj, "rules")) {
        guint count = json_array_get_length(rules);
        for (guint i = 0; i < count; i++) {
            JsonNode* node = json_array_get_element(rules, i);
            if (json_node_get_node_type(node) == JSON_NODE_OBJECT) {
                fragment.rules.push_back(parse_rule(json_node_get_object(node)));
            }
        }
    }

    if (JsonArray* lives = get_array(obj, "lives")) {
        guint count = json_array_get_length(lives);
        for (guint i = 0; i < count; i++) {
            JsonNode* node = json_array_get_element(lives, i);
            if (json_node_get_node_type(node) != JSON_NODE_OBJECT) continue;

            auto live = parse_live(json_node_get_object(node));
            if (live) {
                fragment.lives.push_back(std::move(*live));
            }
        }
    }

    // "wallpaper" is either a single URL or a list of them
    auto wallpaper = get_optional_string(obj, "wallpaper");
    if (wallpaper) {
        gchar* trimmed = g_strstrip(g_strdup(wallpaper->c_str()));
        if (*trimmed) fragment.wallpapers.push_back(trimmed);
        g_free(trimmed);
    } else {
        fragment.wallpapers = get_string_array(obj, "wallpaper");
    }

    auto spider = get_optional_string(obj, "spider");
    if (spider) {
        fragment.spider = parse_spider(*spider);
    }

    return fragment;
}

} // namespace Catalog
