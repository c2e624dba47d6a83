#pragma once

#include "catalog_types.hpp"
#include <json-glib/json-glib.h>
#include <optional>
#include <string>

namespace Catalog {

/**
 * JSON parser for config source documents.
 *
 * A document must be a JSON object with a "sites" array. Unknown members are
 * ignored. Sites without key/name/api, resolvers and lives without name/url
 * are dropped.
 */
class Parser {
public:
    /**
     * Parse a config source document.
     * @param json Raw document
     * @param error Set to a description when parsing fails
     * @return The fragment, or nullopt if the document is malformed or
     *         misses required members
     */
    static std::optional<CatalogFragment> parse_fragment(const std::string& json, std::string& error);

    static std::optional<SiteEntry> parse_site(JsonObject* obj);
    static std::optional<ResolverDescriptor> parse_resolver_descriptor(JsonObject* obj);
    static RuleEntry parse_rule(JsonObject* obj);
    static std::optional<LiveEntry> parse_live(JsonObject* obj);

    // "path;md5;checksum" -> {path, checksum}
    static std::optional<SpiderDescriptor> parse_spider(const std::string& spider);

private:
    friend class Codec;

    // Helper functions
    static std::string get_string(JsonObject* obj, const char* member);
    static std::optional<std::string> get_optional_string(JsonObject* obj, const char* member);
    static std::optional<std::string> get_optional_scalar(JsonObject* obj, const char* member);
    static std::optional<int> get_optional_int(JsonObject* obj, const char* member);
    static std::optional<int64_t> get_optional_int64(JsonObject* obj, const char* member);
    static std::optional<bool> get_optional_bool(JsonObject* obj, const char* member);
    static std::optional<double> get_optional_double(JsonObject* obj, const char* member);
    static std::vector<std::string> get_string_array(JsonObject* obj, const char* member);
    static std::map<std::string, std::string> get_string_map(JsonObject* obj, const char* member);
    static Extension get_extension(JsonObject* obj, const char* member);
    static JsonArray* get_array(JsonObject* obj, const char* member);

    static ResolverHint parse_resolver_hint(JsonObject* obj);
};

} // namespace Catalog
