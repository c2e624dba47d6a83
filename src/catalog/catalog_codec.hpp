#pragma once

#include "catalog_types.hpp"
#include <json-glib/json-glib.h>
#include <optional>
#include <string>
#include <vector>

namespace Catalog {

/**
 * JSON persistence format for the source registry and the last good directory.
 *
 * Sites are written in the same member names the config source documents use,
 * so Parser::parse_site reads them back.
 */
class Codec {
public:
    static std::string serialize_sources(const std::vector<ConfigSource>& sources);
    static std::optional<std::vector<ConfigSource>> parse_sources(const std::string& json, std::string& error);

    static std::string serialize_directory(const AggregatedDirectory& directory);
    static std::optional<AggregatedDirectory> parse_directory(const std::string& json, std::string& error);

private:
    static void build_site(JsonBuilder* builder, const SiteEntry& site);
    static void build_extension(JsonBuilder* builder, const char* member, const Extension& ext);
    static void build_string_map(JsonBuilder* builder, const char* member,
                                 const std::map<std::string, std::string>& map);
    static void build_string_array(JsonBuilder* builder, const char* member,
                                   const std::vector<std::string>& values);

    static std::string to_json(JsonBuilder* builder);
    static JsonObject* root_object(JsonParser* parser, const std::string& json, std::string& error);
};

} // namespace Catalog
