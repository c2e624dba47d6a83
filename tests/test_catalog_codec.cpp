/**
 * @file test_catalog_codec.cpp
 * @brief Tests for the persisted registry and directory format.
 */

#include <gtest/gtest.h>
#include <string>

#include "catalog/catalog_codec.hpp"

using Catalog::AggregatedDirectory;
using Catalog::AggregatedSiteEntry;
using Catalog::Codec;
using Catalog::ConfigSource;
using Catalog::Extension;
using Catalog::HealthStatus;

/**
 * @test Codec_SourcesKeepOrderAndHealth
 * @brief Stored sources come back in order with health bookkeeping intact.
 */
TEST(CatalogCodec, SourcesKeepOrderAndHealth) {
    ConfigSource a;
    a.id = "a";
    a.url = "https://a.example/config.json";
    a.name = "A";
    a.priority = 5;
    a.is_primary = true;
    a.health_status = HealthStatus::Warning;
    a.consecutive_failures = 2;
    a.history = {{1000, true, 120}, {2000, false, 900}};

    ConfigSource b;
    b.id = "b";
    b.url = "https://b.example/config.json";
    b.enabled = false;

    std::string error;
    auto parsed = Codec::parse_sources(Codec::serialize_sources({a, b}), error);
    ASSERT_TRUE(parsed.has_value()) << error;
    ASSERT_EQ(parsed->size(), 2u);

    const auto& first = (*parsed)[0];
    EXPECT_EQ(first.id, "a");
    EXPECT_EQ(first.priority, 5);
    EXPECT_TRUE(first.is_primary);
    EXPECT_EQ(first.health_status, HealthStatus::Warning);
    EXPECT_EQ(first.consecutive_failures, 2);
    ASSERT_EQ(first.history.size(), 2u);
    EXPECT_FALSE(first.history[1].success);
    EXPECT_EQ(first.history[1].latency_ms, 900);

    EXPECT_EQ((*parsed)[1].id, "b");
    EXPECT_FALSE((*parsed)[1].enabled);
}

/**
 * @test Codec_SourcesMissingArray
 * @brief A document without "sources" is rejected.
 */
TEST(CatalogCodec, SourcesDocumentWithoutArrayFails) {
    std::string error;
    EXPECT_FALSE(Codec::parse_sources(R"({"version": 1})", error).has_value());
    EXPECT_FALSE(error.empty());
}

/**
 * @test Codec_DirectoryRestoresEntries
 * @brief A stored directory keeps scores, origins, extensions and notes, and
 *        rebuilds its category index.
 */
TEST(CatalogCodec, DirectoryRestoresEntries) {
    AggregatedDirectory directory;
    directory.generated_at = 42;
    directory.source_count = 2;
    directory.total_site_count = 3;

    AggregatedSiteEntry entry;
    entry.site.key = "k1";
    entry.site.name = "Site";
    entry.site.type = 1;
    entry.site.kind = "video_api";
    entry.site.endpoint = "https://api.example/k1";
    entry.site.ext.kind = Extension::Kind::Object;
    entry.site.ext.value = R"({"a":1})";
    entry.origin_urls = {"https://a.example", "https://b.example"};
    entry.quality_score = 0.8;
    entry.reliability_score = 0.9;
    entry.last_seen = 41;
    entry.source_id = "a";
    directory.sites.push_back(entry);

    Catalog::SourceFailure failure;
    failure.source_id = "c";
    failure.source_url = "https://c.example";
    failure.code = Marquee::ErrorCode::SourceFetch;
    failure.message = "HTTP error: 500";
    directory.failures.push_back(failure);

    std::string error;
    auto parsed = Codec::parse_directory(Codec::serialize_directory(directory), error);
    ASSERT_TRUE(parsed.has_value()) << error;

    EXPECT_EQ(parsed->generated_at, 42);
    EXPECT_EQ(parsed->source_count, 2);
    EXPECT_EQ(parsed->total_site_count, 3);
    ASSERT_EQ(parsed->sites.size(), 1u);

    const auto& restored = parsed->sites[0];
    EXPECT_EQ(restored.site.kind, "video_api");
    EXPECT_EQ(restored.site.ext.kind, Extension::Kind::Object);
    EXPECT_EQ(restored.origin_urls.size(), 2u);
    EXPECT_DOUBLE_EQ(restored.quality_score, 0.8);
    EXPECT_EQ(restored.source_id, "a");

    ASSERT_EQ(parsed->categories.size(), 1u);
    EXPECT_EQ(parsed->categories[0].id, "video_api");

    ASSERT_EQ(parsed->failures.size(), 1u);
    EXPECT_EQ(parsed->failures[0].code, Marquee::ErrorCode::SourceFetch);
}

/**
 * @test Codec_UnknownFailureCode
 * @brief A stored failure with an out-of-range code loads as SourceFetch.
 */
TEST(CatalogCodec, UnknownFailureCodeFallsBackToSourceFetch) {
    const char* stored = R"({
        "version": 1,
        "generatedAt": 42,
        "sites": [],
        "failures": [
            {"sourceId": "c", "sourceUrl": "https://c.example", "code": 999, "message": "bogus"},
            {"sourceId": "d", "sourceUrl": "https://d.example", "code": -4, "message": "negative"},
            {"sourceId": "e", "sourceUrl": "https://e.example", "code": 6, "message": "parse"}
        ]
    })";

    std::string error;
    auto parsed = Codec::parse_directory(stored, error);
    ASSERT_TRUE(parsed.has_value()) << error;
    ASSERT_EQ(parsed->failures.size(), 3u);
    EXPECT_EQ(parsed->failures[0].code, Marquee::ErrorCode::SourceFetch);
    EXPECT_EQ(parsed->failures[0].message, "bogus");
    EXPECT_EQ(parsed->failures[1].code, Marquee::ErrorCode::SourceFetch);
    EXPECT_EQ(parsed->failures[2].code, Marquee::ErrorCode::SourceParse);
}
