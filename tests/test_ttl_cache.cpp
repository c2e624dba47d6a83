/**
 * @file test_ttl_cache.cpp
 * @brief Tests for TtlCache expiry, single-flight rebuilds and stale fallback.
 *
 * Producers are completed by hand so every test runs without a main loop.
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

#include "catalog/ttl_cache.hpp"
#include "test_helpers.hpp"

using Marquee::Error;
using Marquee::ErrorCode;
using TestSupport::ManualClock;

namespace {

using StringCache = Catalog::TtlCache<std::string>;

struct Harness {
    ManualClock clock;
    StringCache cache{clock, 1000};

    std::vector<StringCache::ProduceCallback> pending;
    int produced = 0;

    StringCache::Producer producer() {
        return [this](StringCache::ProduceCallback done) {
            produced++;
            pending.push_back(std::move(done));
        };
    }

    void finish(size_t index, const std::string& value) {
        pending[index](std::make_shared<const std::string>(value), Error());
    }

    void fail(size_t index, const std::string& message) {
        pending[index](nullptr, Error(ErrorCode::SourceFetch, message));
    }
};

struct Result {
    bool called = false;
    StringCache::Lookup lookup;
    Error error;

    StringCache::Callback callback() {
        return [this](const StringCache::Lookup& l, const Error& e) {
            called = true;
            lookup = l;
            error = e;
        };
    }
};

} // namespace

// ------------------------------ Expiry -------------------------------------

/**
 * @test TtlCache_HitWithinTtl
 * @brief A second get inside the TTL is served without rebuilding.
 */
TEST(TtlCache, HitWithinTtl) {
    Harness h;
    Result first;
    h.cache.get("k", h.producer(), first.callback());
    ASSERT_EQ(h.produced, 1);
    h.finish(0, "v1");
    ASSERT_TRUE(first.called);
    EXPECT_EQ(*first.lookup.payload, "v1");

    h.clock.advance(999);
    Result second;
    h.cache.get("k", h.producer(), second.callback());
    ASSERT_TRUE(second.called);
    EXPECT_EQ(h.produced, 1);
    EXPECT_EQ(*second.lookup.payload, "v1");
    EXPECT_FALSE(second.lookup.stale);

    EXPECT_EQ(h.cache.stats().hits, 1u);
    EXPECT_EQ(h.cache.stats().misses, 1u);
    EXPECT_DOUBLE_EQ(h.cache.hit_rate(), 0.5);
}

/**
 * @test TtlCache_RebuildAfterExpiry
 * @brief Once the TTL passes the entry is rebuilt.
 */
TEST(TtlCache, RebuildAfterExpiry) {
    Harness h;
    Result first;
    h.cache.get("k", h.producer(), first.callback());
    h.finish(0, "v1");

    h.clock.advance(1000);
    Result second;
    h.cache.get("k", h.producer(), second.callback());
    EXPECT_EQ(h.produced, 2);
    EXPECT_FALSE(second.called);

    h.finish(1, "v2");
    ASSERT_TRUE(second.called);
    EXPECT_EQ(*second.lookup.payload, "v2");
}

/**
 * @test TtlCache_SingleFlight
 * @brief Concurrent gets for one key share a single rebuild.
 */
TEST(TtlCache, ConcurrentGetsShareRebuild) {
    Harness h;
    Result a, b;
    h.cache.get("k", h.producer(), a.callback());
    h.cache.get("k", h.producer(), b.callback());

    EXPECT_EQ(h.produced, 1);
    EXPECT_TRUE(h.cache.building("k"));

    h.finish(0, "shared");
    ASSERT_TRUE(a.called);
    ASSERT_TRUE(b.called);
    EXPECT_EQ(a.lookup.payload, b.lookup.payload);
    EXPECT_FALSE(h.cache.building("k"));
}

// --------------------------- Failure handling -------------------------------

/**
 * @test TtlCache_StaleOnFailure
 * @brief A failed rebuild serves the previous payload flagged stale.
 */
TEST(TtlCache, FailedRebuildServesStale) {
    Harness h;
    Result first;
    h.cache.get("k", h.producer(), first.callback());
    h.finish(0, "old");
    int64_t stored_at = first.lookup.stored_at;

    h.clock.advance(5000);
    Result second;
    h.cache.get("k", h.producer(), second.callback());
    h.fail(1, "HTTP error: 500");

    ASSERT_TRUE(second.called);
    EXPECT_TRUE(second.error.ok());
    EXPECT_TRUE(second.lookup.stale);
    EXPECT_EQ(*second.lookup.payload, "old");
    EXPECT_EQ(second.lookup.stored_at, stored_at);
    EXPECT_EQ(second.lookup.refresh_error.code, ErrorCode::SourceFetch);
    EXPECT_EQ(h.cache.stats().stale_served, 1u);
}

/**
 * @test TtlCache_ErrorWithoutEntry
 * @brief With nothing cached a failed build reports its error.
 */
TEST(TtlCache, FailureWithoutEntryPropagates) {
    Harness h;
    Result r;
    h.cache.get("k", h.producer(), r.callback());
    h.fail(0, "boom");

    ASSERT_TRUE(r.called);
    EXPECT_EQ(r.error.code, ErrorCode::SourceFetch);
    EXPECT_FALSE(r.lookup.payload);
}

// ------------------------------ Invalidation --------------------------------

/**
 * @test TtlCache_InvalidateKeepsFallback
 * @brief An invalidated entry is rebuilt but still backs a failed rebuild.
 */
TEST(TtlCache, InvalidatedEntryRebuiltButKeptForFallback) {
    Harness h;
    Result first;
    h.cache.get("k", h.producer(), first.callback());
    h.finish(0, "v1");

    h.cache.invalidate("k");
    auto peeked = h.cache.peek("k");
    ASSERT_TRUE(peeked.has_value());
    EXPECT_TRUE(peeked->stale);

    Result second;
    h.cache.get("k", h.producer(), second.callback());
    EXPECT_EQ(h.produced, 2);
    h.fail(1, "down");
    ASSERT_TRUE(second.called);
    EXPECT_TRUE(second.lookup.stale);
    EXPECT_EQ(*second.lookup.payload, "v1");
}

/**
 * @test TtlCache_InvalidateDuringBuild
 * @brief A build finishing after an invalidation is handed out but not kept live.
 */
TEST(TtlCache, InvalidateDuringBuildForcesNextRebuild) {
    Harness h;
    int stored = 0;
    h.cache.on_stored([&stored](const std::string&, const StringCache::Payload&, int64_t) { stored++; });

    Result first;
    h.cache.get("k", h.producer(), first.callback());
    h.cache.invalidate("k");
    h.finish(0, "racing");

    ASSERT_TRUE(first.called);
    EXPECT_EQ(*first.lookup.payload, "racing");
    EXPECT_EQ(stored, 0);

    Result second;
    h.cache.get("k", h.producer(), second.callback());
    EXPECT_EQ(h.produced, 2);
    h.finish(1, "fresh");
    EXPECT_EQ(stored, 1);
}

/**
 * @test TtlCache_GetAfterInvalidateWaitsForNewBuild
 * @brief A get arriving after an invalidation does not join the older build;
 *        it is served by a rebuild started when that build completes.
 */
TEST(TtlCache, GetAfterInvalidateWaitsForNewBuild) {
    Harness h;
    Result before;
    h.cache.get("k", h.producer(), before.callback());
    h.cache.invalidate("k");

    Result after, joined;
    h.cache.get("k", h.producer(), after.callback());
    h.cache.get("k", h.producer(), joined.callback());
    EXPECT_EQ(h.produced, 1);

    h.finish(0, "before invalidate");
    ASSERT_TRUE(before.called);
    EXPECT_EQ(*before.lookup.payload, "before invalidate");

    // One follow-up build serves both late callers
    EXPECT_FALSE(after.called);
    EXPECT_FALSE(joined.called);
    EXPECT_EQ(h.produced, 2);
    EXPECT_TRUE(h.cache.building("k"));

    h.finish(1, "after invalidate");
    ASSERT_TRUE(after.called);
    ASSERT_TRUE(joined.called);
    EXPECT_EQ(*after.lookup.payload, "after invalidate");
    EXPECT_FALSE(after.lookup.stale);
    EXPECT_EQ(after.lookup.payload, joined.lookup.payload);

    Result hit;
    h.cache.get("k", h.producer(), hit.callback());
    ASSERT_TRUE(hit.called);
    EXPECT_EQ(*hit.lookup.payload, "after invalidate");
    EXPECT_EQ(h.produced, 2);
}

/**
 * @test TtlCache_FollowUpBuildFailure
 * @brief When the follow-up build fails, its callers get the older build as stale.
 */
TEST(TtlCache, FailedFollowUpServesOlderBuildAsStale) {
    Harness h;
    Result before;
    h.cache.get("k", h.producer(), before.callback());
    h.cache.invalidate("k");

    Result after;
    h.cache.get("k", h.producer(), after.callback());
    h.finish(0, "older");
    h.fail(1, "source down");

    ASSERT_TRUE(after.called);
    EXPECT_TRUE(after.error.ok());
    EXPECT_TRUE(after.lookup.stale);
    EXPECT_EQ(*after.lookup.payload, "older");
    EXPECT_EQ(after.lookup.refresh_error.code, ErrorCode::SourceFetch);
}

/**
 * @test TtlCache_Seed
 * @brief A seeded payload ages from its original store time.
 */
TEST(TtlCache, SeededEntryKeepsStoreTime) {
    Harness h;
    h.cache.seed("k", std::make_shared<const std::string>("persisted"), h.clock.now_ms() - 400);

    Result live;
    h.cache.get("k", h.producer(), live.callback());
    ASSERT_TRUE(live.called);
    EXPECT_EQ(*live.lookup.payload, "persisted");
    EXPECT_EQ(h.produced, 0);

    h.clock.advance(600);
    Result expired;
    h.cache.get("k", h.producer(), expired.callback());
    EXPECT_EQ(h.produced, 1);
}

/**
 * @test TtlCache_OnStored
 * @brief Successful builds are reported with key and store time.
 */
TEST(TtlCache, OnStoredReportsBuilds) {
    Harness h;
    std::string stored_key;
    int64_t stored_at = 0;
    h.cache.on_stored([&](const std::string& key, const StringCache::Payload&, int64_t at) {
        stored_key = key;
        stored_at = at;
    });

    Result r;
    h.cache.get("directory", h.producer(), r.callback());
    h.finish(0, "v");

    EXPECT_EQ(stored_key, "directory");
    EXPECT_EQ(stored_at, h.clock.now_ms());
}
