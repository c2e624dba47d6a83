/**
 * @file test_plugin_registry.cpp
 * @brief Tests for plugin verification, loading and lookup.
 *
 * Validates:
 *  - Checksum verification before instantiation, digest prefixes and case
 *  - Rejected (id, checksum) pairs stay frozen
 *  - Loader failures, unload, priority ordering per format
 */

#include <gtest/gtest.h>
#include <memory>
#include <string>

#include "resolver/plugin_registry.hpp"
#include "test_helpers.hpp"

using Marquee::ErrorCode;
using Resolver::LoadState;
using Resolver::PluginRegistry;
using TestSupport::FakeLoader;
using TestSupport::FakePlugin;
using TestSupport::make_descriptor;
using TestSupport::ManualClock;

namespace {

class PluginRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        loader = std::make_shared<FakeLoader>();
        registry = std::make_unique<PluginRegistry>(loader, clock);
    }

    void provide(const std::string& id) {
        loader->plugins[id] = FakePlugin::succeeding("https://cdn.example/" + id + ".m3u8");
    }

    ManualClock clock;
    std::shared_ptr<FakeLoader> loader;
    std::unique_ptr<PluginRegistry> registry;
};

} // namespace

// ------------------------------ Loading ------------------------------------

/**
 * @test Plugins_LoadVerified
 * @brief Matching bytes are instantiated and recorded as Loaded.
 */
TEST_F(PluginRegistryTest, VerifiedPluginLoads) {
    provide("p1");
    auto descriptor = make_descriptor("p1", {"video_api"}, "plugin body");

    ASSERT_TRUE(registry->load(descriptor, "plugin body").ok());
    EXPECT_EQ(registry->state("p1"), LoadState::Loaded);

    auto record = registry->find("p1");
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->plugin);
    EXPECT_EQ(record->loaded_at, clock.now_ms());
    EXPECT_EQ(loader->instantiations, 1);
}

/**
 * @test Plugins_ChecksumMismatchFrozen
 * @brief A mismatch rejects the plugin without instantiating it, and the pair
 *        stays rejected even when correct bytes are offered later.
 */
TEST_F(PluginRegistryTest, ChecksumMismatchRejectsAndFreezes) {
    provide("p1");
    auto descriptor = make_descriptor("p1", {"video_api"}, "genuine");

    auto error = registry->load(descriptor, "tampered");
    EXPECT_EQ(error.code, ErrorCode::PluginChecksum);
    EXPECT_EQ(registry->state("p1"), LoadState::Rejected);
    EXPECT_TRUE(registry->is_frozen("p1", descriptor.checksum));
    EXPECT_EQ(loader->instantiations, 0);

    auto retry = registry->load(descriptor, "genuine");
    EXPECT_EQ(retry.code, ErrorCode::PluginChecksum);
    EXPECT_EQ(registry->state("p1"), LoadState::Rejected);
    EXPECT_EQ(loader->instantiations, 0);
}

/**
 * @test Plugins_NewChecksumAfterRejection
 * @brief A rejected id can load again under a different checksum.
 */
TEST_F(PluginRegistryTest, RejectionIsPerChecksum) {
    provide("p1");
    auto bad = make_descriptor("p1", {"video_api"}, "v1");
    ASSERT_EQ(registry->load(bad, "v1 tampered").code, ErrorCode::PluginChecksum);

    auto good = make_descriptor("p1", {"video_api"}, "v2");
    ASSERT_TRUE(registry->load(good, "v2").ok());
    EXPECT_EQ(registry->state("p1"), LoadState::Loaded);
}

/**
 * @test Plugins_ChecksumForms
 * @brief Prefixed, upper case and length-detected digests all verify.
 */
TEST(PluginChecksum, DigestForms) {
    std::string error;
    std::string bytes = "hello";
    std::string sha256 = TestSupport::sha256_hex(bytes);

    EXPECT_TRUE(PluginRegistry::verify_checksum(bytes, sha256, error)) << error;
    EXPECT_TRUE(PluginRegistry::verify_checksum(bytes, "sha256:" + sha256, error)) << error;

    gchar* upper = g_ascii_strup(sha256.c_str(), -1);
    EXPECT_TRUE(PluginRegistry::verify_checksum(bytes, upper, error)) << error;
    g_free(upper);

    EXPECT_TRUE(PluginRegistry::verify_checksum(bytes, "5d41402abc4b2a76b9719d911017c592", error)) << error;
    EXPECT_TRUE(PluginRegistry::verify_checksum(bytes, "md5:5d41402abc4b2a76b9719d911017c592", error)) << error;

    EXPECT_FALSE(PluginRegistry::verify_checksum(bytes, "abc", error));
    EXPECT_NE(error.find("Unsupported"), std::string::npos);
}

/**
 * @test Plugins_LoaderFailure
 * @brief A loader that cannot instantiate the plugin gives PluginLoad.
 */
TEST_F(PluginRegistryTest, LoaderFailureIsPluginLoad) {
    auto descriptor = make_descriptor("missing", {"video_api"}, "bytes");
    auto error = registry->load(descriptor, "bytes");

    EXPECT_EQ(error.code, ErrorCode::PluginLoad);
    EXPECT_EQ(registry->state("missing"), LoadState::Unverified);
    EXPECT_FALSE(registry->is_frozen("missing", descriptor.checksum));
}

/**
 * @test Plugins_EmptyId
 * @brief A descriptor without id is refused.
 */
TEST_F(PluginRegistryTest, EmptyIdRefused) {
    auto descriptor = make_descriptor("", {"video_api"}, "bytes");
    EXPECT_EQ(registry->load(descriptor, "bytes").code, ErrorCode::InvalidArgument);
}

// ------------------------------ Lookup -------------------------------------

/**
 * @test Plugins_Unload
 * @brief Unloading removes the record; a held snapshot keeps it.
 */
TEST_F(PluginRegistryTest, UnloadRemovesRecord) {
    provide("p1");
    ASSERT_TRUE(registry->load(make_descriptor("p1", {"video_api"}, "b"), "b").ok());

    auto before = registry->snapshot();
    ASSERT_TRUE(registry->unload("p1").ok());

    EXPECT_EQ(registry->state("p1"), LoadState::Unverified);
    EXPECT_EQ(before->size(), 1u);
    EXPECT_EQ(registry->unload("p1").code, ErrorCode::InvalidArgument);
}

/**
 * @test Plugins_FormatOrdering
 * @brief Plugins for a format come back by priority, then id.
 */
TEST_F(PluginRegistryTest, LoadedForFormatOrdering) {
    for (const char* id : {"b", "a", "c", "other"}) {
        provide(id);
    }
    ASSERT_TRUE(registry->load(make_descriptor("b", {"video_api"}, "b", 5), "b").ok());
    ASSERT_TRUE(registry->load(make_descriptor("a", {"video_api"}, "a", 5), "a").ok());
    ASSERT_TRUE(registry->load(make_descriptor("c", {"video_api", "video"}, "c", 9), "c").ok());
    ASSERT_TRUE(registry->load(make_descriptor("other", {"video_script"}, "o", 99), "o").ok());

    auto chain = registry->loaded_for_format("video_api");
    ASSERT_EQ(chain.size(), 3u);
    EXPECT_EQ(chain[0].descriptor.id, "c");
    EXPECT_EQ(chain[1].descriptor.id, "a");
    EXPECT_EQ(chain[2].descriptor.id, "b");

    EXPECT_EQ(registry->loaded_for_format("video").size(), 1u);
    EXPECT_TRUE(registry->loaded_for_format("live").empty());
}
