/**
 * @file test_settings.cpp
 * @brief Tests for Settings loading/normalization, the file blob store and
 *        the libsoup transport setup.
 */

#include <gtest/gtest.h>
#include <glib.h>
#include <glib/gstdio.h>
#include <string>

#include "marquee/blob_store.hpp"
#include "marquee/http_fetcher.hpp"
#include "marquee/settings.hpp"
#include "test_helpers.hpp"

using Marquee::FileBlobStore;
using Marquee::Settings;
using Marquee::SoupFetcher;
using TestSupport::run_until;

namespace {

class TempDir {
public:
    TempDir() {
        g_autoptr(GError) error = nullptr;
        gchar* dir = g_dir_make_tmp("marquee-test-XXXXXX", &error);
        path_ = dir ? dir : "";
        g_free(dir);
    }

    ~TempDir() {
        GDir* dir = g_dir_open(path_.c_str(), 0, nullptr);
        if (dir) {
            const gchar* name;
            while ((name = g_dir_read_name(dir)) != nullptr) {
                std::string file = path_ + "/" + name;
                g_remove(file.c_str());
            }
            g_dir_close(dir);
        }
        g_rmdir(path_.c_str());
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

// ------------------------------ Settings -----------------------------------

/**
 * @test Settings_Defaults
 * @brief Default-constructed settings carry the documented tunables.
 */
TEST(Settings, Defaults) {
    Settings s;
    EXPECT_EQ(s.max_parallel_fetches, 8);
    EXPECT_EQ(s.fetch_timeout_ms, 10000);
    EXPECT_EQ(s.failure_threshold, 3);
    EXPECT_EQ(s.history_window, 10);
    EXPECT_DOUBLE_EQ(s.history_decay, 0.9);
    EXPECT_EQ(s.staleness_threshold_ms, 7LL * 24 * 60 * 60 * 1000);
    EXPECT_EQ(s.fragment_ttl_ms, 30LL * 60 * 1000);
    EXPECT_EQ(s.directory_ttl_ms, 10LL * 60 * 1000);
    EXPECT_EQ(s.resolve_timeout_ms, 8000);
    EXPECT_EQ(s.resolve_retries_on_timeout, 1);
}

/**
 * @test Settings_PartialDocument
 * @brief Members present in the document override defaults; others stay.
 */
TEST(Settings, PartialDocumentKeepsDefaults) {
    Settings s = Settings::load_from_data(R"({"max_parallel_fetches": 2, "user_agent": "Test/2"})");
    EXPECT_EQ(s.max_parallel_fetches, 2);
    EXPECT_EQ(s.user_agent, "Test/2");
    EXPECT_EQ(s.fetch_timeout_ms, 10000);
}

/**
 * @test Settings_Clamping
 * @brief Out-of-range values are corrected by normalize().
 */
TEST(Settings, OutOfRangeValuesAreClamped) {
    Settings s = Settings::load_from_data(R"({
        "max_parallel_fetches": 0,
        "history_decay": 3.5,
        "fragment_ttl_ms": 1000,
        "directory_ttl_ms": 5000,
        "resolve_retries_on_timeout": 4
    })");
    EXPECT_EQ(s.max_parallel_fetches, 1);
    EXPECT_DOUBLE_EQ(s.history_decay, 0.9);
    EXPECT_EQ(s.fragment_ttl_ms, 1000);
    EXPECT_EQ(s.directory_ttl_ms, 1000);
    EXPECT_EQ(s.resolve_retries_on_timeout, 1);
}

/**
 * @test Settings_InvalidJson
 * @brief Unparsable settings fall back to the defaults.
 */
TEST(Settings, InvalidJsonYieldsDefaults) {
    Settings s = Settings::load_from_data("{not json");
    EXPECT_EQ(s.max_parallel_fetches, 8);
}

/**
 * @test Settings_SaveAndLoad
 * @brief Settings written to disk load back with the same values.
 */
TEST(Settings, SaveAndLoadFile) {
    TempDir dir;
    ASSERT_FALSE(dir.path().empty());
    std::string path = dir.path() + "/settings.json";

    Settings s;
    s.max_parallel_fetches = 3;
    s.history_decay = 0.75;
    s.user_agent = "Saved/1";
    ASSERT_TRUE(s.save_to_file(path));

    Settings loaded = Settings::load_from_file(path);
    EXPECT_EQ(loaded.max_parallel_fetches, 3);
    EXPECT_DOUBLE_EQ(loaded.history_decay, 0.75);
    EXPECT_EQ(loaded.user_agent, "Saved/1");
}

/**
 * @test Settings_MissingFile
 * @brief A missing settings file is not an error.
 */
TEST(Settings, MissingFileYieldsDefaults) {
    Settings s = Settings::load_from_file("/nonexistent/marquee/settings.json");
    EXPECT_EQ(s.failure_threshold, 3);
}

// ------------------------------ Blob store ---------------------------------

/**
 * @test FileBlobStore_RoundTrip
 * @brief Saved blobs are returned by load; unknown keys are empty.
 */
TEST(FileBlobStore, SaveThenLoad) {
    TempDir dir;
    FileBlobStore store(dir.path());

    EXPECT_FALSE(store.load("sources").has_value());
    ASSERT_TRUE(store.save("sources", R"({"sources":[]})"));

    auto blob = store.load("sources");
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(*blob, R"({"sources":[]})");
    EXPECT_TRUE(g_file_test((dir.path() + "/sources.json").c_str(), G_FILE_TEST_EXISTS));
}

// ------------------------------ Transport ----------------------------------

/**
 * @test SoupFetcher_SessionTimeout
 * @brief The session timeout comes from construction and requests with other
 *        bounds leave it alone.
 */
TEST(SoupFetcher, SessionTimeoutFixedAtConstruction) {
    SoupFetcher fetcher("Marquee-Test/1", 2500);
    EXPECT_EQ(fetcher.timeout_seconds(), 3u);

    GCancellable* cancellable = g_cancellable_new();
    g_cancellable_cancel(cancellable);

    bool done = false;
    std::string error;
    fetcher.fetch("http://127.0.0.1:9/config.json", 100, cancellable,
                  [&](const std::string&, const std::string& e) {
        done = true;
        error = e;
    });
    ASSERT_TRUE(run_until([&done]() { return done; }));
    g_object_unref(cancellable);

    EXPECT_FALSE(error.empty());
    EXPECT_EQ(fetcher.timeout_seconds(), 3u);
}

/**
 * @test SoupFetcher_InvalidUrl
 * @brief A url libsoup cannot parse fails right away.
 */
TEST(SoupFetcher, InvalidUrlFailsImmediately) {
    SoupFetcher fetcher;
    std::string error;
    fetcher.fetch("not a url", 1000, nullptr, [&error](const std::string&, const std::string& e) { error = e; });
    EXPECT_EQ(error, "Invalid URL: not a url");
}
