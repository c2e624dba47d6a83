/**
 * @file test_helpers.hpp
 * @brief Fakes and main-context helpers shared by the unit tests.
 */

#pragma once

#include "marquee/blob_store.hpp"
#include "marquee/clock.hpp"
#include "marquee/http_fetcher.hpp"
#include "marquee/main_loop.hpp"
#include "resolver/resolver_types.hpp"
#include <gio/gio.h>
#include <glib.h>
#include <algorithm>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace TestSupport {

/**
 * Iterate the default main context until pred holds or timeout_ms passes.
 * @return pred() after the loop
 */
inline bool run_until(const std::function<bool()>& pred, guint timeout_ms = 3000) {
    bool timed_out = false;
    guint guard = g_timeout_add(timeout_ms, [](gpointer data) -> gboolean {
        *static_cast<bool*>(data) = true;
        return G_SOURCE_REMOVE;
    }, &timed_out);

    while (!pred() && !timed_out) {
        g_main_context_iteration(nullptr, TRUE);
    }

    if (!timed_out) {
        g_source_remove(guard);
    }
    return pred();
}

// Dispatch everything that is ready without blocking
inline void drain() {
    while (g_main_context_iteration(nullptr, FALSE)) {
    }
}

// Let the main loop run for a fixed time
inline void spin_for(guint ms) {
    bool done = false;
    Marquee::schedule_timeout(ms, [&done]() { done = true; });
    run_until([&done]() { return done; }, ms + 1000);
}

class ManualClock : public Marquee::Clock {
public:
    explicit ManualClock(int64_t start = 1700000000000LL) : now_(start) {}

    int64_t now_ms() const override { return now_; }

    void advance(int64_t ms) { now_ += ms; }
    void set(int64_t ms) { now_ = ms; }

private:
    int64_t now_;
};

class MemoryBlobStore : public Marquee::BlobStore {
public:
    std::optional<std::string> load(const std::string& key) override {
        auto it = blobs.find(key);
        if (it == blobs.end()) return std::nullopt;
        return it->second;
    }

    bool save(const std::string& key, const std::string& blob) override {
        saves[key]++;
        blobs[key] = blob;
        return true;
    }

    std::map<std::string, std::string> blobs;
    std::map<std::string, int> saves;
};

/**
 * Scripted transport. Unknown urls answer with an HTTP 404 error.
 */
class FakeFetcher : public Marquee::HttpFetcher {
public:
    struct Response {
        std::string body;
        std::string error;
        guint delay_ms = 0;
        bool hang = false;
    };

    void set_body(const std::string& url, const std::string& body, guint delay_ms = 0) {
        responses[url] = Response{body, "", delay_ms, false};
    }

    void set_error(const std::string& url, const std::string& error, guint delay_ms = 0) {
        responses[url] = Response{"", error, delay_ms, false};
    }

    void set_hang(const std::string& url) {
        responses[url] = Response{"", "", 0, true};
    }

    void fetch(const std::string& url,
               guint /*timeout_ms*/,
               GCancellable* cancellable,
               FetchCallback callback) override {
        calls[url]++;
        total_calls++;
        in_flight++;
        max_in_flight = std::max(max_in_flight, in_flight);

        Response response;
        auto it = responses.find(url);
        if (it != responses.end()) {
            response = it->second;
        } else {
            response.error = "HTTP error: 404";
        }

        if (response.hang) {
            // Never answers; only the caller's own timeout ends the request
            hung.push_back(std::move(callback));
            return;
        }

        GCancellable* held = cancellable ? G_CANCELLABLE(g_object_ref(cancellable)) : nullptr;
        auto deliver = [this, held, response, callback]() {
            in_flight--;
            bool cancelled = held && g_cancellable_is_cancelled(held);
            if (held) g_object_unref(held);

            if (cancelled) {
                callback("", "Request failed: Operation was cancelled");
            } else {
                callback(response.body, response.error);
            }
        };

        if (response.delay_ms > 0) {
            Marquee::schedule_timeout(response.delay_ms, deliver);
        } else {
            Marquee::schedule_idle(deliver);
        }
    }

    int calls_for(const std::string& url) const {
        auto it = calls.find(url);
        return it == calls.end() ? 0 : it->second;
    }

    std::map<std::string, Response> responses;
    std::map<std::string, int> calls;
    std::vector<FetchCallback> hung;
    int total_calls = 0;
    int in_flight = 0;
    int max_in_flight = 0;
};

/**
 * Plugin answering from a script, one entry per call; the last entry repeats
 */
class FakePlugin : public Resolver::Plugin {
public:
    struct Step {
        Resolver::PluginStatus status = Resolver::PluginStatus::Success;
        guint delay_ms = 0;
        bool hang = false;
        std::string url;
        std::string message;
    };

    explicit FakePlugin(std::vector<Step> steps) : steps_(std::move(steps)) {}

    static std::shared_ptr<FakePlugin> succeeding(const std::string& url, guint delay_ms = 0) {
        Step step;
        step.url = url;
        step.delay_ms = delay_ms;
        return std::make_shared<FakePlugin>(std::vector<Step>{step});
    }

    static std::shared_ptr<FakePlugin> hanging() {
        Step step;
        step.hang = true;
        return std::make_shared<FakePlugin>(std::vector<Step>{step});
    }

    static std::shared_ptr<FakePlugin> answering(Resolver::PluginStatus status, const std::string& message) {
        Step step;
        step.status = status;
        step.message = message;
        return std::make_shared<FakePlugin>(std::vector<Step>{step});
    }

    void resolve(const Resolver::ResolveRequest& request,
                 GCancellable* /*cancellable*/,
                 ResponseCallback callback) override {
        last_request = request;
        const Step& step = steps_[std::min(calls, steps_.size() - 1)];
        calls++;

        if (step.hang) {
            hung.push_back(std::move(callback));
            return;
        }

        Resolver::PluginResponse response;
        response.status = step.status;
        response.message = step.message;
        if (!step.url.empty()) {
            response.stream.urls.push_back(step.url);
        }

        auto deliver = [callback, response]() { callback(response); };
        if (step.delay_ms > 0) {
            Marquee::schedule_timeout(step.delay_ms, deliver);
        } else {
            Marquee::schedule_idle(deliver);
        }
    }

    size_t calls = 0;
    Resolver::ResolveRequest last_request;
    std::vector<ResponseCallback> hung;

private:
    std::vector<Step> steps_;
};

class FakeLoader : public Resolver::PluginLoader {
public:
    std::shared_ptr<Resolver::Plugin> instantiate(const Resolver::PluginDescriptor& descriptor,
                                                  const std::string& /*bytes*/,
                                                  std::string& error) override {
        instantiations++;
        auto it = plugins.find(descriptor.id);
        if (it == plugins.end()) {
            error = "No plugin body for " + descriptor.id;
            return nullptr;
        }
        return it->second;
    }

    std::map<std::string, std::shared_ptr<Resolver::Plugin>> plugins;
    int instantiations = 0;
};

inline std::string sha256_hex(const std::string& bytes) {
    gchar* digest = g_compute_checksum_for_string(G_CHECKSUM_SHA256, bytes.c_str(), static_cast<gssize>(bytes.size()));
    std::string result = digest;
    g_free(digest);
    return result;
}

inline Resolver::PluginDescriptor make_descriptor(const std::string& id,
                                                  std::vector<std::string> formats,
                                                  const std::string& bytes,
                                                  int priority = 0) {
    Resolver::PluginDescriptor descriptor;
    descriptor.id = id;
    descriptor.name = id;
    descriptor.version = "1.0";
    descriptor.supported_formats = std::move(formats);
    descriptor.checksum = sha256_hex(bytes);
    descriptor.priority = priority;
    return descriptor;
}

/**
 * {"key": ..., "name": ..., "type": ..., "api": ...} with optional extra members
 */
inline std::string site_json(const std::string& key,
                             const std::string& name,
                             int type = 1,
                             const std::string& extra = "") {
    std::string json = "{\"key\":\"" + key + "\",\"name\":\"" + name +
                       "\",\"type\":" + std::to_string(type) +
                       ",\"api\":\"https://api.example/" + key + "\"";
    if (!extra.empty()) {
        json += "," + extra;
    }
    return json + "}";
}

inline std::string document_json(const std::vector<std::string>& sites, const std::string& extra = "") {
    std::string json = "{\"sites\":[";
    for (size_t i = 0; i < sites.size(); i++) {
        if (i > 0) json += ",";
        json += sites[i];
    }
    json += "]";
    if (!extra.empty()) {
        json += "," + extra;
    }
    return json + "}";
}

} // namespace TestSupport
