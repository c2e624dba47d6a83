#include "http_fetcher.hpp"

namespace Marquee {

SoupFetcher::SoupFetcher(const std::string& user_agent, guint timeout_ms) {
    session_ = soup_session_new();
    g_object_set(session_, "user-agent", user_agent.c_str(), nullptr);

    // Session-level timeout is in seconds; the pipeline enforces the exact bound
    guint timeout_s = (timeout_ms + 999) / 1000;
    if (timeout_s > 0) {
        g_object_set(session_, "timeout", timeout_s, nullptr);
    }
}

SoupFetcher::~SoupFetcher() {
    if (session_) {
        g_object_unref(session_);
    }
}

guint SoupFetcher::timeout_seconds() const {
    guint timeout_s = 0;
    g_object_get(session_, "timeout", &timeout_s, nullptr);
    return timeout_s;
}

void SoupFetcher::fetch(const std::string& url,
                        guint /*timeout_ms*/,
                        GCancellable* cancellable,
                        FetchCallback callback) {
    SoupMessage* msg = soup_message_new("GET", url.c_str());
    if (!msg) {
        callback("", "Invalid URL: " + url);
        return;
    }

    SoupMessageHeaders* headers = soup_message_get_request_headers(msg);
    soup_message_headers_append(headers, "Accept", "application/json,text/plain,*/*");

    struct RequestData {
        FetchCallback callback;
    };
    auto* data = new RequestData{std::move(callback)};

    g_debug("[Http] GET %s", url.c_str());

    soup_session_send_and_read_async(
        session_,
        msg,
        G_PRIORITY_DEFAULT,
        cancellable,
        [](GObject* source, GAsyncResult* result, gpointer user_data) {
            auto* data = static_cast<RequestData*>(user_data);
            g_autoptr(GError) error = nullptr;

            GBytes* bytes = soup_session_send_and_read_finish(
                SOUP_SESSION(source), result, &error);

            if (error) {
                data->callback("", std::string("Request failed: ") + error->message);
                delete data;
                return;
            }

            SoupMessage* msg = soup_session_get_async_result_message(
                SOUP_SESSION(source), result);
            guint status = soup_message_get_status(msg);

            if (status < 200 || status >= 300) {
                data->callback("", "HTTP error: " + std::to_string(status));
                g_bytes_unref(bytes);
                delete data;
                return;
            }

            gsize size;
            const char* body_data = static_cast<const char*>(g_bytes_get_data(bytes, &size));
            std::string body(body_data ? body_data : "", size);

            g_bytes_unref(bytes);
            data->callback(body, "");
            delete data;
        },
        data
    );

    g_object_unref(msg);
}

} // namespace Marquee
