#include "main_loop.hpp"

namespace Marquee {

namespace {

gboolean run_once(gpointer user_data) {
    auto* fn = static_cast<std::function<void()>*>(user_data);
    (*fn)();
    return G_SOURCE_REMOVE;
}

void destroy_fn(gpointer user_data) {
    delete static_cast<std::function<void()>*>(user_data);
}

} // namespace

guint schedule_timeout(guint interval_ms, std::function<void()> fn) {
    auto* data = new std::function<void()>(std::move(fn));
    return g_timeout_add_full(G_PRIORITY_DEFAULT, interval_ms, run_once, data, destroy_fn);
}

guint schedule_idle(std::function<void()> fn) {
    auto* data = new std::function<void()>(std::move(fn));
    return g_idle_add_full(G_PRIORITY_DEFAULT_IDLE, run_once, data, destroy_fn);
}

void cancel_source(guint& source_id) {
    if (source_id != 0) {
        g_source_remove(source_id);
        source_id = 0;
    }
}

} // namespace Marquee
