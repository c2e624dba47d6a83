#pragma once

#include <glib.h>
#include <functional>

namespace Marquee {

/**
 * One-shot callbacks on the default GLib main context.
 * Both return the GSource id, which may be passed to cancel_source()
 * as long as the callback has not fired yet.
 */
guint schedule_timeout(guint interval_ms, std::function<void()> fn);
guint schedule_idle(std::function<void()> fn);

// Removes a pending source and zeroes the id. No-op for id 0.
void cancel_source(guint& source_id);

} // namespace Marquee
