#pragma once

#include <glib.h>
#include <cstdint>

namespace Marquee {

/**
 * Wall-clock source for timestamps (milliseconds since the Unix epoch)
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t now_ms() const = 0;
};

class SystemClock : public Clock {
public:
    int64_t now_ms() const override {
        return g_get_real_time() / 1000;
    }
};

} // namespace Marquee
