#pragma once
#include <SDL3/SDL_stdinc.h>

namespace tempo::platform {

// Clock backed by SDL's high resolution performance counter.
// SDL must be initialized before the clock is created.
class SdlClock final {
private:
    Uint64 m_start     = 0; // counter value at construction
    double m_frequency = 0; // counter ticks per second

public:
    SdlClock();

    // Seconds since construction
    [[nodiscard]] double now() const;
};

} // namespace tempo::platform
