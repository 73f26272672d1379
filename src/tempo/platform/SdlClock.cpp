#include "SdlClock.hpp"

#include <SDL3/SDL_timer.h>

#include <stdexcept>

namespace tempo::platform {

SdlClock::SdlClock() : m_start(SDL_GetPerformanceCounter()) {
    const Uint64 frequency = SDL_GetPerformanceFrequency();
    if (frequency == 0) {
        throw std::runtime_error("SdlClock::SdlClock()::performance counter unavailable");
    }
    m_frequency = static_cast<double>(frequency);
}

double SdlClock::now() const {
    return static_cast<double>(SDL_GetPerformanceCounter() - m_start) / m_frequency;
}

} // namespace tempo::platform
