#include "Clock.hpp"

namespace tempo::core {

SteadyClock::SteadyClock() : m_epoch(std::chrono::steady_clock::now()) {}

double SteadyClock::now() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - m_epoch).count();
}

} // namespace tempo::core
