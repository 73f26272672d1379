#pragma once
#include "Clock.hpp"
#include "Duration.hpp"

namespace tempo::core {

// Measures time since a reference instant. The clock is borrowed and must outlive the timer.
template <Clock C>
class Timer final {
private:
    const C *m_clock; // borrowed clock
    Duration m_start; // reference instant

public:
    explicit Timer(const C &clock) : m_clock(&clock), m_start(clock.now()) {}

    // Recomputed from the clock on every call
    [[nodiscard]] Duration elapsed() const { return Duration(m_clock->now()) - m_start; }

    [[nodiscard]] const C &clock() const { return *m_clock; }

    // Moves the reference instant forward: elapsed() shrinks by d. A negative d rolls it back.
    Timer &operator+=(Duration d) {
        m_start += d;
        return *this;
    }

    [[nodiscard]] Timer operator+(Duration d) const {
        Timer shifted = *this;
        shifted += d;
        return shifted;
    }

#pragma region Comparisons against elapsed time
    friend Duration operator-(const Timer &timer, Duration d) { return timer.elapsed() - d; }
    friend Duration operator-(Duration d, const Timer &timer) { return d - timer.elapsed(); }

    friend bool operator==(const Timer &timer, Duration d) { return timer.elapsed() == d; }
    friend auto operator<=>(const Timer &timer, Duration d) { return timer.elapsed() <=> d; }
#pragma endregion
};

} // namespace tempo::core

template <tempo::core::Clock C>
struct fmt::formatter<tempo::core::Timer<C>> : fmt::formatter<tempo::core::Duration> {
    template <class FormatContext>
    auto format(const tempo::core::Timer<C> &timer, FormatContext &ctx) const {
        return fmt::formatter<tempo::core::Duration>::format(timer.elapsed(), ctx);
    }
};
