#pragma once
#include "Stat.hpp"
#include "Timer.hpp"

#include <concepts>

namespace tempo::core {

// Anything a measured duration can be accumulated into (a Stat, a Duration total...)
template <class S>
concept ProfileSink = requires(S &sink, Duration d) { sink += d; };

// Scoped measurement: feeds the sink exactly one sample, the scope's lifetime, on every exit path.
// At most one scope may be open on a sink at a time.
template <Clock C, ProfileSink S = Stat>
class Profile final {
private:
    Timer<C> m_timer;
    S &m_sink;

public:
    Profile(const C &clock, S &sink) : m_timer(clock), m_sink(sink) {
        if constexpr (std::same_as<S, Stat>) m_sink.openScope();
    }

    ~Profile() {
        m_sink += m_timer.elapsed();
        if constexpr (std::same_as<S, Stat>) m_sink.closeScope();
    }

    Profile(const Profile &)            = delete;
    Profile &operator=(const Profile &) = delete;
    Profile(Profile &&)                 = delete;
    Profile &operator=(Profile &&)      = delete;

    [[nodiscard]] Duration elapsed() const { return m_timer.elapsed(); }
};

} // namespace tempo::core
