#pragma once
#include "Duration.hpp"

#include <cstdint>

namespace tempo::core {

// Time statistics of a repeated subroutine.
// refresh() closes a cycle; getRate() reports how many samples the last closed cycle held.
class Stat final {
private:
    Duration m_total;           // sum of recorded samples
    std::uint64_t m_count = 0;  // lifetime sample count
    std::uint64_t m_cycle = 0;  // samples since the last refresh
    std::uint64_t m_rate  = 0;  // m_cycle captured at the last refresh
    std::uint32_t m_openScopes = 0; // profiling scopes open on this Stat, tracked in debug builds only

public:
    Stat() = default;

    void record(Duration sample);
    Stat &operator+=(Duration sample) {
        record(sample);
        return *this;
    }

    // Ends the current cycle, e.g. once per second to turn a frame count into FPS
    void refresh();

    [[nodiscard]] Duration findAverage() const; // zero when nothing was recorded
    [[nodiscard]] Duration getTotal() const { return m_total; }
    [[nodiscard]] std::uint64_t getCount() const { return m_count; }
    [[nodiscard]] std::uint64_t getCycle() const { return m_cycle; }
    [[nodiscard]] std::uint64_t getRate() const { return m_rate; }

    // Bookkeeping for profiling scopes; only tracked in debug builds, always 0 otherwise
    void openScope();
    void closeScope();
    [[nodiscard]] std::uint32_t getOpenScopes() const { return m_openScopes; }
};

} // namespace tempo::core
