#include "Stat.hpp"

#include <spdlog/spdlog.h>

namespace tempo::core {

void Stat::record(Duration sample) {
    m_total += sample;
    ++m_count;
    ++m_cycle;
}

void Stat::refresh() {
    m_rate  = m_cycle;
    m_cycle = 0;
}

Duration Stat::findAverage() const {
    if (m_count == 0) return Duration();
    return m_total / static_cast<double>(m_count);
}

void Stat::openScope() {
#ifndef NDEBUG
    if (m_openScopes != 0) {
        spdlog::error("Stat::openScope()::a profiling scope is already open on this Stat");
    }
    ++m_openScopes;
#endif
}

void Stat::closeScope() {
#ifndef NDEBUG
    --m_openScopes;
#endif
}

} // namespace tempo::core
