#include "TrackRender.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace tempo::app {

TrackRender::TrackRender(std::uint32_t width) : m_width(std::max<std::uint32_t>(width, 1)) {}

std::int64_t TrackRender::cellOf(double x) const {
    const auto cell = static_cast<std::int64_t>(std::floor(x * m_width));
    return std::clamp<std::int64_t>(cell, 0, static_cast<std::int64_t>(m_width) - 1);
}

std::string TrackRender::track(double x) const {
    std::string line(m_width + 2, '-');
    line.front()                                 = '[';
    line.back()                                  = ']';
    line[static_cast<std::size_t>(cellOf(x)) + 1] = 'o';
    return line;
}

void TrackRender::draw(double x) {
    const std::int64_t cell = cellOf(x);
    if (cell == m_lastCell) return;
    m_lastCell = cell;
    spdlog::info("{} {:5.1f}%", track(x), x * 100.0);
}

} // namespace tempo::app
