#pragma once
#include "BallState.hpp"

#include <cstdint>
#include <string>

namespace tempo::app {

// Draws the body's x position as a text track, only when the drawn cell changes
class TrackRender final {
private:
    std::uint32_t m_width;
    std::int64_t m_lastCell = -1; // nothing drawn yet

public:
    explicit TrackRender(std::uint32_t width = TRACK_WIDTH);

    template <class Loop>
    void render(const Loop &, const BallState &state) {
        draw(state.body().position.x);
    }

    [[nodiscard]] std::string track(double x) const; // "[----o----]"

private:
    void draw(double x);
    [[nodiscard]] std::int64_t cellOf(double x) const;
};

} // namespace tempo::app
