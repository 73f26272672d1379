#pragma once
#include "DemoConfig.hpp"
#include "tempo/core/Duration.hpp"
#include "tempo/utils/Body.hpp"

#include <spdlog/spdlog.h>

namespace tempo::app {

// Demo simulation: one bouncing body, stopped after RUN_LENGTH of simulated time
class BallState final {
private:
    utils::Body m_body;
    core::Duration m_simulated; // simulated time so far

public:
    BallState() { m_body.velocity = {0.35, 0.2}; }

    [[nodiscard]] const utils::Body &body() const { return m_body; }
    [[nodiscard]] core::Duration simulated() const { return m_simulated; }

    template <class Loop, class SetupTimer>
    void init(Loop &loop, const SetupTimer &setup) {
        spdlog::info("BallState::init()::initialization done in {}, running {} at {} ticks/s", setup, RUN_LENGTH,
                     loop.config().tickRate);
    }

    template <class Loop>
    void update(Loop &loop) {
        m_body.integrate(loop.tickDuration().count());
        m_simulated += loop.tickDuration();
        if (m_simulated >= RUN_LENGTH) {
            spdlog::info("BallState::update()::simulated {} with {} bounces", m_simulated, m_body.bounces);
            loop.stop();
        }
    }

    template <class Loop>
    void sec(Loop &loop) {
        spdlog::info("BallState::sec()::tick rate: {} frame rate: {} avg tick: {} avg frame: {}",
                     loop.ticks().getRate(), loop.frames().getRate(), loop.ticks().findAverage(),
                     loop.frames().findAverage());
    }

    [[nodiscard]] BallState scale(double factor) const {
        BallState scaled = *this;
        scaled.m_body    = m_body.scale(factor);
        return scaled;
    }

    [[nodiscard]] BallState combine(const BallState &other) const {
        BallState sum = *this;
        sum.m_body    = m_body.combine(other.m_body);
        return sum;
    }
};

} // namespace tempo::app
