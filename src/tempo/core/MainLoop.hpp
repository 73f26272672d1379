#pragma once
#include "Clock.hpp"
#include "Duration.hpp"
#include "LoopConfig.hpp"
#include "Profile.hpp"
#include "Stat.hpp"
#include "Timer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <utility>

namespace tempo::core {

// Simulation state advanced by a loop. Blending uses scale/combine:
// blended = previous.scale(1 - alpha).combine(current.scale(alpha))
template <class S, class Loop>
concept LoopState = std::default_initializable<S> && std::copyable<S> &&
                    requires(S &state, const S &view, Loop &loop, typename Loop::TimerType setup, double factor) {
                        state.init(loop, setup); // once, before the first frame
                        state.update(loop);      // once per tick
                        state.sec(loop);         // once per elapsed second
                        { view.scale(factor) } -> std::convertible_to<S>;
                        { view.combine(view) } -> std::convertible_to<S>;
                    };

// Consumes the blended state once per rendered frame, read-only
template <class R, class Loop, class S>
concept LoopRender = requires(R &render, const Loop &loop, const S &state) { render.render(loop, state); };

/**
 * Fixed-timestep main loop.
 *
 * Every frame the time measured since the previous frame is added to an accumulator, which is
 * drained in fixed ticks of 1 / tickRate seconds. Rendering happens once per frame on the state
 * interpolated between the last two ticks, so the tick rate can be far lower than the frame
 * rate. Once per second the state gets a sec() call and both rate meters are refreshed.
 *
 * Single-threaded; stop() is cooperative and only observed between ticks.
 */
template <Clock C, class S>
class MainLoop final {
public:
    using ClockType = C;
    using StateType = S;
    using TimerType = Timer<C>;

private:
    enum class Phase : std::uint8_t { Idle, Running, Stopped };

    const C *m_clock;
    LoopConfig m_config;
    Duration m_tick;            // fixed tick duration
    Phase m_phase        = Phase::Idle;
    bool m_stopRequested = false;

    Duration m_accumulator; // owed simulation time
    S m_current{};
    S m_previous{};

    Timer<C> m_setupTimer;  // since construction, handed to S::init
    Timer<C> m_tickTimer;   // frame time measurement
    Timer<C> m_secondTimer; // reporting cadence
    Stat m_ticks;
    Stat m_frames;

public:
    MainLoop(const LoopConfig &config, const C &clock)
        : m_clock(&clock), m_config(config), m_tick(1.0 / config.tickRate), m_setupTimer(clock),
          m_tickTimer(clock), m_secondTimer(clock) {}

    MainLoop(double tickRate, const C &clock) : MainLoop(LoopConfig{.tickRate = tickRate}, clock) {}

    MainLoop(const MainLoop &)            = delete;
    MainLoop &operator=(const MainLoop &) = delete;
    MainLoop(MainLoop &&)                 = delete;
    MainLoop &operator=(MainLoop &&)      = delete;

    // Runs begin() and then frames until stopped
    template <class R>
    [[nodiscard]] bool start(R &render) {
        if (!begin()) return false;
        while (frame(render)) {
        }
        return true;
    }

    // Idle -> Running: initializes the state and starts the frame timers
    [[nodiscard]] bool begin() {
        static_assert(LoopState<S, MainLoop>, "state type does not satisfy LoopState");

        if (m_phase != Phase::Idle) {
            spdlog::error("MainLoop::begin()::loop was already started");
            return false;
        }
        if (!(m_config.tickRate > 0.0) || !std::isfinite(m_config.tickRate) || !std::isfinite(m_tick.count())) {
            spdlog::error("MainLoop::begin()::invalid tick rate: {}", m_config.tickRate);
            return false;
        }
        m_phase = Phase::Running;
        spdlog::trace("MainLoop::begin()::starting, tick {} ({} ticks/s)", m_tick, m_config.tickRate);

        m_previous = S{};
        m_current  = S{};
        m_current.init(*this, m_setupTimer);

        m_accumulator = Duration();
        m_tickTimer   = Timer<C>(*m_clock);
        m_secondTimer = Timer<C>(*m_clock);
        return true;
    }

    // One driving call: ticks owed so far, one render, and the per-second report when due.
    // Returns false once the loop has stopped.
    template <class R>
    bool frame(R &render) {
        static_assert(LoopRender<R, MainLoop, S>, "render type does not satisfy LoopRender");

        if (m_phase != Phase::Running) return false;

        const Duration elapsed = m_tickTimer.elapsed();
        m_tickTimer += elapsed;
        m_accumulator += elapsed;

        drainTicks();

        if (shouldRender()) {
            Profile scope(*m_clock, m_frames);
            const double blend = alpha();
            const S drawn      = m_previous.scale(1.0 - blend).combine(m_current.scale(blend));
            render.render(std::as_const(*this), drawn);
        }

        if (!m_stopRequested && m_secondTimer >= Duration::ONE) {
            m_current.sec(*this);
            m_ticks.refresh();
            m_frames.refresh();
            m_secondTimer += Duration::ONE; // overshoot carries into the next second
        }

        if (m_stopRequested) {
            m_phase = Phase::Stopped;
            spdlog::trace("MainLoop::frame()::stopped after {} ticks and {} frames", m_ticks.getCount(),
                          m_frames.getCount());
            return false;
        }
        return true;
    }

    // Requests termination; the tick in progress and one final render still complete
    void stop() {
        if (m_phase == Phase::Stopped || m_stopRequested) return;
        m_stopRequested = true;
        spdlog::trace("MainLoop::stop()::stop requested");
    }

    void setRenderLimit(RenderLimit limit) { m_config.renderLimit = limit; }

    [[nodiscard]] const Stat &ticks() const { return m_ticks; }
    [[nodiscard]] const Stat &frames() const { return m_frames; }
    [[nodiscard]] const LoopConfig &config() const { return m_config; }
    [[nodiscard]] const C &clock() const { return *m_clock; }
    [[nodiscard]] Duration tickDuration() const { return m_tick; }
    [[nodiscard]] Duration accumulator() const { return m_accumulator; }
    [[nodiscard]] const S &current() const { return m_current; }
    [[nodiscard]] const S &previous() const { return m_previous; }

    // Fraction of a tick owed beyond the last completed tick
    [[nodiscard]] double alpha() const { return std::clamp(m_accumulator.count() / m_tick.count(), 0.0, 1.0); }

    [[nodiscard]] bool isRunning() const { return m_phase == Phase::Running; }
    [[nodiscard]] bool isStopped() const { return m_phase == Phase::Stopped; }
    [[nodiscard]] bool isStopRequested() const { return m_stopRequested; }

private:
    void drainTicks() {
        std::uint32_t drained = 0;
        while (m_accumulator >= m_tick && !m_stopRequested) {
            if (m_config.maxTicksPerFrame != 0 && drained == m_config.maxTicksPerFrame) {
                const Duration remainder(std::fmod(m_accumulator.count(), m_tick.count()));
                spdlog::warn("MainLoop::frame()::catch-up cap of {} ticks reached, dropping {}",
                             m_config.maxTicksPerFrame, m_accumulator - remainder);
                m_accumulator = remainder;
                break;
            }
            {
                Profile scope(*m_clock, m_ticks);
                m_previous = m_current;
                m_current.update(*this);
            }
            m_accumulator -= m_tick;
            ++drained;
        }
    }

    [[nodiscard]] bool shouldRender() const {
        switch (m_config.renderLimit) {
        case RenderLimit::Never:
            return false;
        case RenderLimit::Once:
            return m_frames.getCycle() == 0;
        case RenderLimit::Always:
            return true;
        }
        return true;
    }
};

} // namespace tempo::core
