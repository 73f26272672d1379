// ============================================================================
// MainLoop smoke: fixed-tick draining, interpolation, per-second reporting,
// cooperative stop, render limits and the catch-up cap. Every scenario runs
// against a manual clock so frame times are exact.
// ============================================================================

#include "Support/ManualClock.hpp"
#include "tempo/core/MainLoop.hpp"

#include <cstdint>

namespace
{
    using tempo::core::Duration;
    using tempo::core::LoopConfig;
    using tempo::core::MainLoop;
    using tempo::core::RenderLimit;
    using tempo::tests::ManualClock;
    using tempo::tests::NearlyEqual;
    using tempo::tests::SteppingClock;

    // value is blended; the counters are bookkeeping carried by the left operand.
    // StopAt > 0 requests a stop from inside that tick.
    template <std::uint64_t StopAt>
    struct CountingState
    {
        double        value = 0.0;
        std::uint64_t inits = 0;
        std::uint64_t updates = 0;
        std::uint64_t secs = 0;
        std::uint64_t lastTickCycle = 0;
        std::uint64_t lastFrameCycle = 0;

        template <class Loop, class Setup>
        void init(Loop&, const Setup&)
        {
            ++inits;
        }

        template <class Loop>
        void update(Loop& loop)
        {
            value += 1.0;
            ++updates;
            if (StopAt != 0U && updates == StopAt)
            {
                loop.stop();
            }
        }

        template <class Loop>
        void sec(Loop& loop)
        {
            ++secs;
            lastTickCycle = loop.ticks().getCycle();
            lastFrameCycle = loop.frames().getCycle();
        }

        [[nodiscard]] CountingState scale(double factor) const
        {
            CountingState scaled = *this;
            scaled.value = value * factor;
            return scaled;
        }

        [[nodiscard]] CountingState combine(const CountingState& other) const
        {
            CountingState sum = *this;
            sum.value = value + other.value;
            return sum;
        }
    };

    struct RecordingRender
    {
        std::uint64_t renders = 0;
        double        lastValue = -1.0;

        template <class Loop, class State>
        void render(const Loop&, const State& state)
        {
            ++renders;
            lastValue = state.value;
        }
    };

    int RunInterpolationScenario()
    {
        ManualClock clock;
        MainLoop<ManualClock, CountingState<0>> loop(100.0, clock);
        RecordingRender render;

        if (!loop.begin() || !loop.isRunning() || loop.current().inits != 1U)
        {
            return 10;
        }

        clock.set(0.035);
        if (!loop.frame(render))
        {
            return 11;
        }

        if (loop.current().updates != 3U || loop.ticks().getCount() != 3U || loop.frames().getCount() != 1U)
        {
            return 12;
        }
        if (!NearlyEqual(loop.accumulator().count(), 0.005) || !NearlyEqual(loop.alpha(), 0.5, 1e-6))
        {
            return 13;
        }
        // previous = 2, current = 3, blended halfway
        if (loop.previous().value != 2.0 || loop.current().value != 3.0 || !NearlyEqual(render.lastValue, 2.5, 1e-6))
        {
            return 14;
        }

        // Not enough time for another tick: render only, same state
        clock.set(0.039);
        if (!loop.frame(render) || loop.current().updates != 3U || render.renders != 2U)
        {
            return 15;
        }

        return 0;
    }

    int RunSecondReportScenario()
    {
        ManualClock clock;
        MainLoop<ManualClock, CountingState<0>> loop(100.0, clock);
        RecordingRender render;

        if (!loop.begin())
        {
            return 20;
        }

        constexpr std::uint64_t kFrames = 100'000; // 1000 simulated seconds
        for (std::uint64_t k = 1; k <= kFrames; ++k)
        {
            clock.set(static_cast<double>(k) / 100.0);
            if (!loop.frame(render))
            {
                return 21;
            }
            if (k == 99 && loop.current().secs != 0U)
            {
                return 22;
            }
            if (k == 100 && loop.current().secs != 1U)
            {
                return 23;
            }
        }

        // Overshoot carries over: no drift after 1000 seconds
        if (loop.current().secs != 1000U)
        {
            return 24;
        }
        if (loop.ticks().getCount() < kFrames - 2U || loop.ticks().getCount() > kFrames)
        {
            return 25;
        }
        if (loop.current().lastFrameCycle != 100U || loop.frames().getRate() != 100U)
        {
            return 26;
        }
        if (loop.current().lastTickCycle < 98U || loop.current().lastTickCycle > 102U)
        {
            return 27;
        }

        return 0;
    }

    int RunStopScenario()
    {
        ManualClock clock;
        MainLoop<ManualClock, CountingState<5>> loop(100.0, clock);
        RecordingRender render;

        if (!loop.begin())
        {
            return 30;
        }

        // 10 ticks owed and a report due, but update #5 stops the loop
        clock.set(1.5);
        if (loop.frame(render))
        {
            return 31;
        }
        if (loop.current().updates != 5U || loop.ticks().getCount() != 5U)
        {
            return 32;
        }
        if (render.renders != 1U || loop.frames().getCount() != 1U || loop.current().secs != 0U)
        {
            return 33;
        }
        if (!loop.isStopped() || loop.isRunning())
        {
            return 34;
        }

        // Terminal: nothing fires anymore, restarting is refused
        clock.set(3.0);
        loop.stop();
        if (loop.frame(render) || render.renders != 1U || loop.current().updates != 5U)
        {
            return 35;
        }
        if (loop.begin() || loop.start(render))
        {
            return 36;
        }

        return 0;
    }

    int RunStartScenario()
    {
        SteppingClock clock(0.001);
        MainLoop<SteppingClock, CountingState<7>> loop(LoopConfig{.tickRate = 250.0}, clock);
        RecordingRender render;

        if (!loop.start(render))
        {
            return 40;
        }
        if (!loop.isStopped() || loop.current().updates != 7U || loop.ticks().getCount() != 7U)
        {
            return 41;
        }
        if (render.renders == 0U || render.renders != loop.frames().getCount())
        {
            return 42;
        }

        MainLoop<SteppingClock, CountingState<0>> invalid(-10.0, clock);
        if (invalid.begin() || invalid.isRunning())
        {
            return 43;
        }

        // A zero rate would never drain a tick
        MainLoop<SteppingClock, CountingState<0>> frozen(0.0, clock);
        if (frozen.begin() || frozen.isRunning() || frozen.current().inits != 0U)
        {
            return 44;
        }
        RecordingRender idle;
        if (frozen.frame(idle) || idle.renders != 0U)
        {
            return 45;
        }

        return 0;
    }

    int RunRenderLimitScenario()
    {
        ManualClock clock;
        MainLoop<ManualClock, CountingState<0>> never(LoopConfig{.tickRate = 100.0, .renderLimit = RenderLimit::Never},
                                                      clock);
        RecordingRender neverRender;
        if (!never.begin())
        {
            return 50;
        }
        for (int k = 1; k <= 50; ++k)
        {
            clock.set(k / 100.0);
            never.frame(neverRender);
        }
        if (neverRender.renders != 0U || never.frames().getCount() != 0U || never.ticks().getCount() == 0U)
        {
            return 51;
        }

        clock.set(0.0);
        MainLoop<ManualClock, CountingState<0>> once(100.0, clock);
        once.setRenderLimit(RenderLimit::Once);
        RecordingRender onceRender;
        if (!once.begin())
        {
            return 52;
        }
        for (int k = 1; k <= 250; ++k)
        {
            clock.set(k / 100.0);
            once.frame(onceRender);
        }
        // Frames 1, 101 and 201: the first frame of each reporting second
        if (onceRender.renders != 3U || once.current().secs != 2U)
        {
            return 53;
        }

        return 0;
    }

    int RunCatchUpCapScenario()
    {
        ManualClock clock;
        MainLoop<ManualClock, CountingState<0>> loop(LoopConfig{.tickRate = 100.0, .maxTicksPerFrame = 4}, clock);
        RecordingRender render;
        if (!loop.begin())
        {
            return 60;
        }

        clock.set(0.105);
        loop.frame(render);
        if (loop.current().updates != 4U || loop.accumulator() >= loop.tickDuration() ||
            loop.accumulator() < Duration())
        {
            return 61;
        }
        if (!NearlyEqual(loop.accumulator().count(), 0.005, 1e-6))
        {
            return 62;
        }

        // Without a cap the same stall is drained completely
        clock.set(0.0);
        MainLoop<ManualClock, CountingState<0>> uncapped(100.0, clock);
        if (!uncapped.begin())
        {
            return 63;
        }
        clock.set(0.105);
        uncapped.frame(render);
        if (uncapped.current().updates != 10U)
        {
            return 64;
        }

        return 0;
    }
}

int RunMainLoopSmoke()
{
    if (const int code = RunInterpolationScenario(); code != 0) return code;
    if (const int code = RunSecondReportScenario(); code != 0) return code;
    if (const int code = RunStopScenario(); code != 0) return code;
    if (const int code = RunStartScenario(); code != 0) return code;
    if (const int code = RunRenderLimitScenario(); code != 0) return code;
    if (const int code = RunCatchUpCapScenario(); code != 0) return code;
    return 0;
}
