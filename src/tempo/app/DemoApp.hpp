#pragma once
#include "BallState.hpp"
#include "TrackRender.hpp"
#include "tempo/core/MainLoop.hpp"
#include "tempo/platform/SdlClock.hpp"

#include <memory>

namespace tempo::app {

using DemoLoop = core::MainLoop<platform::SdlClock, BallState>;

class DemoApp final {
public:
    DemoApp();
    ~DemoApp();

    DemoApp(const DemoApp &)            = delete;
    DemoApp &operator=(const DemoApp &) = delete;
    DemoApp(DemoApp &&)                 = delete;
    DemoApp &operator=(DemoApp &&)      = delete;

    void run();

private:
#pragma region Member Variables
    bool m_isRunning = false; // SDL initialized and loop alive

    std::unique_ptr<platform::SdlClock> m_clock; // time source
    std::unique_ptr<DemoLoop> m_loop;            // fixed-timestep loop
    TrackRender m_render;                        // text renderer
#pragma endregion

    void handleEvents(); // polls SDL events
    void close();        // shuts SDL down

#pragma region Initialization
    [[nodiscard]] bool init();
    [[nodiscard]] bool initSdl();
    [[nodiscard]] bool initClock();
    [[nodiscard]] bool initLoop();
#pragma endregion
};

} // namespace tempo::app
