#include "DemoApp.hpp"
#include "DemoConfig.hpp"

#include <SDL3/SDL.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace tempo::app {
DemoApp::DemoApp() = default;

DemoApp::~DemoApp() {
    if (m_isRunning) {
        spdlog::error("DemoApp::~DemoApp()::app was not closed properly");
        close();
    }
}

void DemoApp::run() {
    if (!init()) {
        spdlog::error("DemoApp::run()::DemoApp initialization failed");
        close();
        return;
    }
    if (!m_loop->begin()) {
        spdlog::error("DemoApp::run()::main loop failed to start");
        close();
        return;
    }
    const auto pacing = FRAME_PACING.to<std::chrono::nanoseconds>();
    while (m_loop->frame(m_render)) {
        handleEvents();
        SDL_DelayNS(static_cast<Uint64>(pacing.count()));
    }
    spdlog::info("DemoApp::run()::{} ticks, {} frames, avg tick {}, avg frame {}", m_loop->ticks().getCount(),
                 m_loop->frames().getCount(), m_loop->ticks().findAverage(), m_loop->frames().findAverage());
    close();
}

void DemoApp::handleEvents() {
    SDL_Event event;
    while (SDL_PollEvent(&event)) {
        switch (event.type) {
        case SDL_EVENT_QUIT:
            spdlog::info("DemoApp::handleEvents()::quit requested");
            m_loop->stop();
            break;
        default:
            break;
        }
    }
}

void DemoApp::close() {
    spdlog::trace("DemoApp::close()::closing DemoApp...");
    m_loop.reset();
    m_clock.reset();
    SDL_Quit();
    m_isRunning = false;
}

bool DemoApp::init() {
    spdlog::trace("DemoApp::init()::initializing DemoApp...");
    if (!initSdl()) return false;
    if (!initClock()) return false;
    if (!initLoop()) return false;
    m_isRunning = true;
    spdlog::trace("DemoApp::init()::initialized");
    return true;
}

bool DemoApp::initSdl() {
    if (!SDL_Init(SDL_INIT_EVENTS)) {
        spdlog::error("DemoApp::initSdl()::SDL initialization failed: {}", SDL_GetError());
        return false;
    }
    spdlog::trace("DemoApp::initSdl()::SDL initialized");
    return true;
}

bool DemoApp::initClock() {
    try {
        m_clock = std::make_unique<platform::SdlClock>();
    } catch (const std::exception &e) {
        spdlog::error("DemoApp::initClock()::clock creation failed: {}", e.what());
        return false;
    }
    spdlog::trace("DemoApp::initClock()::SDL clock ready");
    return true;
}

bool DemoApp::initLoop() {
    m_loop = std::make_unique<DemoLoop>(makeLoopConfig(), *m_clock);
    spdlog::trace("DemoApp::initLoop()::main loop created, tick rate: {}", TICK_RATE);
    return true;
}

} // namespace tempo::app
