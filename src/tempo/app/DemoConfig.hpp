#pragma once
#include "tempo/core/Duration.hpp"
#include "tempo/core/LoopConfig.hpp"

#include <cstdint>

namespace tempo::app {

#pragma region Constants
inline constexpr double TICK_RATE            = 100.0;                      // fixed updates per second
inline constexpr std::uint32_t MAX_CATCH_UP  = 25;                         // ticks per frame before dropping
inline constexpr std::uint32_t TRACK_WIDTH   = 50;                         // cells in the text track
inline constexpr core::Duration RUN_LENGTH   = core::Duration(10.0);       // simulated time before exiting
inline constexpr core::Duration FRAME_PACING = core::Duration::MILLI * 4.0; // sleep between frames
#pragma endregion

inline core::LoopConfig makeLoopConfig() {
    return core::LoopConfig{
        .tickRate         = TICK_RATE,
        .renderLimit      = core::RenderLimit::Always,
        .maxTicksPerFrame = MAX_CATCH_UP,
    };
}

} // namespace tempo::app
