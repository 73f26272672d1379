#pragma once
#include <cstdint>

namespace tempo::core {

// How often the loop renders
enum class RenderLimit : std::uint8_t {
    Never,  // no rendering at all
    Once,   // first frame of every reporting second
    Always, // every frame
};

struct LoopConfig {
    double tickRate                = 60.0;                // fixed updates per second
    RenderLimit renderLimit        = RenderLimit::Always; // render pacing
    std::uint32_t maxTicksPerFrame = 0;                   // catch-up cap, 0 = drain until caught up
};

} // namespace tempo::core
