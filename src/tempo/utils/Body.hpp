#pragma once
#include <glm/glm.hpp>

#include <cstdint>

namespace tempo::utils {

// Point mass bouncing inside the unit square
struct Body {
    glm::dvec2 position{0.0, 0.5}; // position in [0, 1]^2
    glm::dvec2 velocity{0.0, 0.0}; // units per second
    std::uint64_t bounces = 0;     // wall hits so far, not blended

    [[nodiscard]] Body scale(double factor) const {
        Body scaled     = *this;
        scaled.position = position * factor;
        scaled.velocity = velocity * factor;
        return scaled;
    }

    [[nodiscard]] Body combine(const Body &other) const {
        Body sum     = *this;
        sum.position = position + other.position;
        sum.velocity = velocity + other.velocity;
        return sum;
    }

    // Explicit Euler step with reflection on the walls
    void integrate(double dt) {
        position += velocity * dt;
        for (glm::length_t axis = 0; axis < 2; ++axis) {
            if (position[axis] < 0.0) {
                position[axis] = -position[axis];
                velocity[axis] = -velocity[axis];
                ++bounces;
            } else if (position[axis] > 1.0) {
                position[axis] = 2.0 - position[axis];
                velocity[axis] = -velocity[axis];
                ++bounces;
            }
        }
    }
};

} // namespace tempo::utils
