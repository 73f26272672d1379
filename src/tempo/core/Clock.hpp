#pragma once
#include <chrono>
#include <concepts>

namespace tempo::core {

// Monotonic time source: seconds since an arbitrary fixed epoch, never decreasing.
template <class C>
concept Clock = requires(const C &clock) {
    { clock.now() } -> std::convertible_to<double>;
};

// Clock backed by std::chrono::steady_clock, counting from its construction
class SteadyClock final {
private:
    std::chrono::steady_clock::time_point m_epoch; // reference instant

public:
    SteadyClock();

    [[nodiscard]] double now() const;
};

} // namespace tempo::core
