#pragma once
#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <chrono>
#include <compare>
#include <optional>
#include <string_view>
#include <system_error>

namespace tempo::core {

// Signed span of seconds. Only Duration +/- Duration and Duration * scalar are defined,
// so a bare number can never be added to a time.
class Duration final {
private:
    double m_seconds = 0.0;

public:
    constexpr Duration() = default;
    constexpr explicit Duration(double seconds) : m_seconds(seconds) {}

    template <class Rep, class Period>
    constexpr explicit Duration(std::chrono::duration<Rep, Period> duration)
        : m_seconds(std::chrono::duration_cast<std::chrono::duration<double>>(duration).count()) {}

    [[nodiscard]] constexpr double count() const { return m_seconds; }

    // Reads a plain number of seconds, optionally followed by the " s" unit the formatter writes
    [[nodiscard]] static std::optional<Duration> parse(std::string_view text);

    // Integer representations round to the nearest tick instead of truncating
    template <class D>
    [[nodiscard]] constexpr D to() const {
        const std::chrono::duration<double> seconds(m_seconds);
        if constexpr (std::chrono::treat_as_floating_point_v<typename D::rep>) {
            return std::chrono::duration_cast<D>(seconds);
        } else {
            return std::chrono::round<D>(seconds);
        }
    }

#pragma region Arithmetic
    constexpr Duration &operator+=(Duration rhs) {
        m_seconds += rhs.m_seconds;
        return *this;
    }
    constexpr Duration &operator-=(Duration rhs) {
        m_seconds -= rhs.m_seconds;
        return *this;
    }
    constexpr Duration &operator*=(double scalar) {
        m_seconds *= scalar;
        return *this;
    }
    constexpr Duration &operator/=(double scalar) {
        m_seconds /= scalar;
        return *this;
    }

    friend constexpr Duration operator+(Duration lhs, Duration rhs) { return Duration(lhs.m_seconds + rhs.m_seconds); }
    friend constexpr Duration operator-(Duration lhs, Duration rhs) { return Duration(lhs.m_seconds - rhs.m_seconds); }
    friend constexpr Duration operator*(Duration lhs, double scalar) { return Duration(lhs.m_seconds * scalar); }
    friend constexpr Duration operator*(double scalar, Duration rhs) { return Duration(scalar * rhs.m_seconds); }
    friend constexpr Duration operator/(Duration lhs, double scalar) { return Duration(lhs.m_seconds / scalar); }
    constexpr Duration operator-() const { return Duration(-m_seconds); }
#pragma endregion

    // Exact comparisons; callers supply their own epsilon
    friend constexpr bool operator==(const Duration &lhs, const Duration &rhs) = default;
    friend constexpr auto operator<=>(const Duration &lhs, const Duration &rhs) = default;

#pragma region Constants
    static const Duration NANO;   // ns
    static const Duration MICRO;  // us
    static const Duration MILLI;  // ms
    static const Duration ONE;    // s
    static const Duration MINUTE; // min
    static const Duration KILO;   // ks
    static const Duration HOUR;   // h
    static const Duration DAY;    // d
    static const Duration MEGA;   // Ms
    static const Duration GIGA;   // Gs
#pragma endregion
};

inline constexpr Duration Duration::NANO{1e-9};
inline constexpr Duration Duration::MICRO{1e-6};
inline constexpr Duration Duration::MILLI{1e-3};
inline constexpr Duration Duration::ONE{1.0};
inline constexpr Duration Duration::MINUTE{60.0};
inline constexpr Duration Duration::KILO{1e3};
inline constexpr Duration Duration::HOUR{60.0 * 60.0};
inline constexpr Duration Duration::DAY{24.0 * 60.0 * 60.0};
inline constexpr Duration Duration::MEGA{1e6};
inline constexpr Duration Duration::GIGA{1e9};

inline std::optional<Duration> Duration::parse(std::string_view text) {
    if (text.ends_with(" s")) text.remove_suffix(2);
    if (text.empty()) return std::nullopt;
    double seconds        = 0.0;
    const char *end       = text.data() + text.size();
    const auto [ptr, err] = std::from_chars(text.data(), end, seconds);
    if (err != std::errc() || ptr != end) return std::nullopt;
    return Duration(seconds);
}

} // namespace tempo::core

template <>
struct fmt::formatter<tempo::core::Duration> {
    constexpr auto parse(fmt::format_parse_context &ctx) { return ctx.begin(); }

    template <class FormatContext>
    auto format(tempo::core::Duration duration, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{} s", duration.count());
    }
};
