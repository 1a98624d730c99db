#pragma once

#include "core/result.hpp"

#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace clockface {

namespace detail {

template<typename T>
inline constexpr bool is_non_numeric_integral_v =
    std::is_same_v<T, bool> || std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
    std::is_same_v<T, char8_t> || std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

} // namespace detail

/**
 * Integral types accepted as a clock component or a seconds delta.
 * bool and the character types are rejected along with floating point.
 */
template<typename T>
concept TimeComponent = std::integral<T> && !detail::is_non_numeric_integral_v<std::remove_cv_t<T>>;

/**
 * ClockValue - A time of day on a 24-hour clock.
 *
 * Holds hours [0, 23], minutes [0, 59] and seconds [0, 59]. Every way of
 * building or changing a ClockValue validates before it writes, so an
 * instance always denotes a valid time of day.
 *
 * Usage:
 *   auto clock = ClockValue::create(12, 30, 45).unwrap();
 *   clock.add_seconds(3665);            // 13:31:50
 *   clock.set(23, 59, 59)
 *       .map([](ClockValue& c) { return c.add_seconds(1).to_string(); });  // "00:00:00"
 *
 * Not internally synchronized.
 */
class ClockValue {
public:
    static constexpr int kMaxHours = 23;
    static constexpr int kMaxMinutes = 59;
    static constexpr int kMaxSeconds = 59;
    static constexpr std::int64_t kSecondsPerMinute = 60;
    static constexpr std::int64_t kSecondsPerHour = 3600;
    static constexpr std::int64_t kSecondsPerDay = 86400;

    using SetResult = Result<std::reference_wrapper<ClockValue>>;

    /**
     * Midnight, 00:00:00.
     */
    constexpr ClockValue() noexcept = default;

    /**
     * Validated construction. Fails with ErrorCode::OutOfRange on the first
     * component (hours, then minutes, then seconds) outside its bound.
     */
    template<TimeComponent H = int, TimeComponent M = int, TimeComponent S = int>
    [[nodiscard]] static Result<ClockValue> create(H hours = 0, M minutes = 0, S seconds = 0) {
        if (auto error = validate(hours, minutes, seconds)) {
            return Result<ClockValue>::err(std::move(*error));
        }
        return Result<ClockValue>::ok(ClockValue(static_cast<int>(hours),
                                                 static_cast<int>(minutes),
                                                 static_cast<int>(seconds)));
    }

    /**
     * Build a clock from seconds since midnight. Any magnitude and sign is
     * accepted; the value wraps with floored modulo into one day.
     */
    template<TimeComponent T>
    [[nodiscard]] static ClockValue from_seconds(T total_seconds) {
        ClockValue clock;
        clock.apply_total(wrap_to_day(total_seconds));
        return clock;
    }

    /**
     * Parse "H:M:S". Fields may be zero-padded.
     *
     * Errors: Malformed for a wrong field count, TypeMismatch for a field
     * that is not an integer, OutOfRange for a field outside its bound.
     */
    [[nodiscard]] static Result<ClockValue> parse(std::string_view text);

    template<TimeComponent H, TimeComponent M, TimeComponent S>
    [[nodiscard]] static constexpr bool is_valid(H hours, M minutes, S seconds) noexcept {
        return in_bounds(hours, kMaxHours) && in_bounds(minutes, kMaxMinutes) &&
               in_bounds(seconds, kMaxSeconds);
    }

    /**
     * Overwrite all three components. Nothing changes unless all three are
     * in range. On success the result refers to this instance.
     */
    template<TimeComponent H, TimeComponent M, TimeComponent S>
    [[nodiscard]] SetResult set(H hours, M minutes, S seconds) {
        if (auto error = validate(hours, minutes, seconds)) {
            return SetResult::err(std::move(*error));
        }
        hours_ = static_cast<int>(hours);
        minutes_ = static_cast<int>(minutes);
        seconds_ = static_cast<int>(seconds);
        return SetResult::ok(std::ref(*this));
    }

    /**
     * Advance (or, for a negative delta, rewind) the clock, wrapping
     * around midnight as often as needed.
     */
    template<TimeComponent T>
    ClockValue& add_seconds(T delta) {
        return apply_total(to_seconds() + wrap_to_day(delta));
    }

    [[nodiscard]] constexpr int hours() const noexcept { return hours_; }
    [[nodiscard]] constexpr int minutes() const noexcept { return minutes_; }
    [[nodiscard]] constexpr int seconds() const noexcept { return seconds_; }

    /**
     * Seconds since midnight, in [0, 86399].
     */
    [[nodiscard]] constexpr std::int64_t to_seconds() const noexcept {
        return hours_ * kSecondsPerHour + minutes_ * kSecondsPerMinute + seconds_;
    }

    /**
     * Zero-padded "HH:MM:SS".
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * "ClockValue(h, m, s)" with the raw components. Passing the three
     * numbers to ClockValue::create(h, m, s) rebuilds an equal value.
     */
    [[nodiscard]] std::string to_repr() const;

    auto operator<=>(const ClockValue&) const = default;
    bool operator==(const ClockValue&) const = default;

private:
    constexpr ClockValue(int hours, int minutes, int seconds) noexcept
        : hours_(hours), minutes_(minutes), seconds_(seconds) {}

    template<TimeComponent T>
    [[nodiscard]] static constexpr bool in_bounds(T value, int max) noexcept {
        return std::cmp_greater_equal(value, 0) && std::cmp_less_equal(value, max);
    }

    template<TimeComponent H, TimeComponent M, TimeComponent S>
    [[nodiscard]] static std::optional<Error> validate(H hours, M minutes, S seconds) {
        if (!in_bounds(hours, kMaxHours)) {
            return Error::out_of_range("Hours must be between 0 and 23");
        }
        if (!in_bounds(minutes, kMaxMinutes)) {
            return Error::out_of_range("Minutes must be between 0 and 59");
        }
        if (!in_bounds(seconds, kMaxSeconds)) {
            return Error::out_of_range("Seconds must be between 0 and 59");
        }
        return std::nullopt;
    }

    [[nodiscard]] static constexpr std::int64_t floor_mod_day(std::int64_t total) noexcept {
        const auto rem = total % kSecondsPerDay;
        return rem < 0 ? rem + kSecondsPerDay : rem;
    }

    // Reduces before any arithmetic so huge deltas cannot overflow.
    template<TimeComponent T>
    [[nodiscard]] static constexpr std::int64_t wrap_to_day(T total) noexcept {
        if constexpr (std::is_signed_v<T>) {
            return floor_mod_day(static_cast<std::int64_t>(total));
        } else {
            return static_cast<std::int64_t>(static_cast<std::uint64_t>(total) %
                                             static_cast<std::uint64_t>(kSecondsPerDay));
        }
    }

    ClockValue& apply_total(std::int64_t total);

    int hours_{0};
    int minutes_{0};
    int seconds_{0};
};

std::ostream& operator<<(std::ostream& os, const ClockValue& clock);

} // namespace clockface

namespace std {
    template<>
    struct hash<clockface::ClockValue> {
        size_t operator()(const clockface::ClockValue& clock) const noexcept {
            size_t h = 0;
            for (int part : {clock.hours(), clock.minutes(), clock.seconds()}) {
                h ^= std::hash<int>{}(part) + 0x9e3779b9 + (h << 6) + (h >> 2);
            }
            return h;
        }
    };
}
