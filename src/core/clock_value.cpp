#include "core/clock_value.hpp"

#include <array>
#include <charconv>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <system_error>

namespace clockface {

static_assert(std::is_trivially_copyable_v<ClockValue>, "ClockValue should be trivially copyable");
static_assert(ClockValue{}.to_seconds() == 0, "Default ClockValue should be midnight");

namespace {

constexpr std::size_t kFieldCount = 3;

constexpr std::array<const char*, kFieldCount> kRangeMessages = {
    "Hours must be between 0 and 23",
    "Minutes must be between 0 and 59",
    "Seconds must be between 0 and 59",
};

struct FieldParse {
    std::optional<std::int64_t> value;
    bool too_large = false;
};

/**
 * Parse one optionally signed decimal field. An empty optional means the
 * field is not an integer at all.
 */
[[nodiscard]] FieldParse parse_field(std::string_view field) {
    if (!field.empty() && field.front() == '+') {
        field.remove_prefix(1);
        if (!field.empty() && field.front() == '-') {
            return {};
        }
    }
    if (field.empty()) {
        return {};
    }

    std::int64_t value = 0;
    const auto* first = field.data();
    const auto* last = field.data() + field.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc::result_out_of_range && ptr == last) {
        return FieldParse{std::nullopt, true};
    }
    if (ec != std::errc{} || ptr != last) {
        return {};
    }
    return FieldParse{value, false};
}

} // namespace

Result<ClockValue> ClockValue::parse(std::string_view text) {
    std::array<std::string_view, kFieldCount> fields;
    std::size_t count = 0;
    std::size_t start = 0;
    while (true) {
        const auto colon = text.find(':', start);
        if (count == kFieldCount) {
            return Result<ClockValue>::err(
                Error::malformed("Expected HH:MM:SS, got '" + std::string(text) + "'"));
        }
        fields[count++] = text.substr(start, colon == std::string_view::npos ? colon : colon - start);
        if (colon == std::string_view::npos) break;
        start = colon + 1;
    }
    if (count != kFieldCount) {
        return Result<ClockValue>::err(
            Error::malformed("Expected HH:MM:SS, got '" + std::string(text) + "'"));
    }

    std::array<std::int64_t, kFieldCount> values{};
    for (std::size_t i = 0; i < kFieldCount; ++i) {
        const auto parsed = parse_field(fields[i]);
        if (parsed.too_large) {
            return Result<ClockValue>::err(Error::out_of_range(kRangeMessages[i]));
        }
        if (!parsed.value) {
            return Result<ClockValue>::err(
                Error::type_mismatch("All time components must be integers"));
        }
        values[i] = *parsed.value;
    }

    return create(values[0], values[1], values[2]);
}

ClockValue& ClockValue::apply_total(std::int64_t total) {
    const auto normalized = floor_mod_day(total);
    const auto hours = normalized / kSecondsPerHour;
    const auto remaining = normalized % kSecondsPerHour;
    const auto minutes = remaining / kSecondsPerMinute;
    const auto seconds = remaining % kSecondsPerMinute;

    // The decomposition is always in range; set() still validates it.
    return set(hours, minutes, seconds).unwrap().get();
}

std::string ClockValue::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << hours_ << ':'
        << std::setw(2) << minutes_ << ':'
        << std::setw(2) << seconds_;
    return oss.str();
}

std::string ClockValue::to_repr() const {
    std::ostringstream oss;
    oss << "ClockValue(" << hours_ << ", " << minutes_ << ", " << seconds_ << ')';
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const ClockValue& clock) {
    return os << clock.to_string();
}

} // namespace clockface
