#pragma once

#include <QString>

#include "core/clock_value.hpp"
#include "core/result.hpp"

namespace clockface::cli {

// Integer arguments from the command line. Surrounding whitespace is
// ignored; anything else that is not a decimal integer is a TypeMismatch.
// A component beyond 64 bits saturates, so create() reports its range.
[[nodiscard]] Result<qlonglong> parse_component(const QString& text);

// Seconds arguments of any length, reduced modulo one day with the sign
// kept. add_seconds and from_seconds wrap the result the same way.
[[nodiscard]] Result<qlonglong> parse_delta(const QString& text);
[[nodiscard]] Result<qlonglong> parse_total(const QString& text);

// "H:M:S" argument, see ClockValue::parse.
[[nodiscard]] Result<ClockValue> parse_clock(const QString& text);

} // namespace clockface::cli
