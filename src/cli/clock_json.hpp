#pragma once

#include <QJsonObject>
#include <QString>

#include "core/clock_value.hpp"
#include "core/result.hpp"

namespace clockface::cli {

// JSON form:
// { "hours": 13, "minutes": 31, "seconds": 50, "text": "13:31:50", "totalSeconds": 48710 }
// "text" and "totalSeconds" are written but never read back.
[[nodiscard]] QJsonObject clock_to_json(const ClockValue& clock);

// Missing key -> Malformed, non-integral value -> TypeMismatch,
// integral value outside its bound -> OutOfRange.
[[nodiscard]] Result<ClockValue> clock_from_json(const QJsonObject& obj);

[[nodiscard]] Result<ClockValue> clock_from_json_text(const QString& text);

} // namespace clockface::cli
