#include "cli/clock_json.hpp"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include <algorithm>
#include <cmath>

namespace clockface::cli {

namespace {

// Anything this large is out of range for every field; clamping keeps the
// conversion to qint64 defined.
constexpr double kClampLimit = 9.0e18;

[[nodiscard]] Result<qint64> integral_field(const QJsonObject& obj, const QString& key) {
    if (!obj.contains(key)) {
        return Result<qint64>::err(Error::malformed("missing field: " + key.toStdString()));
    }

    const auto value = obj.value(key);
    if (!value.isDouble()) {
        return Result<qint64>::err(Error::type_mismatch("All time components must be integers"));
    }

    const auto number = value.toDouble();
    if (!std::isfinite(number) || std::trunc(number) != number) {
        return Result<qint64>::err(Error::type_mismatch("All time components must be integers"));
    }

    return Result<qint64>::ok(static_cast<qint64>(std::clamp(number, -kClampLimit, kClampLimit)));
}

} // namespace

QJsonObject clock_to_json(const ClockValue& clock) {
    QJsonObject obj;
    obj["hours"] = clock.hours();
    obj["minutes"] = clock.minutes();
    obj["seconds"] = clock.seconds();
    obj["text"] = QString::fromStdString(clock.to_string());
    obj["totalSeconds"] = static_cast<qint64>(clock.to_seconds());
    return obj;
}

Result<ClockValue> clock_from_json(const QJsonObject& obj) {
    auto hours = integral_field(obj, QStringLiteral("hours"));
    if (hours.is_err()) {
        return Result<ClockValue>::err(hours.unwrap_err());
    }
    auto minutes = integral_field(obj, QStringLiteral("minutes"));
    if (minutes.is_err()) {
        return Result<ClockValue>::err(minutes.unwrap_err());
    }
    auto seconds = integral_field(obj, QStringLiteral("seconds"));
    if (seconds.is_err()) {
        return Result<ClockValue>::err(seconds.unwrap_err());
    }

    return ClockValue::create(hours.unwrap(), minutes.unwrap(), seconds.unwrap());
}

Result<ClockValue> clock_from_json_text(const QString& text) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(text.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError) {
        return Result<ClockValue>::err(
            Error::malformed("invalid JSON: " + err.errorString().toStdString()));
    }
    if (!doc.isObject()) {
        return Result<ClockValue>::err(Error::malformed("expected a JSON object"));
    }
    return clock_from_json(doc.object());
}

} // namespace clockface::cli
