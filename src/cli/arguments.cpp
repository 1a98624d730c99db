#include "cli/arguments.hpp"

#include <QRegularExpression>
#include <QRegularExpressionMatch>

#include <limits>
#include <utility>

namespace clockface::cli {

namespace {

[[nodiscard]] Result<QRegularExpressionMatch> match_integer(const QString& text, const char* type_message) {
    static const QRegularExpression kInteger(QStringLiteral("^([+-]?)([0-9]+)$"));

    auto match = kInteger.match(text.trimmed());
    if (!match.hasMatch()) {
        return Result<QRegularExpressionMatch>::err(Error::type_mismatch(type_message));
    }
    return Result<QRegularExpressionMatch>::ok(std::move(match));
}

[[nodiscard]] bool is_negative(const QRegularExpressionMatch& match) {
    return match.captured(1) == QLatin1String("-");
}

// Reduces the digits modulo one day digit by digit, so integers of any
// length are accepted. The sign is kept: "-86401" gives -1.
[[nodiscard]] qlonglong reduce_mod_day(const QRegularExpressionMatch& match) {
    qlonglong remainder = 0;
    for (const QChar digit : match.captured(2)) {
        remainder = (remainder * 10 + digit.digitValue()) % ClockValue::kSecondsPerDay;
    }
    return is_negative(match) ? -remainder : remainder;
}

[[nodiscard]] Result<qlonglong> parse_seconds(const QString& text, const char* type_message) {
    return match_integer(text, type_message).map(reduce_mod_day);
}

} // namespace

Result<qlonglong> parse_component(const QString& text) {
    return match_integer(text, "All time components must be integers")
        .map([](const QRegularExpressionMatch& match) {
            bool ok = false;
            const auto value = match.captured(0).toLongLong(&ok, 10);
            if (ok) {
                return value;
            }
            // Beyond 64 bits; still out of bounds after saturating.
            return is_negative(match) ? std::numeric_limits<qlonglong>::min()
                                      : std::numeric_limits<qlonglong>::max();
        });
}

Result<qlonglong> parse_delta(const QString& text) {
    return parse_seconds(text, "Seconds to add must be an integer");
}

Result<qlonglong> parse_total(const QString& text) {
    return parse_seconds(text, "Total seconds must be an integer");
}

Result<ClockValue> parse_clock(const QString& text) {
    return ClockValue::parse(text.trimmed().toStdString());
}

} // namespace clockface::cli
