#include "cli/commands.hpp"

#include <QJsonDocument>
#include <QJsonObject>

#include <algorithm>
#include <array>
#include <unordered_map>
#include <utility>
#include <vector>

#include "cli/arguments.hpp"
#include "cli/clock_json.hpp"
#include "cli/logging.hpp"

namespace clockface::cli {

namespace {

[[nodiscard]] Result<QString> usage_error(const QString& synopsis) {
    return Result<QString>::err(
        Error::usage((QStringLiteral("Usage: clockface ") + synopsis).toStdString()));
}

[[nodiscard]] QString ensure_trailing_newline(QString text) {
    if (!text.endsWith(QLatin1Char('\n'))) {
        text += QLatin1Char('\n');
    }
    return text;
}

[[nodiscard]] QString yes_no(bool value) {
    return value ? QStringLiteral("true") : QStringLiteral("false");
}

[[nodiscard]] Result<QString> render_result(const Result<ClockValue>& clock, OutputFormat format) {
    return clock.map([format](const ClockValue& c) {
        return ensure_trailing_newline(render_clock(c, format));
    });
}

[[nodiscard]] Result<QString> run_show(const QStringList& args, const CommandOptions& options) {
    if (args.size() > 3) {
        return usage_error(QStringLiteral("show [hours [minutes [seconds]]]"));
    }

    // Every argument must be an integer before any range is checked.
    std::array<qlonglong, 3> parts{0, 0, 0};
    for (qsizetype i = 0; i < args.size(); ++i) {
        const auto parsed = parse_component(args.at(i));
        if (parsed.is_err()) {
            return Result<QString>::err(parsed.unwrap_err());
        }
        parts[static_cast<size_t>(i)] = parsed.unwrap();
    }

    return render_result(ClockValue::create(parts[0], parts[1], parts[2]), options.format);
}

[[nodiscard]] Result<QString> run_add(const QStringList& args, const CommandOptions& options) {
    if (args.size() != 2) {
        return usage_error(QStringLiteral("add <HH:MM:SS> <seconds>"));
    }

    const auto start = parse_clock(args.at(0));
    if (start.is_err()) {
        return Result<QString>::err(start.unwrap_err());
    }
    const auto delta = parse_delta(args.at(1));
    if (delta.is_err()) {
        return Result<QString>::err(delta.unwrap_err());
    }

    auto clock = start.unwrap();
    clock.add_seconds(delta.unwrap());
    qCDebug(clockfaceCliLog) << "add" << delta.unwrap() << "to"
                             << QString::fromStdString(start.unwrap().to_string()) << "->"
                             << QString::fromStdString(clock.to_string());
    return Result<QString>::ok(ensure_trailing_newline(render_clock(clock, options.format)));
}

[[nodiscard]] Result<QString> run_from_seconds(const QStringList& args, const CommandOptions& options) {
    if (args.size() != 1) {
        return usage_error(QStringLiteral("from-seconds <total>"));
    }

    return parse_total(args.at(0)).map([&options](qlonglong total) {
        return ensure_trailing_newline(render_clock(ClockValue::from_seconds(total), options.format));
    });
}

[[nodiscard]] Result<QString> run_to_seconds(const QStringList& args, const CommandOptions& options) {
    if (args.size() != 1) {
        return usage_error(QStringLiteral("to-seconds <HH:MM:SS>"));
    }

    return parse_clock(args.at(0)).map([&options](const ClockValue& clock) {
        const auto total = static_cast<qint64>(clock.to_seconds());
        if (options.format == OutputFormat::Json) {
            QJsonObject obj;
            obj["totalSeconds"] = total;
            return ensure_trailing_newline(
                QString::fromUtf8(QJsonDocument(obj).toJson(QJsonDocument::Compact)));
        }
        return ensure_trailing_newline(QString::number(total));
    });
}

[[nodiscard]] Result<QString> run_decode(const QStringList& args, const CommandOptions& options) {
    if (args.size() != 1) {
        return usage_error(QStringLiteral("decode '<json-object>'"));
    }
    return render_result(clock_from_json_text(args.at(0)), options.format);
}

// Walk-through of the value semantics: arithmetic with wrap-around,
// equality, and clocks as hash-map keys.
[[nodiscard]] Result<QString> run_demo(const QStringList& args, const CommandOptions& options) {
    if (!args.isEmpty()) {
        return usage_error(QStringLiteral("demo"));
    }

    const auto show = [&options](const ClockValue& c) { return render_clock(c, options.format); };
    QStringList lines;

    auto clock = ClockValue::create(12, 30, 45).unwrap();
    lines << QStringLiteral("Current time: ") + show(clock);
    clock.add_seconds(3665);
    lines << QStringLiteral("After adding 3665 seconds: ") + show(clock);
    lines << QStringLiteral("Midnight: ") + show(ClockValue::from_seconds(0));

    const auto clock1 = ClockValue::create(9, 30, 0).unwrap();
    const auto clock2 = ClockValue::create(9, 30, 0).unwrap();
    const auto clock3 = ClockValue::create(10, 15, 0).unwrap();
    lines << QStringLiteral("Are clock1 and clock2 equal? ") + yes_no(clock1 == clock2);
    lines << QStringLiteral("Are clock1 and clock3 equal? ") + yes_no(clock1 == clock3);

    const auto lunch = ClockValue::create(12, 15, 30).unwrap();
    std::unordered_map<ClockValue, QString> schedule;
    schedule[clock1] = QStringLiteral("Morning Meeting");
    schedule[lunch] = QStringLiteral("Lunch Break");
    schedule[clock2] = QStringLiteral("Duplicate Morning Meeting");

    // unordered_map iteration order is unspecified; print chronologically.
    std::vector<std::pair<ClockValue, QString>> entries(schedule.begin(), schedule.end());
    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    for (const auto& [key, description] : entries) {
        lines << show(key) + QStringLiteral(": ") + description;
    }

    std::hash<ClockValue> hasher;
    lines << QStringLiteral("Schedule entries: ") + QString::number(schedule.size());
    lines << QStringLiteral("Hashes of clock1 and clock2 match? ") + yes_no(hasher(clock1) == hasher(clock2));

    return Result<QString>::ok(ensure_trailing_newline(lines.join(QLatin1Char('\n'))));
}

using Handler = Result<QString> (*)(const QStringList&, const CommandOptions&);

struct CommandEntry {
    const char* name;
    const char* synopsis;
    Handler handler;
};

constexpr std::array<CommandEntry, 6> kCommands = {{
    {"show", "show [hours [minutes [seconds]]]   validate and print a clock", &run_show},
    {"add", "add <HH:MM:SS> <seconds>           add (or subtract) seconds", &run_add},
    {"from-seconds", "from-seconds <total>               clock for seconds since midnight", &run_from_seconds},
    {"to-seconds", "to-seconds <HH:MM:SS>              seconds since midnight", &run_to_seconds},
    {"decode", "decode '<json-object>'             clock from its JSON form", &run_decode},
    {"demo", "demo                               walk through clock semantics", &run_demo},
}};

[[nodiscard]] Result<QString> dispatch(const QStringList& args, const CommandOptions& options) {
    if (args.isEmpty()) {
        return usage_error(QStringLiteral("<command> [args...]\n") + command_summary());
    }

    const auto& name = args.first();
    const auto it = std::find_if(kCommands.begin(), kCommands.end(), [&name](const CommandEntry& entry) {
        return name == QLatin1String(entry.name);
    });
    if (it == kCommands.end()) {
        return usage_error(QStringLiteral("<command> [args...]\nUnknown command: ") + name +
                           QLatin1Char('\n') + command_summary());
    }

    qCDebug(clockfaceCliLog) << "dispatch" << name << "args" << args.mid(1);
    return it->handler(args.mid(1), options);
}

} // namespace

QString render_clock(const ClockValue& clock, OutputFormat format) {
    switch (format) {
        case OutputFormat::Text:
            return QString::fromStdString(clock.to_string());
        case OutputFormat::Repr:
            return QString::fromStdString(clock.to_repr());
        case OutputFormat::Json:
            return QString::fromUtf8(QJsonDocument(clock_to_json(clock)).toJson(QJsonDocument::Compact));
    }
    return QString::fromStdString(clock.to_string());
}

QString command_summary() {
    QStringList lines;
    for (const auto& entry : kCommands) {
        lines << QStringLiteral("  ") + QString::fromLatin1(entry.synopsis);
    }
    return lines.join(QLatin1Char('\n'));
}

Result<QString> run_command(const QStringList& args, const CommandOptions& options) {
    auto result = dispatch(args, options);
    if (result.is_err()) {
        const auto name = args.isEmpty() ? QStringLiteral("<none>") : args.first();
        qCWarning(clockfaceCliLog).noquote() << "command" << name << "failed with code"
                                             << result.unwrap_err().code;
    }
    return result;
}

} // namespace clockface::cli
