#include "cli/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <array>
#include <cstddef>
#include <cstdio>

namespace clockface::cli {

Q_LOGGING_CATEGORY(clockfaceCliLog, "clockface.cli", QtInfoMsg)

namespace {

constexpr std::array<char, 5> kLevelLetters = {'D', 'W', 'C', 'F', 'I'};

// QtMsgType orders debug, warning, critical, fatal, info.
QChar level_letter(QtMsgType type) {
    const auto index = static_cast<std::size_t>(type);
    return index < kLevelLetters.size() ? QLatin1Char(kLevelLetters[index]) : QLatin1Char('?');
}

// Output shared by every thread that logs.
struct LogSink {
    QMutex mutex;
    QFile file;
};

LogSink& log_sink() {
    static LogSink sink;
    return sink;
}

void write_log_line(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const auto bytes =
        (format_log_line(type, ctx.category, msg, QDateTime::currentDateTimeUtc()) + QLatin1Char('\n'))
            .toUtf8();

    auto& sink = log_sink();
    QMutexLocker lock(&sink.mutex);
    std::fwrite(bytes.constData(), 1, static_cast<std::size_t>(bytes.size()), stderr);
    std::fflush(stderr);
    if (sink.file.isOpen()) {
        sink.file.write(bytes);
        sink.file.flush();
    }
}

} // namespace

void install_logging() {
    const auto path = log_file_path();
    auto& sink = log_sink();
    {
        QMutexLocker lock(&sink.mutex);
        if (!path.isEmpty() && !sink.file.isOpen()) {
            QDir().mkpath(QFileInfo(path).absolutePath());
            sink.file.setFileName(path);
            if (!sink.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                std::fprintf(stderr, "clockface: cannot open log file %s: %s\n",
                             qPrintable(path), qPrintable(sink.file.errorString()));
            }
        }
    }
    qInstallMessageHandler(write_log_line);
}

void enable_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("clockface.*.debug=true\n"));
}

QString log_file_path() {
    return qEnvironmentVariable("CLOCKFACE_LOG_FILE");
}

QString format_log_line(QtMsgType type,
                        const char* category,
                        const QString& message,
                        const QDateTime& timestamp) {
    const auto ts = timestamp.toUTC().toString(Qt::ISODateWithMs);
    const auto cat = category ? QString::fromLatin1(category) : QString{};
    return QStringLiteral("%1 %2 %3 %4")
        .arg(ts, QString(level_letter(type)), cat, message);
}

} // namespace clockface::cli
