#pragma once

#include <QDateTime>
#include <QLoggingCategory>
#include <QString>

namespace clockface::cli {

Q_DECLARE_LOGGING_CATEGORY(clockfaceCliLog)

// Installs a Qt message handler that writes stamped lines to stderr and,
// when CLOCKFACE_LOG_FILE is set, appends them to that file as well.
void install_logging();

// Turns on qCDebug output for the clockface.* categories.
void enable_debug_logging();

// Returns the log file path from the environment (empty when unset).
QString log_file_path();

// "<ISO-8601 UTC> <level> <category> <message>" without a trailing newline.
[[nodiscard]] QString format_log_line(QtMsgType type,
                                      const char* category,
                                      const QString& message,
                                      const QDateTime& timestamp);

} // namespace clockface::cli
