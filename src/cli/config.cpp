#include "cli/config.hpp"

#include "cli/logging.hpp"

#include <QtGlobal>

namespace clockface::cli {

std::optional<OutputFormat> output_format_from_name(const QString& name) {
    const auto key = name.trimmed().toLower();
    if (key == QStringLiteral("text")) return OutputFormat::Text;
    if (key == QStringLiteral("repr")) return OutputFormat::Repr;
    if (key == QStringLiteral("json")) return OutputFormat::Json;
    return std::nullopt;
}

Config config_from_environment() {
    Config config;

    config.debug = qEnvironmentVariable("CLOCKFACE_DEBUG") == QStringLiteral("1");
    config.log_file = log_file_path();

    const auto format_name = qEnvironmentVariable("CLOCKFACE_OUTPUT");
    if (!format_name.isEmpty()) {
        if (const auto format = output_format_from_name(format_name)) {
            config.format = *format;
        } else {
            qCWarning(clockfaceCliLog) << "Ignoring unknown CLOCKFACE_OUTPUT value" << format_name;
        }
    }

    return config;
}

} // namespace clockface::cli
