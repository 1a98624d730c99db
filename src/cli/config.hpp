#pragma once

#include <QString>

#include <optional>

namespace clockface::cli {

enum class OutputFormat {
    Text,   // HH:MM:SS
    Repr,   // ClockValue(h, m, s)
    Json,
};

[[nodiscard]] std::optional<OutputFormat> output_format_from_name(const QString& name);

/**
 * Settings read from CLOCKFACE_* environment variables. Command-line
 * options are applied on top of these in main().
 */
struct Config {
    OutputFormat format = OutputFormat::Text;
    bool debug = false;
    QString log_file;
};

[[nodiscard]] Config config_from_environment();

} // namespace clockface::cli
