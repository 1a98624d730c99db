#pragma once

#include <QString>
#include <QStringList>

#include "cli/config.hpp"
#include "core/clock_value.hpp"
#include "core/result.hpp"

namespace clockface::cli {

struct CommandOptions {
    OutputFormat format = OutputFormat::Text;
};

// Renders a clock in the requested format, without a trailing newline.
[[nodiscard]] QString render_clock(const ClockValue& clock, OutputFormat format);

// One line per command, for --help and usage errors.
[[nodiscard]] QString command_summary();

// Runs `args` (command name first) and returns the text to print, ending in
// a newline. Bad command lines fail with ErrorCode::Usage.
[[nodiscard]] Result<QString> run_command(const QStringList& args,
                                          const CommandOptions& options = {});

} // namespace clockface::cli
