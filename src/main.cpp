#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>

#include "cli/commands.hpp"
#include "cli/config.hpp"
#include "cli/logging.hpp"

namespace {

constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("clockface");
    app.setApplicationVersion("0.1.0");

    clockface::cli::install_logging();

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("24-hour clock values.\n\nCommands:\n") + clockface::cli::command_summary());
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption reprOption(
        QStringList{QStringLiteral("repr")},
        QStringLiteral("Print clocks as ClockValue(h, m, s)."));
    parser.addOption(reprOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Print clocks as JSON objects."));
    parser.addOption(jsonOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging (also sets CLOCKFACE_DEBUG=1)."));
    parser.addOption(debugOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run (e.g. 'show')."));
    parser.addPositionalArgument(QStringLiteral("args"),
                                 QStringLiteral("Command arguments."),
                                 QStringLiteral("[args...]"));
    // Negative deltas ("add 00:00:00 -1") must not be taken for options.
    parser.setOptionsAfterPositionalArgumentsMode(QCommandLineParser::ParseAsPositionalArguments);
    parser.process(app);

    if (parser.isSet(debugOption)) {
        qputenv("CLOCKFACE_DEBUG", "1");
    }

    auto config = clockface::cli::config_from_environment();
    if (config.debug) {
        clockface::cli::enable_debug_logging();
    }
    if (parser.isSet(jsonOption)) {
        config.format = clockface::cli::OutputFormat::Json;
    } else if (parser.isSet(reprOption)) {
        config.format = clockface::cli::OutputFormat::Repr;
    }

    qCDebug(clockface::cli::clockfaceCliLog) << "log file:" << config.log_file;

    clockface::cli::CommandOptions options;
    options.format = config.format;

    const auto result = clockface::cli::run_command(parser.positionalArguments(), options);
    if (result.is_err()) {
        const auto& error = result.unwrap_err();
        QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
        return error.kind() == clockface::ErrorCode::Usage ? kExitUsage : kExitFailure;
    }

    QTextStream(stdout) << result.unwrap();
    return 0;
}
