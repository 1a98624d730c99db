#include <catch2/catch_test_macros.hpp>

#include <QDateTime>
#include <QFile>
#include <QString>
#include <QTemporaryDir>
#include <QTimeZone>

#include "cli/config.hpp"
#include "cli/logging.hpp"

using namespace clockface;

namespace {

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* name, const QByteArray& value) : name_(name) {
        qputenv(name_, value);
    }
    ~EnvGuard() { qunsetenv(name_); }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    const char* name_;
};

} // namespace

TEST_CASE("Config: output format names", "[cli][config]") {
    REQUIRE(cli::output_format_from_name(QStringLiteral("text")) == cli::OutputFormat::Text);
    REQUIRE(cli::output_format_from_name(QStringLiteral(" REPR ")) == cli::OutputFormat::Repr);
    REQUIRE(cli::output_format_from_name(QStringLiteral("json")) == cli::OutputFormat::Json);
    REQUIRE_FALSE(cli::output_format_from_name(QStringLiteral("yaml")).has_value());
}

TEST_CASE("Config: defaults without environment", "[cli][config]") {
    const auto config = cli::config_from_environment();
    REQUIRE(config.format == cli::OutputFormat::Text);
    REQUIRE_FALSE(config.debug);
    REQUIRE(config.log_file.isEmpty());
}

TEST_CASE("Config: reads CLOCKFACE_* variables", "[cli][config]") {
    EnvGuard debug("CLOCKFACE_DEBUG", "1");
    EnvGuard output("CLOCKFACE_OUTPUT", "json");
    EnvGuard logFile("CLOCKFACE_LOG_FILE", "/tmp/clockface-test.log");

    const auto config = cli::config_from_environment();
    REQUIRE(config.debug);
    REQUIRE(config.format == cli::OutputFormat::Json);
    REQUIRE(config.log_file == QStringLiteral("/tmp/clockface-test.log"));
    REQUIRE(cli::log_file_path() == QStringLiteral("/tmp/clockface-test.log"));
}

TEST_CASE("Config: unknown output format keeps the default", "[cli][config]") {
    EnvGuard output("CLOCKFACE_OUTPUT", "yaml");
    REQUIRE(cli::config_from_environment().format == cli::OutputFormat::Text);
}

TEST_CASE("Logging: lines carry timestamp, level and category", "[cli][logging]") {
    const QDateTime ts(QDate(2026, 10, 18), QTime(8, 30, 5, 123), QTimeZone::utc());

    REQUIRE(cli::format_log_line(QtWarningMsg, "clockface.cli", QStringLiteral("bad value"), ts) ==
            QStringLiteral("2026-10-18T08:30:05.123Z W clockface.cli bad value"));
    REQUIRE(cli::format_log_line(QtDebugMsg, nullptr, QStringLiteral("x"), ts) ==
            QStringLiteral("2026-10-18T08:30:05.123Z D  x"));
}

TEST_CASE("Logging: debug output is off until enabled", "[cli][logging]") {
    REQUIRE_FALSE(cli::clockfaceCliLog().isDebugEnabled());
    REQUIRE(cli::clockfaceCliLog().isInfoEnabled());

    cli::enable_debug_logging();
    REQUIRE(cli::clockfaceCliLog().isDebugEnabled());

    QLoggingCategory::setFilterRules(QString{});
}

TEST_CASE("Logging: install_logging appends to CLOCKFACE_LOG_FILE", "[cli][logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("logs/clockface.log"));

    {
        EnvGuard logFile("CLOCKFACE_LOG_FILE", path.toUtf8());
        cli::install_logging();
        qCWarning(cli::clockfaceCliLog) << "written to file";
        qInstallMessageHandler(nullptr);
    }

    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const auto contents = QString::fromUtf8(file.readAll());
    REQUIRE(contents.contains(QStringLiteral(" W clockface.cli written to file\n")));
}
