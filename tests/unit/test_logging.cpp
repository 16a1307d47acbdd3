#include <catch2/catch_test_macros.hpp>
#include "app/logging.hpp"
#include "core/log_categories.hpp"
#include <QFile>
#include <QTemporaryDir>

using namespace tally;

TEST_CASE("Logging: messages are appended to the log file", "[logging]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("logs/tally.log"));

    REQUIRE(app::install_file_logging(path));
    // A second install keeps the file already open.
    REQUIRE(app::install_file_logging(path));

    qCWarning(tallyQueueLog) << "QUEUE: checkpoint deferred: 100% busy";

    QFile file(path);
    REQUIRE(file.open(QIODevice::ReadOnly | QIODevice::Text));
    const auto contents = QString::fromUtf8(file.readAll());
    REQUIRE(contents.contains(QStringLiteral(" W tally.queue QUEUE: checkpoint deferred: 100% busy")));
    REQUIRE(contents.endsWith(QLatin1Char('\n')));
}
