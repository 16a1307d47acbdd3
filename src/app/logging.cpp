#include "app/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutex>
#include <QStandardPaths>

namespace tally::app {
namespace {

QMutex log_mutex;
QFile log_file;
QtMessageHandler previous_handler = nullptr;

void write_line(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    static constexpr const char* kLevels = "DWCFI";  // QtMsgType order
    const auto level = type <= QtInfoMsg ? QChar::fromLatin1(kLevels[type]) : QChar(u'?');
    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs),
                               QString(level),
                               QString::fromLatin1(ctx.category ? ctx.category : "default"),
                               msg);
    log_file.write(line.toUtf8());
    log_file.flush();
}

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    {
        QMutexLocker lock(&log_mutex);
        if (log_file.isOpen()) {
            write_line(type, ctx, msg);
        }
    }
    if (previous_handler) {
        previous_handler(type, ctx, msg);
    }
}

} // namespace

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    return base.isEmpty() ? QString{} : QDir(base).filePath(QStringLiteral("logs/tally.log"));
}

bool install_file_logging(const QString& path) {
    QMutexLocker lock(&log_mutex);
    if (!previous_handler) {
        previous_handler = qInstallMessageHandler(message_handler);
    }
    if (log_file.isOpen() || path.isEmpty()) {
        return log_file.isOpen();
    }
    QDir().mkpath(QFileInfo(path).absolutePath());
    log_file.setFileName(path);
    return log_file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
}

void enable_sync_debug_logging() {
    QLoggingCategory::setFilterRules(QStringLiteral("tally.*.debug=true"));
}

} // namespace tally::app
