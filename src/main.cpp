#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDate>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <QTimeZone>
#include <QTimer>

#include "app/logging.hpp"
#include "app/settings.hpp"
#include "app/sync_engine.hpp"
#include "core/expense.hpp"
#include "network/connectivity_monitor.hpp"

namespace {

using tally::app::SyncEngine;

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitFailedRecords = 2;

int report_error(const tally::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
    return kExitError;
}

QString to_qstring(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

QJsonObject record_to_json(const tally::QueuedWriteRecord& r) {
    QJsonObject object;
    object.insert(QStringLiteral("id"), QString::fromStdString(r.id.to_string()));
    object.insert(QStringLiteral("operation"), to_qstring(tally::to_string(r.operation)));
    object.insert(QStringLiteral("collection"), QString::fromStdString(r.target_collection));
    object.insert(QStringLiteral("entityId"), QString::fromStdString(r.entity_id.to_string()));
    object.insert(QStringLiteral("status"), to_qstring(tally::to_string(r.status)));
    object.insert(QStringLiteral("attemptCount"), r.attempt_count);
    object.insert(QStringLiteral("enqueuedAt"), QString::fromStdString(r.enqueued_at.to_iso_string()));
    if (r.last_error) {
        object.insert(QStringLiteral("lastError"), QString::fromStdString(*r.last_error));
    }
    if (r.batch_id) {
        object.insert(QStringLiteral("batchId"), QString::fromStdString(r.batch_id->to_string()));
    }
    return object;
}

int print_status(SyncEngine& engine, bool json) {
    const auto state = engine.coordinator().state();
    const auto records = engine.coordinator().records();

    if (json) {
        QJsonObject root;
        root.insert(QStringLiteral("phase"), to_qstring(tally::to_string(state.phase)));
        root.insert(QStringLiteral("online"), engine.monitor().isOnline());
        root.insert(QStringLiteral("pendingCount"), state.pending_count);
        root.insert(QStringLiteral("failedCount"), state.failed_count);
        if (state.last_error) {
            root.insert(QStringLiteral("lastError"), QString::fromStdString(*state.last_error));
        }
        QJsonArray items;
        for (const auto& r : records) {
            items.append(record_to_json(r));
        }
        root.insert(QStringLiteral("records"), items);
        QTextStream(stdout) << QJsonDocument(root).toJson(QJsonDocument::Indented);
        return kExitOk;
    }

    QTextStream out(stdout);
    out << "phase: " << to_qstring(tally::to_string(state.phase))
        << (engine.monitor().isOnline() ? " (online)" : " (offline)") << '\n';
    out << "pending: " << state.pending_count << "  failed: " << state.failed_count << '\n';
    if (state.last_error) {
        out << "last error: " << QString::fromStdString(*state.last_error) << '\n';
    }
    for (const auto& r : records) {
        out << "  " << QString::fromStdString(r.id.to_string())
            << ' ' << to_qstring(tally::to_string(r.operation))
            << ' ' << to_qstring(tally::to_string(r.status))
            << " attempts=" << r.attempt_count;
        if (r.last_error) {
            out << " error=" << QString::fromStdString(*r.last_error);
        }
        out << '\n';
    }
    return kExitOk;
}

// Runs the event loop until no pass is running and nothing is waiting
// for a retry timer, or the device is offline.
int run_until_settled(QCoreApplication& app, SyncEngine& engine) {
    auto& queue = engine.queue();
    auto settled = [&]() {
        if (queue.isProcessing()) return false;
        return queue.pendingCount() == 0
            || queue.scheduledRetryCount() == 0
            || !engine.monitor().isOnline();
    };
    auto check = [&]() {
        if (settled()) app.quit();
    };

    QObject::connect(&queue, &tally::sync::QueueService::passFinished, &app,
                     [check](const tally::sync::PassOutcome&) { check(); },
                     Qt::QueuedConnection);
    engine.coordinator().syncNow();
    QTimer::singleShot(0, &app, check);
    app.exec();

    print_status(engine, false);
    return queue.failedCount() > 0 ? kExitFailedRecords : kExitOk;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("Tally");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Tally");
    app.setOrganizationDomain("tally.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Tally offline write queue"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets TALLY_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption endpointOption(
        QStringList{QStringLiteral("endpoint")},
        QStringLiteral("Remote endpoint base URL (sets TALLY_ENDPOINT for this run)."),
        QStringLiteral("url"));
    parser.addOption(endpointOption);

    const QCommandLineOption offlineOption(
        QStringList{QStringLiteral("offline")},
        QStringLiteral("Behave as if the device had no connectivity."));
    parser.addOption(offlineOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for 'status')."));
    parser.addOption(jsonOption);

    const QCommandLineOption descriptionOption(
        QStringList{QStringLiteral("description")},
        QStringLiteral("Expense description for 'add'."),
        QStringLiteral("text"));
    parser.addOption(descriptionOption);

    const QCommandLineOption amountOption(
        QStringList{QStringLiteral("amount")},
        QStringLiteral("Expense amount for 'add'."),
        QStringLiteral("number"));
    parser.addOption(amountOption);

    const QCommandLineOption categoryOption(
        QStringList{QStringLiteral("category")},
        QStringLiteral("Expense category for 'add'."),
        QStringLiteral("name"));
    parser.addOption(categoryOption);

    const QCommandLineOption typeOption(
        QStringList{QStringLiteral("type")},
        QStringLiteral("Expense type for 'add'."),
        QStringLiteral("name"));
    parser.addOption(typeOption);

    const QCommandLineOption dateOption(
        QStringList{QStringLiteral("date")},
        QStringLiteral("Expense date for 'add' (YYYY-MM-DD, default today)."),
        QStringLiteral("date"));
    parser.addOption(dateOption);

    const QCommandLineOption noteOption(
        QStringList{QStringLiteral("note")},
        QStringLiteral("Optional note for 'add'."),
        QStringLiteral("text"));
    parser.addOption(noteOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets TALLY_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("status | add | sync | retry | purge-failed"));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("TALLY_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(endpointOption)) {
        qputenv("TALLY_ENDPOINT", parser.value(endpointOption).toUtf8());
    }
    if (parser.isSet(debugSyncOption)) {
        qputenv("TALLY_DEBUG_SYNC", "1");
    }

    if (!tally::app::install_file_logging()) {
        qWarning() << "Tally: cannot open log file" << tally::app::default_log_file_path();
    }
    auto settings = tally::app::load_sync_settings();
    if (settings.debug_sync) {
        tally::app::enable_sync_debug_logging();
        qInfo() << "Tally: sync debug enabled, logging to" << tally::app::default_log_file_path();
    }

    const auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QStringLiteral("status") : positional.first();

    std::unique_ptr<tally::network::ConnectivityBackend> backend;
    if (parser.isSet(offlineOption)) {
        backend = std::make_unique<tally::network::ManualConnectivityBackend>(false);
    }

    // Only the long-running commands dispatch; the others must not leave
    // a record in flight when they exit.
    settings.auto_sync = command == QStringLiteral("sync") || command == QStringLiteral("retry");

    SyncEngine engine(std::move(settings), std::move(backend));

    auto initialized = engine.initialize();
    if (initialized.is_err()) {
        return report_error(initialized.unwrap_err());
    }

    if (command == QStringLiteral("status")) {
        return print_status(engine, parser.isSet(jsonOption));
    }

    if (command == QStringLiteral("sync")) {
        return run_until_settled(app, engine);
    }

    if (command == QStringLiteral("retry")) {
        engine.coordinator().retryAll();
        return run_until_settled(app, engine);
    }

    if (command == QStringLiteral("purge-failed")) {
        auto purged = engine.queue().purgeFailed();
        if (purged.is_err()) {
            return report_error(purged.unwrap_err());
        }
        QTextStream(stdout) << "purged " << purged.unwrap() << " failed records\n";
        return kExitOk;
    }

    if (command == QStringLiteral("add")) {
        bool amount_ok = false;
        const double amount = parser.value(amountOption).toDouble(&amount_ok);
        if (!parser.isSet(descriptionOption) || !amount_ok) {
            QTextStream(stderr) << "add requires --description and a numeric --amount\n";
            return kExitError;
        }

        auto date = tally::Timestamp::now();
        if (parser.isSet(dateOption)) {
            const auto parsed = QDate::fromString(parser.value(dateOption), Qt::ISODate);
            if (!parsed.isValid()) {
                QTextStream(stderr) << "invalid --date, expected YYYY-MM-DD\n";
                return kExitError;
            }
            date = tally::Timestamp(parsed.startOfDay(QTimeZone::UTC).toMSecsSinceEpoch());
        }

        std::optional<std::string> note;
        if (parser.isSet(noteOption)) {
            note = parser.value(noteOption).toStdString();
        }

        const auto expense = tally::create_expense(
            parser.value(descriptionOption).toStdString(),
            amount,
            parser.value(categoryOption).toStdString(),
            parser.value(typeOption).toStdString(),
            date,
            std::move(note));

        int exit_code = kExitOk;
        bool finished = false;
        engine.router().createExpense(expense,
            [&](tally::Result<tally::sync::WriteOutcome, tally::Error> result) {
                finished = true;
                if (result.is_err()) {
                    exit_code = report_error(result.unwrap_err());
                } else {
                    QTextStream(stdout)
                        << QString::fromStdString(expense.id.to_string())
                        << (result.unwrap() == tally::sync::WriteOutcome::Synced
                                ? " synced\n" : " queued\n");
                }
                app.quit();
            });
        if (!finished) {
            app.exec();
        }
        return exit_code;
    }

    QTextStream(stderr) << "unknown command: " << command << '\n';
    return kExitError;
}
