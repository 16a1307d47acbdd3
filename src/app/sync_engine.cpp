#include "app/sync_engine.hpp"
#include "core/log_categories.hpp"
#include "storage/migrations.hpp"
#include "sync/rest_expense_repository.hpp"

namespace tally::app {

SyncEngine::SyncEngine(SyncSettings settings,
                       std::unique_ptr<network::ConnectivityBackend> backend,
                       std::unique_ptr<sync::RemoteRepository> remote,
                       QObject* parent)
    : QObject(parent)
    , settings_(std::move(settings))
    , pending_backend_(std::move(backend))
    , remote_(std::move(remote))
{
    if (!pending_backend_) {
        pending_backend_ = network::createConnectivityBackend();
    }
    if (!remote_) {
        remote_ = std::make_unique<sync::RestExpenseRepository>(sync::RestConfig{
            .endpoint = settings_.endpoint,
            .api_key = settings_.api_key,
            .access_token = settings_.access_token,
            .timeout = std::chrono::milliseconds(settings_.request_timeout_ms)
        });
    }
}

SyncEngine::~SyncEngine() {
    // Tear down in reverse wiring order.
    router_.reset();
    coordinator_.reset();
    queue_.reset();
    monitor_.reset();
    store_.reset();
    database_.reset();
}

Result<void, Error> SyncEngine::initialize() {
    if (initialized_) {
        return Result<void, Error>::ok();
    }

    const bool in_memory = settings_.database_path == QStringLiteral(":memory:");
    database_path_ = in_memory ? settings_.database_path
                               : resolve_database_path(settings_.database_path);

    auto db_result = in_memory ? storage::Database::open_memory()
                               : storage::Database::open(database_path_.toStdString());
    if (db_result.is_err()) {
        return Result<void, Error>::err(db_result.unwrap_err());
    }
    database_ = std::make_unique<storage::Database>(std::move(db_result).unwrap());

    auto migrated = storage::initialize_database(*database_);
    if (migrated.is_err()) {
        return migrated;
    }

    store_ = std::make_unique<storage::PersistentQueueStore>(*database_);
    monitor_ = std::make_unique<network::ConnectivityMonitor>(
        std::move(pending_backend_), std::chrono::milliseconds(settings_.debounce_ms));
    queue_ = std::make_unique<sync::QueueService>(*store_, *remote_, settings_.retry_policy());

    auto* monitor = monitor_.get();
    queue_->setOnlineCheck([monitor]() { return monitor->isOnline(); });

    auto loaded = queue_->loadFromStore();
    if (loaded.is_err()) {
        return loaded;
    }

    coordinator_ = std::make_unique<sync::SyncCoordinator>(
        *queue_, *monitor_, std::chrono::milliseconds(settings_.synced_display_ms));
    router_ = std::make_unique<sync::WriteRouter>(ledger_, *queue_, *remote_, *monitor_);

    monitor_->start();
    initialized_ = true;

    qCInfo(tallySyncLog) << "SYNC: engine ready db=" << database_path_
                         << "online=" << monitor_->isOnline()
                         << "pending=" << queue_->pendingCount();

    coordinator_->start(settings_.auto_sync);
    return Result<void, Error>::ok();
}

} // namespace tally::app
