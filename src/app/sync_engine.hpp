#pragma once

#include "app/settings.hpp"
#include "core/expense_ledger.hpp"
#include "core/result.hpp"
#include "network/connectivity_monitor.hpp"
#include "storage/database.hpp"
#include "storage/queue_store.hpp"
#include "sync/queue_service.hpp"
#include "sync/remote_repository.hpp"
#include "sync/sync_coordinator.hpp"
#include "sync/write_router.hpp"
#include <QObject>
#include <memory>

namespace tally::app {

/**
 * SyncEngine - Owns one instance of every sync component and wires
 * them together.
 *
 * A null backend or remote selects the platform reachability backend
 * and the REST repository built from the settings.
 */
class SyncEngine : public QObject {
    Q_OBJECT

public:
    explicit SyncEngine(SyncSettings settings,
                        std::unique_ptr<network::ConnectivityBackend> backend = nullptr,
                        std::unique_ptr<sync::RemoteRepository> remote = nullptr,
                        QObject* parent = nullptr);
    ~SyncEngine() override;

    /**
     * Open and migrate the database, reload the queue, start watching
     * connectivity, and sync if online with records outstanding.
     */
    [[nodiscard]] Result<void, Error> initialize();

    [[nodiscard]] bool isInitialized() const { return initialized_; }
    [[nodiscard]] const SyncSettings& settings() const { return settings_; }
    [[nodiscard]] const QString& databasePath() const { return database_path_; }

    [[nodiscard]] ExpenseLedger& ledger() { return ledger_; }
    [[nodiscard]] network::ConnectivityMonitor& monitor() { return *monitor_; }
    [[nodiscard]] sync::QueueService& queue() { return *queue_; }
    [[nodiscard]] sync::SyncCoordinator& coordinator() { return *coordinator_; }
    [[nodiscard]] sync::WriteRouter& router() { return *router_; }

private:
    SyncSettings settings_;
    QString database_path_;
    bool initialized_ = false;

    ExpenseLedger ledger_;
    std::unique_ptr<network::ConnectivityBackend> pending_backend_;
    std::unique_ptr<sync::RemoteRepository> remote_;

    // Construction order matters: each one references those above it.
    std::unique_ptr<storage::Database> database_;
    std::unique_ptr<storage::PersistentQueueStore> store_;
    std::unique_ptr<network::ConnectivityMonitor> monitor_;
    std::unique_ptr<sync::QueueService> queue_;
    std::unique_ptr<sync::SyncCoordinator> coordinator_;
    std::unique_ptr<sync::WriteRouter> router_;
};

} // namespace tally::app
