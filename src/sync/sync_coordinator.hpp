#pragma once

#include "core/write_record.hpp"
#include "network/connectivity_monitor.hpp"
#include "sync/queue_service.hpp"
#include <QDateTime>
#include <QObject>
#include <QString>
#include <QTimer>
#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace tally::sync {

/**
 * SyncCoordinator - Aggregate sync status for the UI.
 *
 * idle -> pending      first enqueue
 * pending -> syncing   a pass begins (connectivity regain, startup,
 *                      retryAll, scheduled retry)
 * syncing -> synced    pass ends with an empty queue; reverts to idle
 *                      after the display interval
 * syncing -> error     pass ends with failed records
 * syncing -> pending   pass interrupted, or records wait for a retry
 * error/idle -> pending on a new enqueue
 */
class SyncCoordinator : public QObject {
    Q_OBJECT

    Q_PROPERTY(QString phase READ phaseName NOTIFY phaseChanged)
    Q_PROPERTY(int pendingCount READ pendingCount NOTIFY stateChanged)
    Q_PROPERTY(int failedCount READ failedCount NOTIFY stateChanged)
    Q_PROPERTY(QString lastError READ lastError NOTIFY stateChanged)
    Q_PROPERTY(QDateTime lastSyncedAt READ lastSyncedAt NOTIFY stateChanged)

public:
    static constexpr std::chrono::milliseconds DEFAULT_SYNCED_DISPLAY{2000};

    SyncCoordinator(QueueService& queue,
                    network::ConnectivityMonitor& monitor,
                    std::chrono::milliseconds synced_display = DEFAULT_SYNCED_DISPLAY,
                    QObject* parent = nullptr);
    ~SyncCoordinator() override;

    /**
     * Take the initial state from the queue and, if `sync_if_online`,
     * sync right away when online with records outstanding.
     */
    void start(bool sync_if_online = true);

    [[nodiscard]] SyncState state() const;
    [[nodiscard]] SyncPhase phase() const { return phase_; }
    [[nodiscard]] QString phaseName() const;
    [[nodiscard]] int pendingCount() const { return pending_count_; }
    [[nodiscard]] int failedCount() const { return failed_count_; }
    [[nodiscard]] QString lastError() const;
    [[nodiscard]] QDateTime lastSyncedAt() const;

    /**
     * Pending and failed records, for a details view.
     */
    [[nodiscard]] std::vector<QueuedWriteRecord> records() const { return queue_.records(); }

    Q_INVOKABLE void retryAll();
    Q_INVOKABLE void dismissError();
    Q_INVOKABLE void purgeFailed();
    Q_INVOKABLE void syncNow();

signals:
    void phaseChanged();
    void stateChanged();

private slots:
    void onQueueChanged();
    void onPassStarted();
    void onPassFinished(const tally::sync::PassOutcome& outcome);
    void onConnectivityChanged(bool online);

private:
    QueueService& queue_;
    network::ConnectivityMonitor& monitor_;
    std::unique_ptr<QTimer> synced_timer_;

    SyncPhase phase_ = SyncPhase::Idle;
    int pending_count_ = 0;
    int failed_count_ = 0;
    std::optional<Timestamp> last_synced_at_;
    std::optional<std::string> last_error_;

    void setPhase(SyncPhase phase);
    void setError(std::string message);
    void refreshCounts();
};

} // namespace tally::sync
