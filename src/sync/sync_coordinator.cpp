#include "sync/sync_coordinator.hpp"
#include "core/log_categories.hpp"
#include <QTimeZone>
#include <algorithm>

namespace tally::sync {

SyncCoordinator::SyncCoordinator(QueueService& queue,
                                 network::ConnectivityMonitor& monitor,
                                 std::chrono::milliseconds synced_display,
                                 QObject* parent)
    : QObject(parent)
    , queue_(queue)
    , monitor_(monitor)
    , synced_timer_(std::make_unique<QTimer>())
{
    synced_timer_->setSingleShot(true);
    synced_timer_->setInterval(synced_display);
    connect(synced_timer_.get(), &QTimer::timeout, this, [this]() {
        if (phase_ == SyncPhase::Synced) {
            setPhase(SyncPhase::Idle);
        }
    });

    connect(&queue_, &QueueService::queueChanged, this, &SyncCoordinator::onQueueChanged);
    connect(&queue_, &QueueService::passStarted, this, &SyncCoordinator::onPassStarted);
    connect(&queue_, &QueueService::passFinished, this, &SyncCoordinator::onPassFinished);
    connect(&monitor_, &network::ConnectivityMonitor::connectivityChanged,
            this, &SyncCoordinator::onConnectivityChanged);
}

SyncCoordinator::~SyncCoordinator() = default;

void SyncCoordinator::start(bool sync_if_online) {
    refreshCounts();
    if (failed_count_ > 0) {
        setPhase(SyncPhase::Error);
    } else if (pending_count_ > 0) {
        setPhase(SyncPhase::Pending);
    }
    emit stateChanged();

    if (sync_if_online && monitor_.isOnline() && pending_count_ > 0) {
        qCInfo(tallySyncLog) << "SYNC: startup sync pending=" << pending_count_;
        queue_.processQueue();
    }
}

SyncState SyncCoordinator::state() const {
    return SyncState{
        .phase = phase_,
        .pending_count = pending_count_,
        .failed_count = failed_count_,
        .last_synced_at = last_synced_at_,
        .last_error = last_error_
    };
}

QString SyncCoordinator::phaseName() const {
    return QString::fromLatin1(to_string(phase_).data(),
                               static_cast<qsizetype>(to_string(phase_).size()));
}

QString SyncCoordinator::lastError() const {
    return last_error_ ? QString::fromStdString(*last_error_) : QString{};
}

QDateTime SyncCoordinator::lastSyncedAt() const {
    if (!last_synced_at_) return QDateTime{};
    return QDateTime::fromMSecsSinceEpoch(last_synced_at_->millis(), QTimeZone::UTC);
}

void SyncCoordinator::setPhase(SyncPhase phase) {
    if (phase_ == phase) return;
    qCInfo(tallySyncLog) << "SYNC: phase"
                         << QString::fromLatin1(to_string(phase_).data())
                         << "->" << QString::fromLatin1(to_string(phase).data());
    phase_ = phase;
    if (phase_ != SyncPhase::Synced) {
        synced_timer_->stop();
    }
    emit phaseChanged();
}

void SyncCoordinator::setError(std::string message) {
    qCWarning(tallySyncLog) << "SYNC: error" << QString::fromStdString(message);
    last_error_ = std::move(message);
}

void SyncCoordinator::refreshCounts() {
    pending_count_ = queue_.pendingCount();
    failed_count_ = queue_.failedCount();
}

void SyncCoordinator::onQueueChanged() {
    const int previous_pending = pending_count_;
    refreshCounts();

    switch (phase_) {
        case SyncPhase::Syncing:
            break;
        case SyncPhase::Idle:
        case SyncPhase::Synced:
            if (pending_count_ > 0) {
                setPhase(SyncPhase::Pending);
            }
            break;
        case SyncPhase::Pending:
            if (pending_count_ == 0) {
                setPhase(failed_count_ > 0 ? SyncPhase::Error : SyncPhase::Idle);
            }
            break;
        case SyncPhase::Error:
            if (pending_count_ > previous_pending) {
                setPhase(SyncPhase::Pending);
            } else if (failed_count_ == 0) {
                setPhase(pending_count_ > 0 ? SyncPhase::Pending : SyncPhase::Idle);
            }
            break;
    }
    emit stateChanged();
}

void SyncCoordinator::onPassStarted() {
    setPhase(SyncPhase::Syncing);
    emit stateChanged();
}

void SyncCoordinator::onPassFinished(const PassOutcome& outcome) {
    refreshCounts();

    if (outcome.last_error) {
        setError(*outcome.last_error);
    }
    if (outcome.succeeded > 0) {
        last_synced_at_ = Timestamp::now();
    }

    if (outcome.interrupted && pending_count_ > 0) {
        // Connectivity dropped; the remaining records wait for the next pass.
        setPhase(SyncPhase::Pending);
    } else if (failed_count_ > 0) {
        if (!last_error_) {
            // Failures from an earlier pass; surface the newest one.
            const auto records = queue_.records();
            auto newest = std::max_element(records.begin(), records.end(),
                [](const QueuedWriteRecord& a, const QueuedWriteRecord& b) {
                    return a.last_attempt_at.value_or(Timestamp{}) <
                           b.last_attempt_at.value_or(Timestamp{});
                });
            if (newest != records.end() && newest->last_error) {
                setError(*newest->last_error);
            }
        }
        setPhase(SyncPhase::Error);
    } else if (pending_count_ == 0) {
        if (!outcome.last_error) {
            last_error_.reset();
        }
        last_synced_at_ = Timestamp::now();
        setPhase(SyncPhase::Synced);
        synced_timer_->start();
    } else {
        setPhase(SyncPhase::Pending);
    }
    emit stateChanged();
}

void SyncCoordinator::onConnectivityChanged(bool online) {
    if (!online) {
        qCInfo(tallySyncLog) << "SYNC: offline";
        return;
    }
    qCInfo(tallySyncLog) << "SYNC: connectivity regained pending=" << pending_count_;
    queue_.processQueue();
}

void SyncCoordinator::retryAll() {
    auto result = queue_.retryAll();
    if (result.is_err()) {
        setError(result.unwrap_err().message);
        setPhase(SyncPhase::Error);
        emit stateChanged();
    }
}

void SyncCoordinator::dismissError() {
    last_error_.reset();
    if (phase_ == SyncPhase::Error) {
        setPhase(pending_count_ > 0 ? SyncPhase::Pending : SyncPhase::Idle);
    }
    emit stateChanged();
}

void SyncCoordinator::purgeFailed() {
    auto result = queue_.purgeFailed();
    if (result.is_err()) {
        setError(result.unwrap_err().message);
        emit stateChanged();
        return;
    }
    if (failed_count_ == 0) {
        last_error_.reset();
        emit stateChanged();
    }
}

void SyncCoordinator::syncNow() {
    queue_.processQueue();
}

} // namespace tally::sync
