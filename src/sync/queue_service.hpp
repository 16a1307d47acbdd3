#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include "core/write_record.hpp"
#include "storage/queue_store.hpp"
#include "sync/remote_repository.hpp"
#include <QObject>
#include <QTimer>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tally::sync {

/**
 * PassOutcome - Summary of one processQueue() pass.
 */
struct PassOutcome {
    int dispatched = 0;
    int succeeded = 0;
    int newly_failed = 0;
    bool interrupted = false;               // Stopped early, connectivity lost
    std::optional<std::string> last_error;  // Newest permanent or storage failure
};

/**
 * QueueService - Enqueue, retry-with-backoff and dispatch of queued writes.
 *
 * Every mutation reaches the store before the in-memory view changes,
 * so what callers observe is always on disk. Dispatch is sequential:
 * one record in flight, the next one started from the event loop once
 * the previous completion has been persisted.
 */
class QueueService : public QObject {
    Q_OBJECT

public:
    using OnlineCheck = std::function<bool()>;

    QueueService(storage::PersistentQueueStore& store,
                 RemoteRepository& remote,
                 RetryPolicy policy = {},
                 QObject* parent = nullptr);
    ~QueueService() override;

    /**
     * Consulted before each dispatch; the pass stops when it returns false.
     */
    void setOnlineCheck(OnlineCheck check);

    /**
     * Load persisted records. Records a dead process left in `syncing`
     * go back to `pending`; waiting records get their retry timers.
     * Must run before any enqueue.
     */
    [[nodiscard]] Result<void, Error> loadFromStore();

    /**
     * Persist one pending record and return its id. Never touches the
     * network. `failed_attempt` records a direct remote attempt the
     * caller already made, so the record starts in backoff.
     */
    [[nodiscard]] Result<Uuid, Error> enqueueSingle(
        const WriteRequest& request,
        const std::optional<Error>& failed_attempt = std::nullopt);

    /**
     * Persist a group of records atomically under a new batch id.
     * An empty request list is rejected.
     */
    [[nodiscard]] Result<Uuid, Error> enqueueBatch(
        const std::vector<WriteRequest>& requests,
        const std::optional<Error>& failed_attempt = std::nullopt);

    /**
     * Dispatch every due pending record. A call during a running pass
     * schedules exactly one follow-up pass.
     */
    void processQueue();

    /**
     * Reset failed records to pending with a fresh budget, then process.
     * Returns how many records were reset.
     */
    [[nodiscard]] Result<int, Error> retryAll();

    /**
     * Drop failed records. Returns how many were removed.
     */
    [[nodiscard]] Result<int, Error> purgeFailed();

    /**
     * Drop every record.
     */
    [[nodiscard]] Result<void, Error> clearAll();

    [[nodiscard]] std::vector<QueuedWriteRecord> records() const { return records_; }
    [[nodiscard]] std::optional<QueuedWriteRecord> record(const Uuid& id) const;
    [[nodiscard]] std::optional<QueuedBatch> batch(const Uuid& batch_id) const;

    /**
     * True while any record for `entity_id` is queued, in flight or failed.
     * Writes to one entity reach the remote in enqueue order: a record is
     * not dispatched while an earlier record for its entity is outstanding.
     */
    [[nodiscard]] bool hasOutstandingWrite(const Uuid& entity_id) const;

    // Pending and in-flight records.
    [[nodiscard]] int pendingCount() const;
    [[nodiscard]] int failedCount() const;

    [[nodiscard]] bool isProcessing() const { return processing_; }
    [[nodiscard]] bool isLoaded() const { return loaded_; }
    [[nodiscard]] const RetryPolicy& policy() const { return policy_; }

    // Records with a scheduled retry timer.
    [[nodiscard]] int scheduledRetryCount() const {
        return static_cast<int>(retry_timers_.size());
    }

signals:
    void queueChanged();
    void passStarted();
    void passFinished(const tally::sync::PassOutcome& outcome);

private:
    storage::PersistentQueueStore& store_;
    RemoteRepository& remote_;
    RetryPolicy policy_;
    OnlineCheck online_check_;

    std::vector<QueuedWriteRecord> records_;  // Dispatch order
    std::unordered_map<Uuid, std::unique_ptr<QTimer>> retry_timers_;

    bool loaded_ = false;
    bool processing_ = false;
    bool rerun_requested_ = false;
    std::deque<Uuid> pass_queue_;
    PassOutcome outcome_;
    Timestamp last_enqueued_at_;

    // Strictly increasing, so the stored order is the enqueue order.
    [[nodiscard]] Timestamp nextEnqueueTime();

    [[nodiscard]] bool isOnline() const;
    [[nodiscard]] QueuedWriteRecord* find(const Uuid& id);
    void insertSorted(QueuedWriteRecord record);
    [[nodiscard]] bool waitsOnEarlierWrite(const QueuedWriteRecord& record) const;
    void erase(const Uuid& id);

    void dispatchNext();
    void scheduleNext();
    void dispatch(const QueuedWriteRecord& record, RemoteRepository::Completion done);
    void handleCompletion(const Uuid& id, Result<void, Error> result);
    void finishPass();

    void scheduleRetry(const QueuedWriteRecord& record);
    void cancelRetry(const Uuid& id);
    void onRetryTimer(const Uuid& id);
};

} // namespace tally::sync

// Register metatypes for Qt signals
Q_DECLARE_METATYPE(tally::sync::PassOutcome)
