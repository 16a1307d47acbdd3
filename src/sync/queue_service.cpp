#include "sync/queue_service.hpp"
#include "sync/payload_codec.hpp"
#include "core/log_categories.hpp"
#include <QMetaObject>
#include <QPointer>
#include <algorithm>

namespace tally::sync {

namespace {

QString id_string(const Uuid& id) {
    return QString::fromStdString(id.to_string());
}

} // namespace

QueueService::QueueService(storage::PersistentQueueStore& store,
                           RemoteRepository& remote,
                           RetryPolicy policy,
                           QObject* parent)
    : QObject(parent)
    , store_(store)
    , remote_(remote)
    , policy_(policy)
{
}

QueueService::~QueueService() = default;

void QueueService::setOnlineCheck(OnlineCheck check) {
    online_check_ = std::move(check);
}

bool QueueService::isOnline() const {
    return !online_check_ || online_check_();
}

// ============================================================================
// In-memory view
// ============================================================================

QueuedWriteRecord* QueueService::find(const Uuid& id) {
    auto it = std::find_if(records_.begin(), records_.end(),
        [&](const QueuedWriteRecord& r) { return r.id == id; });
    return it != records_.end() ? &*it : nullptr;
}

std::optional<QueuedWriteRecord> QueueService::record(const Uuid& id) const {
    auto it = std::find_if(records_.begin(), records_.end(),
        [&](const QueuedWriteRecord& r) { return r.id == id; });
    if (it != records_.end()) {
        return *it;
    }
    return std::nullopt;
}

void QueueService::insertSorted(QueuedWriteRecord record) {
    auto pos = std::upper_bound(records_.begin(), records_.end(), record, dispatch_before);
    records_.insert(pos, std::move(record));
}

void QueueService::erase(const Uuid& id) {
    std::erase_if(records_, [&](const QueuedWriteRecord& r) { return r.id == id; });
}

std::optional<QueuedBatch> QueueService::batch(const Uuid& batch_id) const {
    QueuedBatch result{.batch_id = batch_id, .records = {}};
    for (const auto& r : records_) {
        if (r.batch_id == batch_id) {
            result.records.push_back(r);
        }
    }
    if (result.records.empty()) {
        return std::nullopt;
    }
    std::stable_sort(result.records.begin(), result.records.end(),
        [](const QueuedWriteRecord& a, const QueuedWriteRecord& b) {
            return a.batch_position < b.batch_position;
        });
    return result;
}

bool QueueService::hasOutstandingWrite(const Uuid& entity_id) const {
    return std::any_of(records_.begin(), records_.end(),
        [&](const QueuedWriteRecord& r) { return r.entity_id == entity_id; });
}

bool QueueService::waitsOnEarlierWrite(const QueuedWriteRecord& record) const {
    for (const auto& r : records_) {
        if (r.id == record.id) return false;
        if (r.entity_id == record.entity_id) return true;
    }
    return false;
}

int QueueService::pendingCount() const {
    return static_cast<int>(std::count_if(records_.begin(), records_.end(),
        [](const QueuedWriteRecord& r) { return r.status != RecordStatus::Failed; }));
}

int QueueService::failedCount() const {
    return static_cast<int>(std::count_if(records_.begin(), records_.end(),
        [](const QueuedWriteRecord& r) { return r.status == RecordStatus::Failed; }));
}

// ============================================================================
// Loading and enqueue
// ============================================================================

Result<void, Error> QueueService::loadFromStore() {
    auto all = store_.get_all();
    if (all.is_err()) {
        return Result<void, Error>::err(all.unwrap_err());
    }

    auto loaded = std::move(all).unwrap();
    std::vector<QueuedWriteRecord> recovered;
    for (auto& r : loaded) {
        if (r.status == RecordStatus::Syncing) {
            r = recover_interrupted(std::move(r));
            recovered.push_back(r);
        }
    }

    if (!recovered.empty()) {
        qCInfo(tallyQueueLog) << "QUEUE: recovered" << recovered.size()
                              << "records interrupted mid-dispatch";
        auto saved = store_.put_all(recovered);
        if (saved.is_err()) {
            return saved;
        }
    }

    for (auto& [id, timer] : retry_timers_) {
        timer->stop();
    }
    retry_timers_.clear();

    records_ = std::move(loaded);
    std::stable_sort(records_.begin(), records_.end(), dispatch_before);
    for (const auto& r : records_) {
        last_enqueued_at_ = std::max(last_enqueued_at_, r.enqueued_at);
    }
    loaded_ = true;

    const auto now = Timestamp::now();
    for (const auto& r : records_) {
        if (r.status == RecordStatus::Pending && !is_due(r, now)) {
            scheduleRetry(r);
        }
    }

    qCInfo(tallyQueueLog) << "QUEUE: loaded records=" << records_.size()
                          << "pending=" << pendingCount() << "failed=" << failedCount();
    emit queueChanged();
    return Result<void, Error>::ok();
}

Timestamp QueueService::nextEnqueueTime() {
    last_enqueued_at_ = std::max(Timestamp::now(), last_enqueued_at_ + std::chrono::milliseconds(1));
    return last_enqueued_at_;
}

Result<Uuid, Error> QueueService::enqueueSingle(const WriteRequest& request,
                                                const std::optional<Error>& failed_attempt) {
    if (!loaded_) {
        return Result<Uuid, Error>::err(Error{"Queue used before loadFromStore()"});
    }
    if (request.target_collection.empty()) {
        return Result<Uuid, Error>::err(Error::validation("Write request without target collection"));
    }

    const auto now = nextEnqueueTime();
    auto record = make_record(request, now);
    if (failed_attempt) {
        record = mark_attempt_failed(std::move(record), *failed_attempt, policy_, now);
    }

    auto saved = store_.put(record);
    if (saved.is_err()) {
        qCWarning(tallyQueueLog) << "QUEUE: enqueue failed:"
                                 << QString::fromStdString(saved.unwrap_err().message);
        return Result<Uuid, Error>::err(saved.unwrap_err());
    }

    qCInfo(tallyQueueLog) << "QUEUE: enqueued" << QString::fromStdString(std::string(to_string(record.operation)))
                          << "entity=" << id_string(record.entity_id)
                          << "record=" << id_string(record.id);

    const auto id = record.id;
    if (record.status == RecordStatus::Pending && !is_due(record, now)) {
        scheduleRetry(record);
    }
    insertSorted(std::move(record));
    emit queueChanged();
    return Result<Uuid, Error>::ok(id);
}

Result<Uuid, Error> QueueService::enqueueBatch(const std::vector<WriteRequest>& requests,
                                               const std::optional<Error>& failed_attempt) {
    if (!loaded_) {
        return Result<Uuid, Error>::err(Error{"Queue used before loadFromStore()"});
    }
    if (requests.empty()) {
        return Result<Uuid, Error>::err(Error::validation("Cannot enqueue an empty batch"));
    }
    for (const auto& request : requests) {
        if (request.target_collection.empty()) {
            return Result<Uuid, Error>::err(
                Error::validation("Write request without target collection"));
        }
    }

    const auto batch_id = Uuid::generate();
    const auto now = nextEnqueueTime();

    std::vector<QueuedWriteRecord> batch_records;
    batch_records.reserve(requests.size());
    for (size_t i = 0; i < requests.size(); ++i) {
        auto record = make_batch_record(requests[i], batch_id, static_cast<int>(i), now);
        if (failed_attempt) {
            record = mark_attempt_failed(std::move(record), *failed_attempt, policy_, now);
        }
        batch_records.push_back(std::move(record));
    }

    auto saved = store_.put_all(batch_records);
    if (saved.is_err()) {
        qCWarning(tallyQueueLog) << "QUEUE: batch enqueue failed:"
                                 << QString::fromStdString(saved.unwrap_err().message);
        return Result<Uuid, Error>::err(saved.unwrap_err());
    }

    qCInfo(tallyQueueLog) << "QUEUE: enqueued batch" << id_string(batch_id)
                          << "size=" << batch_records.size();

    for (auto& record : batch_records) {
        if (record.status == RecordStatus::Pending && !is_due(record, now)) {
            scheduleRetry(record);
        }
        insertSorted(std::move(record));
    }
    emit queueChanged();
    return Result<Uuid, Error>::ok(batch_id);
}

// ============================================================================
// Processing
// ============================================================================

void QueueService::processQueue() {
    if (!loaded_) {
        qCWarning(tallyQueueLog) << "QUEUE: processQueue before loadFromStore()";
        return;
    }

    if (processing_) {
        rerun_requested_ = true;
        qCDebug(tallyQueueLog) << "QUEUE: pass running, follow-up requested";
        return;
    }

    if (!isOnline()) {
        qCDebug(tallyQueueLog) << "QUEUE: offline, nothing dispatched";
        return;
    }

    const auto now = Timestamp::now();
    pass_queue_.clear();
    for (const auto& r : records_) {
        if (is_due(r, now)) {
            pass_queue_.push_back(r.id);
        }
    }

    if (pass_queue_.empty()) {
        return;
    }

    processing_ = true;
    outcome_ = PassOutcome{};
    qCInfo(tallyQueueLog) << "QUEUE: pass start due=" << pass_queue_.size();
    emit passStarted();
    dispatchNext();
}

void QueueService::scheduleNext() {
    QMetaObject::invokeMethod(this, [this]() { dispatchNext(); }, Qt::QueuedConnection);
}

void QueueService::dispatchNext() {
    if (!processing_) return;

    // Skip entries purged, cleared or rescheduled since the pass began,
    // and entries still waiting on an earlier write to the same entity.
    while (!pass_queue_.empty()) {
        const auto* r = find(pass_queue_.front());
        if (r && r->status == RecordStatus::Pending) {
            if (!waitsOnEarlierWrite(*r)) break;
            qCDebug(tallyQueueLog) << "QUEUE: held behind earlier write record=" << id_string(r->id)
                                   << "entity=" << id_string(r->entity_id);
        }
        pass_queue_.pop_front();
    }

    if (pass_queue_.empty()) {
        finishPass();
        return;
    }

    if (!isOnline()) {
        qCInfo(tallyQueueLog) << "QUEUE: connectivity lost, pass interrupted remaining="
                              << pass_queue_.size();
        outcome_.interrupted = true;
        finishPass();
        return;
    }

    const auto id = pass_queue_.front();
    pass_queue_.pop_front();

    auto* current = find(id);
    auto syncing = mark_syncing(*current, Timestamp::now());
    auto saved = store_.put(syncing);
    if (saved.is_err()) {
        qCWarning(tallyQueueLog) << "QUEUE: cannot mark record syncing:"
                                 << QString::fromStdString(saved.unwrap_err().message);
        outcome_.last_error = saved.unwrap_err().message;
        // Not sent, so no attempt is counted; try again after the first backoff step.
        current->next_attempt_at = Timestamp::now() + policy_.delay_for(1);
        scheduleRetry(*current);
        finishPass();
        return;
    }
    *current = syncing;
    cancelRetry(id);
    ++outcome_.dispatched;
    emit queueChanged();

    qCDebug(tallyQueueLog) << "QUEUE: dispatch record=" << id_string(id)
                           << "attempt=" << (syncing.attempt_count + 1);

    QPointer<QueueService> self(this);
    dispatch(syncing, [self, id](Result<void, Error> result) {
        if (self) {
            self->handleCompletion(id, std::move(result));
        }
    });
}

void QueueService::dispatch(const QueuedWriteRecord& record, RemoteRepository::Completion done) {
    if (record.target_collection != EXPENSES_COLLECTION) {
        done(Result<void, Error>::err(Error::validation(
            "Unknown target collection: " + record.target_collection)));
        return;
    }

    if (record.operation == OperationType::Delete) {
        remote_.remove(record.entity_id, std::move(done));
        return;
    }

    auto expense = decode_expense(record.payload);
    if (expense.is_err()) {
        done(Result<void, Error>::err(expense.unwrap_err()));
        return;
    }

    if (record.operation == OperationType::Create) {
        remote_.create(expense.unwrap(), std::move(done));
    } else {
        remote_.update(expense.unwrap(), std::move(done));
    }
}

void QueueService::handleCompletion(const Uuid& id, Result<void, Error> result) {
    auto* current = find(id);
    if (!current) {
        // Cleared while in flight.
        scheduleNext();
        return;
    }

    if (result.is_ok()) {
        auto removed = store_.remove(id);
        if (removed.is_err()) {
            // Still on disk as syncing; it is replayed after restart.
            qCWarning(tallyQueueLog) << "QUEUE: delivered but not removed record=" << id_string(id)
                                     << QString::fromStdString(removed.unwrap_err().message);
            current->status = RecordStatus::Pending;
            current->next_attempt_at = Timestamp::now() + policy_.delay_for(1);
            scheduleRetry(*current);
            outcome_.last_error = removed.unwrap_err().message;
        } else {
            qCInfo(tallyQueueLog) << "QUEUE: delivered record=" << id_string(id);
            const auto entity_id = current->entity_id;
            erase(id);
            ++outcome_.succeeded;
            // Later writes to this entity were held back during this pass.
            if (hasOutstandingWrite(entity_id)) {
                rerun_requested_ = true;
            }
        }
        emit queueChanged();
        scheduleNext();
        return;
    }

    const auto& error = result.unwrap_err();
    auto updated = mark_attempt_failed(*current, error, policy_, Timestamp::now());
    auto saved = store_.put(updated);
    if (saved.is_err()) {
        qCWarning(tallyQueueLog) << "QUEUE: cannot persist failed attempt record=" << id_string(id)
                                 << QString::fromStdString(saved.unwrap_err().message);
        outcome_.last_error = saved.unwrap_err().message;
    }
    *current = updated;

    if (updated.status == RecordStatus::Failed) {
        qCWarning(tallyQueueLog) << "QUEUE: record failed permanently record=" << id_string(id)
                                 << "kind=" << QString::fromStdString(std::string(to_string(error.kind)))
                                 << "error=" << QString::fromStdString(error.message);
        ++outcome_.newly_failed;
        outcome_.last_error = error.message;
    } else {
        qCInfo(tallyQueueLog) << "QUEUE: attempt" << updated.attempt_count << "failed record="
                              << id_string(id) << "retry in"
                              << (updated.next_attempt_at - Timestamp::now()).count() << "ms";
        scheduleRetry(updated);
    }

    emit queueChanged();
    scheduleNext();
}

void QueueService::finishPass() {
    processing_ = false;
    pass_queue_.clear();
    qCInfo(tallyQueueLog) << "QUEUE: pass end dispatched=" << outcome_.dispatched
                          << "succeeded=" << outcome_.succeeded
                          << "failed=" << outcome_.newly_failed
                          << "interrupted=" << outcome_.interrupted;
    const auto outcome = outcome_;
    emit passFinished(outcome);

    if (rerun_requested_) {
        rerun_requested_ = false;
        processQueue();
    }
}

// ============================================================================
// Scheduled retries
// ============================================================================

void QueueService::scheduleRetry(const QueuedWriteRecord& record) {
    const auto delay = std::max<int64_t>(0, (record.next_attempt_at - Timestamp::now()).count());

    auto timer = std::make_unique<QTimer>();
    timer->setSingleShot(true);
    timer->setTimerType(Qt::PreciseTimer);
    timer->setInterval(static_cast<int>(delay));
    const auto id = record.id;
    connect(timer.get(), &QTimer::timeout, this, [this, id]() { onRetryTimer(id); });
    timer->start();

    cancelRetry(id);
    retry_timers_.emplace(id, std::move(timer));
}

void QueueService::cancelRetry(const Uuid& id) {
    auto it = retry_timers_.find(id);
    if (it == retry_timers_.end()) return;
    it->second->stop();
    // May be running inside this timer's timeout().
    it->second.release()->deleteLater();
    retry_timers_.erase(it);
}

void QueueService::onRetryTimer(const Uuid& id) {
    cancelRetry(id);

    const auto* r = find(id);
    if (!r || r->status != RecordStatus::Pending) return;

    // Wall clock and timer clock may disagree by a millisecond.
    if (!is_due(*r, Timestamp::now())) {
        scheduleRetry(*r);
        return;
    }
    processQueue();
}

// ============================================================================
// User actions
// ============================================================================

Result<int, Error> QueueService::retryAll() {
    if (!loaded_) {
        return Result<int, Error>::err(Error{"Queue used before loadFromStore()"});
    }

    std::vector<QueuedWriteRecord> reset;
    for (const auto& r : records_) {
        if (r.status == RecordStatus::Failed) {
            reset.push_back(reset_for_retry(r));
        }
    }

    if (!reset.empty()) {
        auto saved = store_.put_all(reset);
        if (saved.is_err()) {
            return Result<int, Error>::err(saved.unwrap_err());
        }
        for (const auto& r : reset) {
            if (auto* current = find(r.id)) {
                *current = r;
            }
        }
        qCInfo(tallyQueueLog) << "QUEUE: retryAll reset=" << reset.size();
        emit queueChanged();
    }

    processQueue();
    return Result<int, Error>::ok(static_cast<int>(reset.size()));
}

Result<int, Error> QueueService::purgeFailed() {
    if (!loaded_) {
        return Result<int, Error>::err(Error{"Queue used before loadFromStore()"});
    }

    auto removed = store_.remove_by_status(RecordStatus::Failed);
    if (removed.is_err()) {
        return removed;
    }

    std::erase_if(records_, [](const QueuedWriteRecord& r) {
        return r.status == RecordStatus::Failed;
    });
    qCInfo(tallyQueueLog) << "QUEUE: purged failed=" << removed.unwrap();
    emit queueChanged();
    // Writes held behind a purged record can go now.
    if (removed.unwrap() > 0 && pendingCount() > 0) {
        processQueue();
    }
    return removed;
}

Result<void, Error> QueueService::clearAll() {
    auto cleared = store_.clear();
    if (cleared.is_err()) {
        return cleared;
    }

    for (auto& [id, timer] : retry_timers_) {
        timer->stop();
        timer.release()->deleteLater();
    }
    retry_timers_.clear();
    records_.clear();
    pass_queue_.clear();

    qCInfo(tallyQueueLog) << "QUEUE: cleared";
    emit queueChanged();
    return Result<void, Error>::ok();
}

} // namespace tally::sync
