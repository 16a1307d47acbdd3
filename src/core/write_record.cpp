#include "core/write_record.hpp"

#include <algorithm>

namespace tally {

std::optional<OperationType> parse_operation(std::string_view text) {
    if (text == "create") return OperationType::Create;
    if (text == "update") return OperationType::Update;
    if (text == "delete") return OperationType::Delete;
    return std::nullopt;
}

std::optional<RecordStatus> parse_status(std::string_view text) {
    if (text == "pending") return RecordStatus::Pending;
    if (text == "syncing") return RecordStatus::Syncing;
    if (text == "failed") return RecordStatus::Failed;
    return std::nullopt;
}

std::chrono::milliseconds RetryPolicy::delay_for(int attempt_count) const {
    // Exponent clamped so the shift stays well inside int64.
    const int exponent = std::clamp(attempt_count, 0, 30);
    const std::chrono::milliseconds delay = backoff_base * (int64_t{1} << exponent);
    return std::min(delay, backoff_cap);
}

QueuedWriteRecord make_record(const WriteRequest& request, Timestamp now) {
    return QueuedWriteRecord{
        .id = Uuid::generate(),
        .operation = request.operation,
        .target_collection = request.target_collection,
        .entity_id = request.entity_id,
        .payload = request.payload,
        .enqueued_at = now,
        .attempt_count = 0,
        .last_error = std::nullopt,
        .last_error_kind = std::nullopt,
        .status = RecordStatus::Pending,
        .batch_id = std::nullopt,
        .batch_position = 0,
        .last_attempt_at = std::nullopt,
        .next_attempt_at = Timestamp{}
    };
}

QueuedWriteRecord make_batch_record(const WriteRequest& request,
                                    const Uuid& batch_id,
                                    int position,
                                    Timestamp now) {
    auto record = make_record(request, now);
    record.batch_id = batch_id;
    record.batch_position = position;
    return record;
}

QueuedWriteRecord mark_syncing(QueuedWriteRecord record, Timestamp now) {
    record.status = RecordStatus::Syncing;
    record.last_attempt_at = now;
    return record;
}

QueuedWriteRecord mark_attempt_failed(QueuedWriteRecord record,
                                      const Error& error,
                                      const RetryPolicy& policy,
                                      Timestamp now) {
    record.last_error = error.message;
    record.last_error_kind = error.kind;
    record.last_attempt_at = now;

    if (!error.is_retryable()) {
        record.attempt_count = policy.max_attempts;
    } else {
        record.attempt_count = std::min(record.attempt_count + 1, policy.max_attempts);
    }

    if (record.attempt_count >= policy.max_attempts) {
        record.status = RecordStatus::Failed;
        record.next_attempt_at = Timestamp{};
    } else {
        record.status = RecordStatus::Pending;
        record.next_attempt_at = now + policy.delay_for(record.attempt_count);
    }
    return record;
}

QueuedWriteRecord reset_for_retry(QueuedWriteRecord record) {
    record.status = RecordStatus::Pending;
    record.attempt_count = 0;
    record.last_error.reset();
    record.last_error_kind.reset();
    record.next_attempt_at = Timestamp{};
    return record;
}

QueuedWriteRecord recover_interrupted(QueuedWriteRecord record) {
    if (record.status == RecordStatus::Syncing) {
        record.status = RecordStatus::Pending;
        record.next_attempt_at = Timestamp{};
    }
    return record;
}

bool is_due(const QueuedWriteRecord& record, Timestamp now) {
    return record.status == RecordStatus::Pending && record.next_attempt_at <= now;
}

bool dispatch_before(const QueuedWriteRecord& a, const QueuedWriteRecord& b) {
    if (a.enqueued_at != b.enqueued_at) return a.enqueued_at < b.enqueued_at;
    return a.batch_position < b.batch_position;
}

} // namespace tally
