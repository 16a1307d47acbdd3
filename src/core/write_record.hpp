#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tally {

enum class OperationType {
    Create,
    Update,
    Delete
};

/**
 * RecordStatus - Lifecycle of a queued write.
 *
 * pending -> syncing -> (removed | pending | failed)
 * failed  -> pending   (user retry only)
 */
enum class RecordStatus {
    Pending,
    Syncing,
    Failed
};

[[nodiscard]] constexpr std::string_view to_string(OperationType op) noexcept {
    switch (op) {
        case OperationType::Create: return "create";
        case OperationType::Update: return "update";
        case OperationType::Delete: return "delete";
    }
    return "create";
}

[[nodiscard]] constexpr std::string_view to_string(RecordStatus status) noexcept {
    switch (status) {
        case RecordStatus::Pending: return "pending";
        case RecordStatus::Syncing: return "syncing";
        case RecordStatus::Failed: return "failed";
    }
    return "pending";
}

[[nodiscard]] std::optional<OperationType> parse_operation(std::string_view text);
[[nodiscard]] std::optional<RecordStatus> parse_status(std::string_view text);

/**
 * WriteRequest - A write intent that could not be performed remotely yet.
 */
struct WriteRequest {
    OperationType operation = OperationType::Create;
    std::string target_collection;
    Uuid entity_id;
    std::string payload;  // Serialized entity fields (JSON)
};

/**
 * QueuedWriteRecord - One durable entry of the write queue.
 */
struct QueuedWriteRecord {
    Uuid id;
    OperationType operation = OperationType::Create;
    std::string target_collection;
    Uuid entity_id;
    std::string payload;
    Timestamp enqueued_at;
    int attempt_count = 0;
    std::optional<std::string> last_error;
    std::optional<ErrorKind> last_error_kind;
    RecordStatus status = RecordStatus::Pending;
    std::optional<Uuid> batch_id;
    int batch_position = 0;
    std::optional<Timestamp> last_attempt_at;
    Timestamp next_attempt_at;  // Epoch means "due now"

    bool operator==(const QueuedWriteRecord&) const = default;
};

/**
 * QueuedBatch - Records produced by a single user action.
 * Members are retried individually; order is enqueue order.
 */
struct QueuedBatch {
    Uuid batch_id;
    std::vector<QueuedWriteRecord> records;
};

/**
 * RetryPolicy - Attempt cap and exponential backoff.
 *
 * delay(n) = min(base * 2^n, cap), n = attempts made so far.
 */
struct RetryPolicy {
    int max_attempts = 5;
    std::chrono::milliseconds backoff_base{1000};
    std::chrono::milliseconds backoff_cap{60000};

    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt_count) const;
};

// ============================================================================
// Pure record transitions
// ============================================================================

[[nodiscard]] QueuedWriteRecord make_record(const WriteRequest& request, Timestamp now);

[[nodiscard]] QueuedWriteRecord make_batch_record(const WriteRequest& request,
                                                  const Uuid& batch_id,
                                                  int position,
                                                  Timestamp now);

[[nodiscard]] QueuedWriteRecord mark_syncing(QueuedWriteRecord record, Timestamp now);

/**
 * Apply a failed dispatch. Transient errors consume one attempt and
 * schedule the next one; validation errors exhaust the budget at once.
 */
[[nodiscard]] QueuedWriteRecord mark_attempt_failed(QueuedWriteRecord record,
                                                    const Error& error,
                                                    const RetryPolicy& policy,
                                                    Timestamp now);

/**
 * User-initiated retry: back to pending with a fresh budget.
 */
[[nodiscard]] QueuedWriteRecord reset_for_retry(QueuedWriteRecord record);

/**
 * Records left in `syncing` by a process that died mid-dispatch.
 */
[[nodiscard]] QueuedWriteRecord recover_interrupted(QueuedWriteRecord record);

[[nodiscard]] bool is_due(const QueuedWriteRecord& record, Timestamp now);

/**
 * Dispatch order: enqueue time, then position inside a batch.
 */
[[nodiscard]] bool dispatch_before(const QueuedWriteRecord& a, const QueuedWriteRecord& b);

// ============================================================================
// Aggregate sync state
// ============================================================================

enum class SyncPhase {
    Idle,
    Pending,
    Syncing,
    Synced,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(SyncPhase phase) noexcept {
    switch (phase) {
        case SyncPhase::Idle: return "idle";
        case SyncPhase::Pending: return "pending";
        case SyncPhase::Syncing: return "syncing";
        case SyncPhase::Synced: return "synced";
        case SyncPhase::Error: return "error";
    }
    return "idle";
}

/**
 * SyncState - What the UI shows. Not persisted.
 */
struct SyncState {
    SyncPhase phase = SyncPhase::Idle;
    int pending_count = 0;
    int failed_count = 0;
    std::optional<Timestamp> last_synced_at;
    std::optional<std::string> last_error;

    bool operator==(const SyncState&) const = default;
};

} // namespace tally
