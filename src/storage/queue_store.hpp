#pragma once

#include "storage/database.hpp"
#include "core/write_record.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace tally::storage {

/**
 * PersistentQueueStore - Durable storage for queued writes, keyed by
 * record id.
 *
 * Every mutating call commits its own transaction (fsync'd, see
 * Database), so a record acknowledged by put() survives the process
 * being killed right after. A successful commit is reported as success
 * even when the WAL checkpoint that follows it is busy.
 * Errors carry ErrorKind::Durability.
 */
class PersistentQueueStore {
public:
    // Logical container shared by the whole application.
    static constexpr const char* CONTAINER = "expense_queue";

    explicit PersistentQueueStore(Database& db) : db_(db) {}

    /**
     * Insert or replace a record, then flush.
     */
    [[nodiscard]] Result<void, Error> put(const QueuedWriteRecord& record);

    /**
     * Insert or replace several records atomically, then flush.
     */
    [[nodiscard]] Result<void, Error> put_all(const std::vector<QueuedWriteRecord>& records);

    [[nodiscard]] Result<std::optional<QueuedWriteRecord>, Error> get(const Uuid& id);

    /**
     * All records in dispatch order.
     */
    [[nodiscard]] Result<std::vector<QueuedWriteRecord>, Error> get_all();

    [[nodiscard]] Result<void, Error> remove(const Uuid& id);

    /**
     * Remove every record with the given status. Returns how many went.
     */
    [[nodiscard]] Result<int, Error> remove_by_status(RecordStatus status);

    [[nodiscard]] Result<void, Error> clear();

    [[nodiscard]] Result<int, Error> count();

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> upsert(const QueuedWriteRecord& record);
    void flush();
    [[nodiscard]] QueuedWriteRecord row_to_record(Statement& stmt);
};

} // namespace tally::storage
