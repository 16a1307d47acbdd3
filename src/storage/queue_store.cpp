#include "storage/queue_store.hpp"
#include "core/log_categories.hpp"

namespace tally::storage {

namespace {

constexpr const char* kSelectColumns = R"SQL(
    SELECT id, operation, target_collection, entity_id, payload, enqueued_at,
           attempt_count, last_error, status, batch_id, batch_position,
           last_attempt_at, next_attempt_at, last_error_kind
    FROM expense_queue
)SQL";

Result<void, Error> bind_optional_text(Statement& stmt, int index,
                                       const std::optional<std::string>& value) {
    return value ? stmt.bind_text(index, *value) : stmt.bind_null(index);
}

} // namespace

QueuedWriteRecord PersistentQueueStore::row_to_record(Statement& stmt) {
    QueuedWriteRecord record{
        .id = Uuid::parse(stmt.column_text(0)).value_or(Uuid{}),
        .operation = parse_operation(stmt.column_text(1)).value_or(OperationType::Create),
        .target_collection = stmt.column_text(2),
        .entity_id = Uuid::parse(stmt.column_text(3)).value_or(Uuid{}),
        .payload = stmt.column_text(4),
        .enqueued_at = Timestamp(stmt.column_int64(5)),
        .attempt_count = stmt.column_int(6),
        .last_error = std::nullopt,
        .last_error_kind = std::nullopt,
        .status = parse_status(stmt.column_text(8)).value_or(RecordStatus::Pending),
        .batch_id = std::nullopt,
        .batch_position = stmt.column_int(10),
        .last_attempt_at = std::nullopt,
        .next_attempt_at = Timestamp(stmt.column_int64(12))
    };

    if (!stmt.column_is_null(7)) {
        record.last_error = stmt.column_text(7);
    }
    if (!stmt.column_is_null(9)) {
        record.batch_id = Uuid::parse(stmt.column_text(9));
    }
    if (!stmt.column_is_null(11)) {
        record.last_attempt_at = Timestamp(stmt.column_int64(11));
    }
    if (!stmt.column_is_null(13)) {
        record.last_error_kind = error_kind_from_string(stmt.column_text(13));
    }
    return record;
}

Result<void, Error> PersistentQueueStore::upsert(const QueuedWriteRecord& record) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT OR REPLACE INTO expense_queue
            (id, operation, target_collection, entity_id, payload, enqueued_at,
             attempt_count, last_error, status, batch_id, batch_position,
             last_attempt_at, next_attempt_at, last_error_kind)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();

    std::optional<std::string> batch_id;
    if (record.batch_id) batch_id = record.batch_id->to_string();
    std::optional<std::string> error_kind;
    if (record.last_error_kind) error_kind = std::string(to_string(*record.last_error_kind));

    auto bound = stmt.bind_text(1, record.id.to_string())
        .and_then([&] { return stmt.bind_text(2, to_string(record.operation)); })
        .and_then([&] { return stmt.bind_text(3, record.target_collection); })
        .and_then([&] { return stmt.bind_text(4, record.entity_id.to_string()); })
        .and_then([&] { return stmt.bind_text(5, record.payload); })
        .and_then([&] { return stmt.bind_int64(6, record.enqueued_at.millis()); })
        .and_then([&] { return stmt.bind_int(7, record.attempt_count); })
        .and_then([&] { return bind_optional_text(stmt, 8, record.last_error); })
        .and_then([&] { return stmt.bind_text(9, to_string(record.status)); })
        .and_then([&] { return bind_optional_text(stmt, 10, batch_id); })
        .and_then([&] { return stmt.bind_int(11, record.batch_position); })
        .and_then([&] {
            return record.last_attempt_at
                ? stmt.bind_int64(12, record.last_attempt_at->millis())
                : stmt.bind_null(12);
        })
        .and_then([&] { return stmt.bind_int64(13, record.next_attempt_at.millis()); })
        .and_then([&] { return bind_optional_text(stmt, 14, error_kind); });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

void PersistentQueueStore::flush() {
    // The commit is already durable (synchronous=FULL); a busy checkpoint
    // only leaves frames in the WAL for the next one.
    auto checkpointed = db_.checkpoint();
    if (checkpointed.is_err()) {
        qCWarning(tallyQueueLog) << "QUEUE: checkpoint deferred:"
                                 << QString::fromStdString(checkpointed.unwrap_err().message);
    }
}

Result<void, Error> PersistentQueueStore::put(const QueuedWriteRecord& record) {
    auto result = db_.transaction([&]() { return upsert(record); });
    if (result.is_err()) {
        return result;
    }
    flush();
    return Result<void, Error>::ok();
}

Result<void, Error> PersistentQueueStore::put_all(const std::vector<QueuedWriteRecord>& records) {
    auto result = db_.transaction([&]() -> Result<void, Error> {
        for (const auto& record : records) {
            auto saved = upsert(record);
            if (saved.is_err()) {
                return saved;
            }
        }
        return Result<void, Error>::ok();
    });
    if (result.is_err()) {
        return result;
    }
    flush();
    return Result<void, Error>::ok();
}

Result<std::optional<QueuedWriteRecord>, Error> PersistentQueueStore::get(const Uuid& id) {
    using R = Result<std::optional<QueuedWriteRecord>, Error>;

    auto stmt_result = db_.prepare(std::string(kSelectColumns) + " WHERE id = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, id.to_string());
    if (bound.is_err()) {
        return R::err(bound.unwrap_err());
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return R::ok(row_to_record(stmt));
}

Result<std::vector<QueuedWriteRecord>, Error> PersistentQueueStore::get_all() {
    using R = Result<std::vector<QueuedWriteRecord>, Error>;
    std::vector<QueuedWriteRecord> records;

    auto stmt_result = db_.prepare(
        std::string(kSelectColumns) + " ORDER BY enqueued_at, batch_position, id;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return R::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        records.push_back(row_to_record(stmt));
    }

    return R::ok(std::move(records));
}

Result<void, Error> PersistentQueueStore::remove(const Uuid& id) {
    auto result = db_.transaction([&]() -> Result<void, Error> {
        auto stmt_result = db_.prepare("DELETE FROM expense_queue WHERE id = ?;");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        auto bound = stmt.bind_text(1, id.to_string());
        if (bound.is_err()) {
            return bound;
        }
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<void, Error>::err(step_result.unwrap_err());
        }
        return Result<void, Error>::ok();
    });
    if (result.is_err()) {
        return result;
    }
    flush();
    return Result<void, Error>::ok();
}

Result<int, Error> PersistentQueueStore::remove_by_status(RecordStatus status) {
    int removed = 0;
    auto result = db_.transaction([&]() -> Result<void, Error> {
        auto stmt_result = db_.prepare("DELETE FROM expense_queue WHERE status = ?;");
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        auto bound = stmt.bind_text(1, to_string(status));
        if (bound.is_err()) {
            return bound;
        }
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<void, Error>::err(step_result.unwrap_err());
        }
        removed = db_.changes();
        return Result<void, Error>::ok();
    });
    if (result.is_err()) {
        return Result<int, Error>::err(result.unwrap_err());
    }

    flush();
    return Result<int, Error>::ok(removed);
}

Result<void, Error> PersistentQueueStore::clear() {
    auto result = db_.execute("DELETE FROM expense_queue;");
    if (result.is_err()) {
        return result;
    }
    flush();
    return Result<void, Error>::ok();
}

Result<int, Error> PersistentQueueStore::count() {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM expense_queue;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(stmt.column_int(0));
}

} // namespace tally::storage
