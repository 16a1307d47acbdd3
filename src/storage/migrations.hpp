#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace tally::storage {

/**
 * Migration - A database schema migration.
 */
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

/**
 * All migrations in order.
 */
inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "expense_queue",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS expense_queue (
                id TEXT PRIMARY KEY,
                operation TEXT NOT NULL,
                target_collection TEXT NOT NULL,
                entity_id TEXT NOT NULL,
                payload TEXT NOT NULL DEFAULT '{}',
                enqueued_at INTEGER NOT NULL,
                attempt_count INTEGER NOT NULL DEFAULT 0,
                last_error TEXT,
                status TEXT NOT NULL DEFAULT 'pending',
                batch_id TEXT,
                batch_position INTEGER NOT NULL DEFAULT 0,
                last_attempt_at INTEGER
            );
            CREATE INDEX IF NOT EXISTS idx_expense_queue_status ON expense_queue(status);
            CREATE INDEX IF NOT EXISTS idx_expense_queue_order
                ON expense_queue(enqueued_at, batch_position);
        )SQL",
        .down_sql = R"SQL(
            DROP INDEX IF EXISTS idx_expense_queue_order;
            DROP INDEX IF EXISTS idx_expense_queue_status;
            DROP TABLE IF EXISTS expense_queue;
        )SQL"
    },
    {
        .version = 2,
        .name = "retry_scheduling",
        .up_sql = R"SQL(
            ALTER TABLE expense_queue ADD COLUMN next_attempt_at INTEGER NOT NULL DEFAULT 0;
            ALTER TABLE expense_queue ADD COLUMN last_error_kind TEXT;
            CREATE INDEX IF NOT EXISTS idx_expense_queue_batch ON expense_queue(batch_id);
        )SQL",
        .down_sql = R"SQL(
            DROP INDEX IF EXISTS idx_expense_queue_batch;
            ALTER TABLE expense_queue DROP COLUMN last_error_kind;
            ALTER TABLE expense_queue DROP COLUMN next_attempt_at;
        )SQL"
    }
};

/**
 * MigrationRunner - Runs database migrations.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    /**
     * Run all pending migrations.
     */
    [[nodiscard]] Result<void, Error> migrate();

    [[nodiscard]] Result<void, Error> migrate_to(int target_version);

    /**
     * Roll back to a specific version.
     */
    [[nodiscard]] Result<void, Error> rollback_to(int target_version);

    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
    [[nodiscard]] Result<void, Error> run_rollback(const Migration& m);
    [[nodiscard]] Result<void, Error> set_version(const Migration& m);
};

/**
 * Initialize a database with all migrations.
 */
[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace tally::storage
