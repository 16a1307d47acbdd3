#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace tally::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers (1-based indices)
    [[nodiscard]] Result<void, Error> bind_text(int index, std::string_view text);
    [[nodiscard]] Result<void, Error> bind_int(int index, int value);
    [[nodiscard]] Result<void, Error> bind_int64(int index, int64_t value);
    [[nodiscard]] Result<void, Error> bind_null(int index);

    // Column getters (0-based indices)
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    // Returns true if there's a row
    [[nodiscard]] Result<bool, Error> step();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite connection tuned for a durable write queue.
 *
 * Opened in WAL mode with synchronous=FULL: a committed transaction has
 * been fsync'd before COMMIT returns. All failures are reported as
 * ErrorKind::Durability.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    /**
     * Execute a function within a transaction.
     * Commits on success, rolls back on failure.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                auto error = result.unwrap_err();
                error.message += " (rollback failed: " + rollback_result.unwrap_err().message + ")";
                return ResultType::err(std::move(error));
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            auto error = commit_result.unwrap_err();
            // A failed COMMIT may leave the transaction open (SQLITE_BUSY).
            if (sqlite3_get_autocommit(db_) == 0) {
                auto rollback_result = rollback();
                if (rollback_result.is_err()) {
                    error.message += " (rollback failed: " + rollback_result.unwrap_err().message + ")";
                }
            }
            return ResultType::err(std::move(error));
        }

        return result;
    }

    /**
     * Move committed WAL frames into the main database file and sync it.
     */
    [[nodiscard]] Result<void, Error> checkpoint();

    [[nodiscard]] int changes() const;
    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

} // namespace tally::storage
