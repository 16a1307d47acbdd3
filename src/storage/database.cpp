#include "storage/database.hpp"

namespace tally::storage {

namespace {

Error sqlite_error(std::string message, int rc) {
    return Error::durability(std::move(message), rc);
}

Result<void, Error> check_bind(int rc, const char* what) {
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error(std::string("Failed to bind ") + what, rc));
    }
    return Result<void, Error>::ok();
}

} // namespace

// ============================================================================
// Statement implementation
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    return check_bind(sqlite3_bind_text(stmt_.get(), index, text.data(),
                                        static_cast<int>(text.size()), SQLITE_TRANSIENT),
                      "text");
}

Result<void, Error> Statement::bind_int(int index, int value) {
    return check_bind(sqlite3_bind_int(stmt_.get(), index, value), "int");
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_.get(), index, value), "int64");
}

Result<void, Error> Statement::bind_null(int index) {
    return check_bind(sqlite3_bind_null(stmt_.get(), index), "null");
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return reinterpret_cast<const char*>(text);
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(
        sqlite_error(db ? sqlite3_errmsg(db) : "Step failed", rc));
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(sqlite_error("Cannot open " + path + ": " + error, rc));
    }

    Database db(raw);
    sqlite3_busy_timeout(raw, 5000);

    // WAL keeps readers off the writer; FULL makes every COMMIT an fsync.
    for (const char* pragma : {"PRAGMA journal_mode = WAL;",
                               "PRAGMA synchronous = FULL;",
                               "PRAGMA foreign_keys = ON;"}) {
        auto result = db.execute(pragma);
        if (result.is_err()) {
            return Result<Database, Error>::err(result.unwrap_err());
        }
    }

    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement, Error>::err(sqlite_error("Database not open", SQLITE_MISUSE));
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(sqlite_error(last_error(), rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void, Error>::err(sqlite_error("Database not open", SQLITE_MISUSE));
    }
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(sqlite_error(error, rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

Result<void, Error> Database::checkpoint() {
    if (!db_) {
        return Result<void, Error>::err(sqlite_error("Database not open", SQLITE_MISUSE));
    }
    int log_frames = 0;
    int checkpointed = 0;
    int rc = sqlite3_wal_checkpoint_v2(db_, nullptr, SQLITE_CHECKPOINT_FULL,
                                       &log_frames, &checkpointed);
    // In-memory databases have no WAL; SQLITE_OK with -1 frames is fine.
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error("WAL checkpoint failed: " + last_error(), rc));
    }
    return Result<void, Error>::ok();
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace tally::storage
