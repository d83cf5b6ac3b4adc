#include "storage/database.hpp"
#include "storage/logging.hpp"

namespace sparkle::storage {

Error sqlite_error(int rc, std::string message) {
    Error error{std::move(message), rc};
    switch (rc) {
        case SQLITE_CONSTRAINT_PRIMARYKEY:
        case SQLITE_CONSTRAINT_UNIQUE:
            error.kind = ErrorKind::DuplicateKey;
            break;
        case SQLITE_CONSTRAINT_FOREIGNKEY:
            error.kind = ErrorKind::NotFound;
            break;
        default:
            error.kind = ErrorKind::Storage;
            break;
    }
    return error;
}

// ============================================================================
// Statement implementation
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    int rc = sqlite3_bind_text(stmt_.get(), index, text.data(),
                               static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error(rc, "Failed to bind text"));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_int(int index, int value) {
    int rc = sqlite3_bind_int(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error(rc, "Failed to bind int"));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error(rc, "Failed to bind int64"));
    }
    return Result<void, Error>::ok();
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    int size = sqlite3_column_bytes(stmt_.get(), index);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
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
    std::string message = db ? sqlite3_errmsg(db) : "Step failed";
    return Result<bool, Error>::err(sqlite_error(rc, std::move(message)));
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(sqlite_error(rc, "Reset failed"));
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept
    : db_(other.db_),
      mutex_(std::move(other.mutex_)),
      depth_(other.depth_),
      rollback_only_(other.rollback_only_),
      pending_(other.pending_),
      change_hook_(std::move(other.change_hook_)) {
    other.db_ = nullptr;
    other.mutex_ = std::make_unique<std::recursive_mutex>();
    other.depth_ = 0;
    other.pending_ = Table::None;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        mutex_ = std::move(other.mutex_);
        depth_ = other.depth_;
        rollback_only_ = other.rollback_only_;
        pending_ = other.pending_;
        change_hook_ = std::move(other.change_hook_);
        other.db_ = nullptr;
        other.mutex_ = std::make_unique<std::recursive_mutex>();
        other.depth_ = 0;
        other.pending_ = Table::None;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    return open(path, OpenOptions{});
}

Result<Database, Error> Database::open(const std::string& path, const OpenOptions& options) {
    sqlite3* raw = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &raw, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : "Unknown error";
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(sqlite_error(rc, error));
    }

    Database db(raw);
    sqlite3_extended_result_codes(raw, 1);
    sqlite3_busy_timeout(raw, options.busy_timeout_ms);

    // Enforcement is mandatory; the physical cascade is the last line of defence.
    auto fk_result = db.execute("PRAGMA foreign_keys = ON;");
    if (fk_result.is_err()) {
        return Result<Database, Error>::err(fk_result.unwrap_err());
    }

    if (options.wal && path != ":memory:") {
        auto wal_result = db.execute("PRAGMA journal_mode = WAL;");
        if (wal_result.is_err()) {
            qCWarning(sparkleStorageLog) << "WAL unavailable, keeping default journal:"
                                         << wal_result.unwrap_err().message.c_str();
        }
    }

    qCDebug(sparkleStorageLog) << "opened" << path.c_str();
    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement, Error>::err(Error{"Database not open", SQLITE_MISUSE});
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(sqlite_error(rc, last_error()));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void, Error>::err(Error{"Database not open", SQLITE_MISUSE});
    }
    auto guard = lock();
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : "Unknown error";
        sqlite3_free(error_msg);
        return Result<void, Error>::err(sqlite_error(rc, error));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction(TransactionMode mode) {
    mutex_->lock();
    if (depth_ > 0) {
        ++depth_;
        return Result<void, Error>::ok();
    }

    auto result = execute(mode == TransactionMode::Deferred ? "BEGIN DEFERRED TRANSACTION;"
                                                            : "BEGIN IMMEDIATE TRANSACTION;");
    if (result.is_err()) {
        mutex_->unlock();
        return result;
    }
    depth_ = 1;
    rollback_only_ = false;
    pending_ = Table::None;
    return Result<void, Error>::ok();
}

Result<void, Error> Database::commit() {
    if (depth_ == 0) {
        return Result<void, Error>::err(Error{"No active transaction"});
    }

    if (depth_ > 1) {
        --depth_;
        mutex_->unlock();
        return Result<void, Error>::ok();
    }

    if (rollback_only_) {
        rollback();
        return Result<void, Error>::err(Error{"Transaction was rolled back by a nested scope"});
    }

    auto result = execute("COMMIT;");
    if (result.is_err()) {
        // The transaction stays open after a failed COMMIT; abandon it.
        rollback();
        return result;
    }

    depth_ = 0;
    Table changed = pending_;
    pending_ = Table::None;
    // The hook runs subscriber code; a throw from it must not leave the
    // connection locked.
    mutex_->unlock();
    deliver(changed);
    return Result<void, Error>::ok();
}

void Database::rollback() {
    if (depth_ == 0) return;

    if (depth_ > 1) {
        --depth_;
        rollback_only_ = true;
        mutex_->unlock();
        return;
    }

    auto result = execute("ROLLBACK;");
    if (result.is_err()) {
        // SQLite may already have rolled back on its own (e.g. SQLITE_FULL).
        qCWarning(sparkleStorageLog) << "rollback:" << result.unwrap_err().message.c_str();
    }
    depth_ = 0;
    rollback_only_ = false;
    pending_ = Table::None;
    mutex_->unlock();
}

void Database::touch(Table table) {
    auto guard = lock();
    if (depth_ > 0) {
        pending_ = pending_ | table;
        return;
    }
    deliver(table);
}

void Database::deliver(Table tables) {
    if (tables == Table::None || !change_hook_) return;
    change_hook_(tables);
}

int64_t Database::last_insert_rowid() const {
    return sqlite3_last_insert_rowid(db_);
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

// ============================================================================
// TransactionGuard implementation
// ============================================================================

TransactionGuard::TransactionGuard(Database& db) : db_(db) {
    auto result = db_.begin_transaction();
    active_ = result.is_ok();
    if (!active_) {
        begin_error_ = result.unwrap_err();
    }
}

TransactionGuard::~TransactionGuard() {
    if (active_) {
        rollback();
    }
}

Result<void, Error> TransactionGuard::commit() {
    if (!active_) {
        return Result<void, Error>::err(Error{"No active transaction"});
    }
    active_ = false;
    return db_.commit();
}

void TransactionGuard::rollback() {
    if (active_) {
        db_.rollback();
        active_ = false;
    }
}

} // namespace sparkle::storage
