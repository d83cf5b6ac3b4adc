#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace sparkle::storage {

/**
 * Table - Tables whose changes are reported to subscribers.
 * Values are bit flags so several tables can be reported at once.
 */
enum class Table : unsigned {
    None = 0,
    Themes = 1u << 0,
    Inspirations = 1u << 1
};

[[nodiscard]] constexpr Table operator|(Table a, Table b) noexcept {
    return static_cast<Table>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

[[nodiscard]] constexpr bool contains(Table set, Table t) noexcept {
    return (static_cast<unsigned>(set) & static_cast<unsigned>(t)) != 0;
}

/**
 * Build an Error from a SQLite result code.
 *
 * Constraint failures are mapped onto the domain taxonomy: primary key and
 * unique violations become DuplicateKey, foreign key violations NotFound.
 */
[[nodiscard]] Error sqlite_error(int rc, std::string message);

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers (1-based index)
    Result<void, Error> bind_text(int index, std::string_view text);
    Result<void, Error> bind_int(int index, int value);
    Result<void, Error> bind_int64(int index, int64_t value);

    // Column getters (0-based index)
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;

    // Execute
    Result<bool, Error> step();  // Returns true if there's a row
    Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite connection shared by every component of a Store.
 *
 * - RAII connection management
 * - One recursive lock: every repository call and every transaction holds
 *   it, so at most one write transaction is in flight and readers see either
 *   the state before or after it
 * - Nested transactions join the outermost one (single commit point)
 * - Tables touched inside a transaction are reported to the change hook only
 *   after COMMIT, and dropped on ROLLBACK
 *
 * Change hooks run on the writing thread. After a COMMIT the transaction's
 * lock is already released, so an exception from a hook reaches the writer
 * with the data committed and the connection usable. Hooks may read through
 * the same Database.
 */
class Database {
public:
    using ChangeHook = std::function<void(Table)>;

    // Immediate takes the write lock at BEGIN; Deferred only reads until it
    // first writes. A nested transaction joins the outer one in either mode.
    enum class TransactionMode { Immediate, Deferred };

    struct OpenOptions {
        int busy_timeout_ms = 5000;
        bool wal = true;
    };

    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open a database connection with foreign keys enforced.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);
    [[nodiscard]] static Result<Database, Error> open(const std::string& path,
                                                      const OpenOptions& options);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    void close();

    /**
     * Acquire the connection lock for a multi-statement read or write.
     */
    [[nodiscard]] std::unique_lock<std::recursive_mutex> lock() const {
        return std::unique_lock<std::recursive_mutex>(*mutex_);
    }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Execute one or more SQL statements without results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Execute a SQL statement and process each row with a callback.
     */
    template<typename F>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback) {
        auto guard = lock();
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return Result<void, Error>::ok();
    }

    /**
     * Begin a transaction (BEGIN IMMEDIATE by default), or join the open one.
     * Acquires the connection lock until the matching commit or rollback.
     */
    [[nodiscard]] Result<void, Error> begin_transaction(
        TransactionMode mode = TransactionMode::Immediate);

    /**
     * Commit the outermost transaction; inner commits only unwind.
     * Fails if an inner scope rolled back, after rolling back everything.
     */
    [[nodiscard]] Result<void, Error> commit();

    /**
     * Roll back. An inner rollback marks the whole transaction rollback-only.
     */
    void rollback();

    [[nodiscard]] bool in_transaction() const { return depth_ > 0; }

    /**
     * Execute a function within a transaction.
     * Commits on success, rolls back on error result or exception.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f, TransactionMode mode = TransactionMode::Immediate)
        -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction(mode);
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        try {
            auto result = f();
            if (result.is_err()) {
                rollback();
                return result;
            }

            auto commit_result = commit();
            if (commit_result.is_err()) {
                return ResultType::err(commit_result.unwrap_err());
            }
            return result;
        } catch (...) {
            rollback();
            throw;
        }
    }

    /**
     * Record that a table changed. Delivered to the change hook immediately
     * in autocommit mode, or after the enclosing transaction commits.
     */
    void touch(Table table);

    void set_change_hook(ChangeHook hook) { change_hook_ = std::move(hook); }

    [[nodiscard]] int64_t last_insert_rowid() const;

    /**
     * Get the number of rows changed by the last statement.
     */
    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    void deliver(Table tables);

    sqlite3* db_ = nullptr;
    std::unique_ptr<std::recursive_mutex> mutex_ = std::make_unique<std::recursive_mutex>();
    int depth_ = 0;
    bool rollback_only_ = false;
    Table pending_ = Table::None;
    ChangeHook change_hook_;
};

/**
 * Transaction RAII guard.
 * Automatically rolls back if not explicitly committed.
 */
class TransactionGuard {
public:
    explicit TransactionGuard(Database& db);
    ~TransactionGuard();

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    [[nodiscard]] Result<void, Error> commit();
    void rollback();

    [[nodiscard]] bool is_active() const { return active_; }

    // Why begin failed, if it did.
    [[nodiscard]] const Error& begin_error() const { return begin_error_; }

private:
    Database& db_;
    bool active_ = false;
    Error begin_error_;
};

} // namespace sparkle::storage
