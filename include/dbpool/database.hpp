/**
 * dbpool/database.hpp - RAII SQLite connection with query and transaction helpers
 *
 * Part of dbpool - concurrent access to a single SQLite database.
 *
 * A Database is one physical connection. It is not thread-safe by itself:
 * SerializedDatabase confines every Database to a single worker thread.
 *
 * Example usage:
 *
 *   dbpool::Database db("/tmp/app.sqlite");
 *   db.execute("CREATE TABLE t (x INTEGER)");
 *
 *   db.in_transaction(dbpool::TransactionKind::Immediate, [](dbpool::Database& db) {
 *       db.execute("INSERT INTO t VALUES (1)");
 *       return dbpool::TransactionCompletion::Commit;
 *   });
 *
 *   auto result = db.query("SELECT x FROM t");
 *   if (!result.ok()) {
 *       fprintf(stderr, "Query error: %s\n", result.error.c_str());
 *   }
 */

#pragma once

#include "error.hpp"
#include "functions.hpp"
#include "types.hpp"

#include <sqlite3.h>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace dbpool {

// ============================================================================
// Query Result Types
// ============================================================================

struct Row {
    std::vector<std::string> values;  // SQL NULL reads as ""
    std::vector<bool> nulls;          // Parallel to values; may be shorter

    const std::string& operator[](size_t i) const { return values[i]; }
    std::string& operator[](size_t i) { return values[i]; }
    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }

    bool is_null(size_t i) const { return i < nulls.size() && nulls[i]; }
};

struct Result {
    std::vector<std::string> columns;
    std::vector<Row> rows;
    std::string error;
    int code = SQLITE_OK;

    bool ok() const { return error.empty(); }
    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }

    const Row& operator[](size_t i) const { return rows[i]; }

    auto begin() { return rows.begin(); }
    auto end() { return rows.end(); }
    auto begin() const { return rows.begin(); }
    auto end() const { return rows.end(); }
};

// ============================================================================
// Database Wrapper
// ============================================================================

class Database {
public:
    /**
     * Open a connection.
     * @param path Database file path
     * @param config Connection options; readonly selects SQLITE_OPEN_READONLY
     * @throws DatabaseError if the file cannot be opened or configured
     */
    explicit Database(const std::string& path, const Configuration& config = Configuration())
        : path_(path)
        , config_(config)
        , trace_(std::make_unique<trace_func_t>(config.trace)) {
        open();
    }

    ~Database() { close(); }

    // Non-copyable
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Movable
    Database(Database&& other) noexcept
        : db_(other.db_)
        , path_(std::move(other.path_))
        , config_(std::move(other.config_))
        , trace_(std::move(other.trace_)) {
        other.db_ = nullptr;
    }

    Database& operator=(Database&& other) noexcept {
        if (this != &other) {
            close();
            db_ = other.db_;
            path_ = std::move(other.path_);
            config_ = std::move(other.config_);
            trace_ = std::move(other.trace_);
            other.db_ = nullptr;
        }
        return *this;
    }

    bool is_open() const { return db_ != nullptr; }

    // ========================================================================
    // Statement Execution
    // ========================================================================

    /**
     * Run one or more statements, discarding rows.
     * @throws DatabaseError on failure
     */
    void execute(const std::string& sql) {
        char* err = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            throw DatabaseError(extended_code(rc), msg, sql);
        }
    }

    /**
     * Like execute(), but reports failure through the return code and
     * last_error() instead of throwing.
     */
    int exec(const std::string& sql) {
        char* err = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
        if (err) {
            last_error_ = err;
            sqlite3_free(err);
        } else if (rc != SQLITE_OK) {
            last_error_ = sqlite3_errmsg(db_);
        } else {
            last_error_.clear();
        }
        return rc;
    }

    /**
     * Fetch every row of a single statement as text.
     * Errors are reported in Result::error and Result::code.
     */
    Result query(const std::string& sql) {
        Result result;

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            result.error = sqlite3_errmsg(db_);
            result.code = extended_code(rc);
            return result;
        }

        int col_count = sqlite3_column_count(stmt);
        result.columns.reserve(col_count);
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            result.columns.push_back(name ? name : "");
        }

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            Row row;
            row.values.reserve(col_count);
            row.nulls.reserve(col_count);
            for (int i = 0; i < col_count; ++i) {
                // Type first: sqlite3_column_text() may convert the value
                row.nulls.push_back(sqlite3_column_type(stmt, i) == SQLITE_NULL);
                const char* text = reinterpret_cast<const char*>(
                    sqlite3_column_text(stmt, i));
                row.values.push_back(text ? text : "");
            }
            result.rows.push_back(std::move(row));
        }

        if (rc != SQLITE_DONE) {
            result.error = sqlite3_errmsg(db_);
            result.code = extended_code(rc);
        }

        sqlite3_finalize(stmt);
        return result;
    }

    /**
     * First column of the first row, or "" when there is no row.
     * @throws DatabaseError on failure
     */
    std::string scalar(const std::string& sql) {
        auto result = query(sql);
        if (!result.ok()) {
            throw DatabaseError(result.code, result.error, sql);
        }
        if (result.empty() || result[0].empty()) {
            return "";
        }
        return result[0][0];
    }

    int64_t scalar_int64(const std::string& sql) {
        std::string value = scalar(sql);
        return value.empty() ? 0 : std::stoll(value);
    }

    // ========================================================================
    // Transactions
    // ========================================================================

    void begin_transaction(TransactionKind kind) {
        execute(transaction_kind_sql(kind));
    }

    void commit() { execute("COMMIT TRANSACTION"); }

    void rollback() { execute("ROLLBACK TRANSACTION"); }

    bool is_inside_transaction() const {
        return db_ && sqlite3_get_autocommit(db_) == 0;
    }

    /**
     * Run block(Database&) inside a transaction. The block returns
     * TransactionCompletion::Commit or ::Rollback.
     *
     * If the block throws, the transaction is rolled back and the block's
     * exception is rethrown. If COMMIT fails, the transaction is rolled back
     * and the commit error is rethrown.
     */
    template<typename Fn>
    void in_transaction(TransactionKind kind, Fn&& block) {
        begin_transaction(kind);

        TransactionCompletion completion = TransactionCompletion::Rollback;
        try {
            completion = block(*this);
        } catch (...) {
            rollback_after_error();
            throw;
        }

        switch (completion) {
            case TransactionCompletion::Commit:
                try {
                    commit();
                } catch (...) {
                    rollback_after_error();
                    throw;
                }
                break;
            case TransactionCompletion::Rollback:
                if (is_inside_transaction()) {
                    rollback();
                }
                break;
        }
    }

    template<typename Fn>
    void in_transaction(Fn&& block) {
        in_transaction(config_.default_transaction_kind, std::forward<Fn>(block));
    }

    /**
     * Run block(Database&) inside a transaction that always commits, and
     * return the block's value. The value is produced before COMMIT runs.
     */
    template<typename Fn>
    auto with_transaction(TransactionKind kind, Fn&& block)
        -> decltype(block(std::declval<Database&>())) {
        using R = decltype(block(std::declval<Database&>()));

        begin_transaction(kind);
        try {
            if constexpr (std::is_void_v<R>) {
                block(*this);
                commit();
            } else {
                R value = block(*this);
                commit();
                return value;
            }
        } catch (...) {
            rollback_after_error();
            throw;
        }
    }

    // ========================================================================
    // Functions and Collations
    // ========================================================================

    void add_function(const Function& function) {
        check(register_function(db_, function), "add function " + function.name());
    }

    void remove_function(const Function& function) {
        check(unregister_function(db_, function), "remove function " + function.name());
    }

    void add_collation(const Collation& collation) {
        check(register_collation(db_, collation, config_.log), "add collation " + collation.name());
    }

    void remove_collation(const Collation& collation) {
        check(unregister_collation(db_, collation), "remove collation " + collation.name());
    }

    // ========================================================================
    // WAL and Memory
    // ========================================================================

    /**
     * Run a WAL checkpoint on this connection.
     * @throws DatabaseError carrying the status code and sqlite3_errmsg()
     */
    CheckpointResult checkpoint(CheckpointMode mode = CheckpointMode::Passive) {
        CheckpointResult result;
        int rc = sqlite3_wal_checkpoint_v2(db_, nullptr, static_cast<int>(mode),
                                           &result.log_frames, &result.checkpointed_frames);
        if (rc != SQLITE_OK) {
            throw DatabaseError(rc, sqlite3_errmsg(db_));
        }
        return result;
    }

    // Free prepared statement caches, schema caches and page cache memory
    void release_memory() {
        check(sqlite3_db_release_memory(db_), "release memory");
    }

    // ========================================================================
    // Direct Access
    // ========================================================================

    sqlite3* handle() const { return db_; }
    const std::string& path() const { return path_; }
    const Configuration& configuration() const { return config_; }
    const std::string& last_error() const { return last_error_; }

    int64_t last_insert_rowid() const {
        return db_ ? sqlite3_last_insert_rowid(db_) : 0;
    }

    int changes() const {
        return db_ ? sqlite3_changes(db_) : 0;
    }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    Configuration config_;
    std::unique_ptr<trace_func_t> trace_;  // Stable address for sqlite3_trace_v2
    std::string last_error_;

    void open() {
        int flags = config_.readonly
            ? SQLITE_OPEN_READONLY
            : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

        int rc = sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db_ ? sqlite3_errmsg(db_) : "Failed to allocate database";
            close();
            throw DatabaseError(rc, "could not open database at path: " + path_ + ": " + msg);
        }

        try {
            sqlite3_extended_result_codes(db_, 1);
            check(sqlite3_busy_timeout(db_, config_.busy_timeout_ms), "set busy timeout");
            if (*trace_) {
                check(sqlite3_trace_v2(db_, SQLITE_TRACE_STMT, trace_callback, trace_.get()),
                      "install trace");
            }
            if (config_.foreign_keys_enabled) {
                execute("PRAGMA foreign_keys = ON");
            }
        } catch (...) {
            close();
            throw;
        }
    }

    void close() {
        if (db_) {
            // Statements left behind by a failed query would keep the
            // connection open (SQLITE_BUSY)
            sqlite3_stmt* stmt = nullptr;
            while ((stmt = sqlite3_next_stmt(db_, nullptr)) != nullptr) {
                sqlite3_finalize(stmt);
            }
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    // Some entry points (e.g. SQLITE_MISUSE checks) return without
    // recording an error on the connection
    int extended_code(int rc) const {
        if (!db_) return rc;
        int extended = sqlite3_extended_errcode(db_);
        return (extended & 0xFF) == (rc & 0xFF) ? extended : rc;
    }

    void check(int rc, const std::string& what) {
        if (rc != SQLITE_OK) {
            throw DatabaseError(extended_code(rc), what + ": " + sqlite3_errmsg(db_));
        }
    }

    // Rollback used while another error is propagating: never throws.
    void rollback_after_error() noexcept {
        if (!is_inside_transaction()) {
            // SQLite already rolled back (e.g. SQLITE_FULL, SQLITE_IOERR)
            return;
        }
        char* err = nullptr;
        int rc = sqlite3_exec(db_, "ROLLBACK TRANSACTION", nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : sqlite3_errmsg(db_);
            sqlite3_free(err);
            try {
                log_message(config_, "rollback failed after error: " + msg);
            } catch (const std::exception&) {
                // The original error is the one to report
            }
        }
    }

    static int trace_callback(unsigned type, void* ctx, void* /*stmt*/, void* sql) {
        if (type == SQLITE_TRACE_STMT && ctx && sql) {
            auto* trace = static_cast<trace_func_t*>(ctx);
            const char* text = static_cast<const char*>(sql);
            try {
                (*trace)(text);
            } catch (const std::exception&) {
                // Trace hooks cannot fail a statement
            }
        }
        return 0;
    }
};

} // namespace dbpool
