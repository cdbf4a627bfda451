/**
 * dbpool/error.hpp - Exception type for SQLite failures
 *
 * Part of dbpool - concurrent access to a single SQLite database.
 */

#pragma once

#include <sqlite3.h>
#include <stdexcept>
#include <string>

namespace dbpool {

/**
 * Raised for every engine failure: open errors, bad SQL, constraint
 * violations, busy/locked status, checkpoint failures, reentrant access.
 *
 * code() holds the (possibly extended) SQLite result code.
 */
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(int code, const std::string& message, const std::string& sql = "")
        : std::runtime_error(describe(code, message, sql))
        , code_(code)
        , message_(message)
        , sql_(sql) {}

    explicit DatabaseError(const std::string& message)
        : DatabaseError(SQLITE_ERROR, message) {}

    int code() const noexcept { return code_; }

    // Primary result code, without the extended bits.
    int primary_code() const noexcept { return code_ & 0xFF; }

    const std::string& message() const noexcept { return message_; }
    const std::string& sql() const noexcept { return sql_; }

private:
    int code_;
    std::string message_;
    std::string sql_;

    static std::string describe(int code, const std::string& message, const std::string& sql) {
        std::string out = "SQLite error " + std::to_string(code) + ": " + message;
        if (!sql.empty()) {
            out += " - while executing `" + sql + "`";
        }
        return out;
    }
};

} // namespace dbpool
