/**
 * dbpool/functions.hpp - SQL function and collation definitions
 *
 * Part of dbpool - concurrent access to a single SQLite database.
 *
 * A Function or Collation is a value that can be installed on any number of
 * connections. Copies share the same callable. Identity is (name, argc) for
 * functions and name for collations, compared case-insensitively like SQLite
 * does.
 *
 *   dbpool::Function succ("succ", 1, [](sqlite3_context* ctx, int, sqlite3_value** argv) {
 *       if (dbpool::arg_is_null(argv[0])) return dbpool::result_null(ctx);
 *       dbpool::result_int64(ctx, dbpool::arg_int64(argv[0]) + 1);
 *   });
 */

#pragma once

#include "error.hpp"
#include "log.hpp"

#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>

namespace dbpool {

// ============================================================================
// SQL Function Types
// ============================================================================

using SqlScalarFn = std::function<void(sqlite3_context*, int argc, sqlite3_value**)>;

// Three-way comparison: negative, zero or positive
using SqlCollationFn = std::function<int(const std::string& lhs, const std::string& rhs)>;

// ============================================================================
// Result Helpers
// ============================================================================

inline void result_int64(sqlite3_context* ctx, int64_t value) {
    sqlite3_result_int64(ctx, value);
}

inline void result_int(sqlite3_context* ctx, int value) {
    sqlite3_result_int(ctx, value);
}

inline void result_double(sqlite3_context* ctx, double value) {
    sqlite3_result_double(ctx, value);
}

inline void result_text(sqlite3_context* ctx, const std::string& value) {
    sqlite3_result_text(ctx, value.c_str(), -1, SQLITE_TRANSIENT);
}

inline void result_null(sqlite3_context* ctx) {
    sqlite3_result_null(ctx);
}

inline void result_error(sqlite3_context* ctx, const std::string& msg) {
    sqlite3_result_error(ctx, msg.c_str(), -1);
}

// ============================================================================
// Argument Helpers
// ============================================================================

inline int64_t arg_int64(sqlite3_value* val) {
    return sqlite3_value_int64(val);
}

inline double arg_double(sqlite3_value* val) {
    return sqlite3_value_double(val);
}

inline std::string arg_text(sqlite3_value* val) {
    const char* text = reinterpret_cast<const char*>(sqlite3_value_text(val));
    return text ? text : "";
}

inline bool arg_is_null(sqlite3_value* val) {
    return sqlite3_value_type(val) == SQLITE_NULL;
}

namespace detail {

inline std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace detail

// ============================================================================
// Definitions
// ============================================================================

class Function {
public:
    /**
     * @param name SQL name
     * @param argc Argument count, -1 for variadic
     * @param fn Implementation
     * @param pure Same inputs always give the same output (SQLITE_DETERMINISTIC)
     */
    Function(std::string name, int argc, SqlScalarFn fn, bool pure = true)
        : name_(std::move(name))
        , argc_(argc)
        , fn_(std::make_shared<SqlScalarFn>(std::move(fn)))
        , pure_(pure) {}

    const std::string& name() const { return name_; }
    int argc() const { return argc_; }
    bool pure() const { return pure_; }

    // Registry identity
    std::string key() const { return detail::lowercase(name_) + "/" + std::to_string(argc_); }

    int text_flags() const { return pure_ ? (SQLITE_UTF8 | SQLITE_DETERMINISTIC) : SQLITE_UTF8; }

    const std::shared_ptr<SqlScalarFn>& callable() const { return fn_; }

private:
    std::string name_;
    int argc_;
    std::shared_ptr<SqlScalarFn> fn_;
    bool pure_;
};

class Collation {
public:
    Collation(std::string name, SqlCollationFn compare)
        : name_(std::move(name))
        , compare_(std::make_shared<SqlCollationFn>(std::move(compare))) {}

    const std::string& name() const { return name_; }

    // Registry identity
    std::string key() const { return detail::lowercase(name_); }

    const std::shared_ptr<SqlCollationFn>& callable() const { return compare_; }

private:
    std::string name_;
    std::shared_ptr<SqlCollationFn> compare_;
};

// ============================================================================
// Installation
// ============================================================================

namespace detail {

// Per-connection user data; keeps the shared callable alive until SQLite
// drops the definition.
struct FunctionWrapper {
    std::shared_ptr<SqlScalarFn> fn;
};

struct CollationWrapper {
    std::shared_ptr<SqlCollationFn> compare;
    log_func_t log;
};

inline void scalar_callback(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    auto* wrapper = static_cast<FunctionWrapper*>(sqlite3_user_data(ctx));
    if (!wrapper || !wrapper->fn || !*wrapper->fn) {
        sqlite3_result_null(ctx);
        return;
    }
    try {
        (*wrapper->fn)(ctx, argc, argv);
    } catch (const std::exception& e) {
        sqlite3_result_error(ctx, e.what(), -1);
    }
}

inline void destroy_function_wrapper(void* ptr) {
    delete static_cast<FunctionWrapper*>(ptr);
}

inline int collation_callback(void* data, int lhs_len, const void* lhs, int rhs_len, const void* rhs) {
    auto* wrapper = static_cast<CollationWrapper*>(data);
    std::string a(static_cast<const char*>(lhs), static_cast<size_t>(lhs_len));
    std::string b(static_cast<const char*>(rhs), static_cast<size_t>(rhs_len));
    try {
        return (*wrapper->compare)(a, b);
    } catch (const std::exception& e) {
        write_log(wrapper->log, true, std::string("collation comparator failed: ") + e.what());
        return 0;
    }
}

inline void destroy_collation_wrapper(void* ptr) {
    delete static_cast<CollationWrapper*>(ptr);
}

} // namespace detail

inline int register_function(sqlite3* db, const Function& function) {
    auto* wrapper = new detail::FunctionWrapper{function.callable()};
    // SQLite calls the destructor itself when registration fails
    return sqlite3_create_function_v2(
        db,
        function.name().c_str(),
        function.argc(),
        function.text_flags(),
        wrapper,
        detail::scalar_callback,
        nullptr,
        nullptr,
        detail::destroy_function_wrapper
    );
}

inline int unregister_function(sqlite3* db, const Function& function) {
    return sqlite3_create_function_v2(
        db, function.name().c_str(), function.argc(), SQLITE_UTF8,
        nullptr, nullptr, nullptr, nullptr, nullptr);
}

inline int register_collation(sqlite3* db, const Collation& collation, log_func_t log = nullptr) {
    auto* wrapper = new detail::CollationWrapper{collation.callable(), std::move(log)};
    int rc = sqlite3_create_collation_v2(
        db,
        collation.name().c_str(),
        SQLITE_UTF8,
        wrapper,
        detail::collation_callback,
        detail::destroy_collation_wrapper
    );
    if (rc != SQLITE_OK) {
        // Unlike functions, the destructor is not invoked on failure
        delete wrapper;
    }
    return rc;
}

inline int unregister_collation(sqlite3* db, const Collation& collation) {
    return sqlite3_create_collation_v2(
        db, collation.name().c_str(), SQLITE_UTF8, nullptr, nullptr, nullptr);
}

} // namespace dbpool
