/**
 * dbpool/types.hpp - Core types shared by connections and pools
 *
 * Part of dbpool - concurrent access to a single SQLite database.
 */

#pragma once

#include "log.hpp"

#include <sqlite3.h>
#include <cstdint>
#include <functional>
#include <string>

namespace dbpool {

// ============================================================================
// Transaction Kinds
// ============================================================================

// See https://www.sqlite.org/lang_transaction.html
enum class TransactionKind {
    Deferred,
    Immediate,
    Exclusive
};

inline const char* transaction_kind_sql(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::Deferred:  return "BEGIN DEFERRED TRANSACTION";
        case TransactionKind::Immediate: return "BEGIN IMMEDIATE TRANSACTION";
        case TransactionKind::Exclusive: return "BEGIN EXCLUSIVE TRANSACTION";
    }
    return "BEGIN TRANSACTION";
}

inline const char* transaction_kind_name(TransactionKind kind) {
    switch (kind) {
        case TransactionKind::Deferred:  return "deferred";
        case TransactionKind::Immediate: return "immediate";
        case TransactionKind::Exclusive: return "exclusive";
    }
    return "deferred";
}

// Verdict returned by a transaction block.
enum class TransactionCompletion {
    Commit,
    Rollback
};

// ============================================================================
// Checkpoint Modes
// ============================================================================

// Values are the sqlite3_wal_checkpoint_v2() modes and must not change.
enum class CheckpointMode : int {
    Passive = SQLITE_CHECKPOINT_PASSIVE,
    Full = SQLITE_CHECKPOINT_FULL,
    Restart = SQLITE_CHECKPOINT_RESTART,
    Truncate = SQLITE_CHECKPOINT_TRUNCATE
};

static_assert(static_cast<int>(CheckpointMode::Passive) == 0, "checkpoint ordinal");
static_assert(static_cast<int>(CheckpointMode::Full) == 1, "checkpoint ordinal");
static_assert(static_cast<int>(CheckpointMode::Restart) == 2, "checkpoint ordinal");
static_assert(static_cast<int>(CheckpointMode::Truncate) == 3, "checkpoint ordinal");

inline const char* checkpoint_mode_name(CheckpointMode mode) {
    switch (mode) {
        case CheckpointMode::Passive:  return "passive";
        case CheckpointMode::Full:     return "full";
        case CheckpointMode::Restart:  return "restart";
        case CheckpointMode::Truncate: return "truncate";
    }
    return "passive";
}

struct CheckpointResult {
    int log_frames = 0;           // Frames in the WAL
    int checkpointed_frames = 0;  // Frames copied back into the database
};

// ============================================================================
// Configuration
// ============================================================================

using trace_func_t = std::function<void(const std::string& sql)>;

struct Configuration {
    bool readonly = false;
    bool foreign_keys_enabled = true;
    int busy_timeout_ms = 5000;
    TransactionKind default_transaction_kind = TransactionKind::Immediate;

    // Receives every executed statement (sqlite3_trace_v2)
    trace_func_t trace;

    // Diagnostics sink; stderr when unset and verbose is true
    log_func_t log;
    bool verbose = false;
};

inline void log_message(const Configuration& config, const std::string& msg) {
    write_log(config.log, config.verbose, msg);
}

} // namespace dbpool
