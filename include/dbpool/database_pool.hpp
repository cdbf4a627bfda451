/**
 * dbpool/database_pool.hpp - One writer, many readers, one SQLite file
 *
 * Part of dbpool - concurrent access to a single SQLite database.
 *
 * DatabasePool owns one writer connection and a bounded pool of read-only
 * connections on the same file, in WAL mode. Reads run on a pooled reader
 * inside a DEFERRED transaction; writes run on the single writer. SQL
 * functions and collations are installed on every connection, including
 * readers created later.
 *
 *   dbpool::DatabasePool pool("/tmp/app.sqlite");
 *
 *   pool.write([](dbpool::Database& db) {
 *       db.execute("CREATE TABLE IF NOT EXISTS items (name TEXT)");
 *   });
 *
 *   pool.write_in_transaction([](dbpool::Database& db) {
 *       db.execute("INSERT INTO items VALUES ('hammer')");
 *       return dbpool::TransactionCompletion::Commit;
 *   });
 *
 *   int64_t count = pool.read([](dbpool::Database& db) {
 *       return db.scalar_int64("SELECT COUNT(*) FROM items");
 *   });
 *
 * None of the access methods are reentrant: calling read() from inside a
 * read block, or any method that needs the connection a block is running
 * on, throws DatabaseError(SQLITE_MISUSE).
 */

#pragma once

#include "database.hpp"
#include "error.hpp"
#include "functions.hpp"
#include "pool.hpp"
#include "registry.hpp"
#include "serialized_database.hpp"
#include "types.hpp"

#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace dbpool {

class DatabasePool {
public:
    /**
     * Open the writer, switch the database to WAL mode and prepare the
     * reader pool. Readers are opened lazily.
     *
     * @param path Database file path
     * @param configuration Base configuration for every connection
     * @param maximum_reader_count Reader pool capacity, at least 2
     * @throws std::invalid_argument if maximum_reader_count < 2
     * @throws DatabaseError if the writer cannot be opened or WAL mode
     *         cannot be activated
     */
    explicit DatabasePool(const std::string& path,
                          const Configuration& configuration = Configuration(),
                          int maximum_reader_count = 5)
        : maximum_reader_count_(validated_reader_count(maximum_reader_count))
        , path_(path)
        , writer_config_(writer_configuration(configuration))
        , reader_config_(reader_configuration(configuration))
        , writer_(std::make_unique<SerializedDatabase>(path, writer_config_))
        , readers_(maximum_reader_count_, [this] { return make_reader(); }) {
        activate_wal();
    }

    // Non-copyable
    DatabasePool(const DatabasePool&) = delete;
    DatabasePool& operator=(const DatabasePool&) = delete;

    // ========================================================================
    // Database Access
    // ========================================================================

    /**
     * Run a read-only block on a pooled reader and return its value.
     *
     * The block runs inside a DEFERRED transaction, so every statement it
     * issues sees the same snapshot even if the writer commits meanwhile.
     * Blocks while maximum_reader_count readers are checked out.
     *
     * @throws Whatever the block throws, after rollback;
     *         DatabaseError(SQLITE_MISUSE) when called from a read block of
     *         this pool
     */
    template<typename Fn>
    auto read(Fn&& block) -> decltype(block(std::declval<Database&>())) {
        // The nested read would wait for a second reader while holding the
        // first one, which deadlocks once the pool is exhausted
        if (current_read_pool() == this) {
            throw DatabaseError(SQLITE_MISUSE, "reentrant read is not allowed: " + path_);
        }
        return readers_.get([&](SerializedDatabase& reader) {
            return reader.run_sync([&](Database& db) {
                ReadScope scope(this);
                return db.with_transaction(TransactionKind::Deferred, block);
            });
        });
    }

    /**
     * Run a block on the writer without an implicit transaction. Atomicity
     * of the statements it issues is the caller's business.
     */
    template<typename Fn>
    auto write(Fn&& block) -> decltype(block(std::declval<Database&>())) {
        return writer_->run_sync(std::forward<Fn>(block));
    }

    /**
     * Run a block on the writer inside a transaction of the configured
     * default kind. The block returns TransactionCompletion::Commit or
     * ::Rollback. If it throws, the transaction is rolled back and the
     * exception is rethrown.
     */
    template<typename Fn>
    void write_in_transaction(Fn&& block) {
        write_in_transaction(writer_config_.default_transaction_kind, std::forward<Fn>(block));
    }

    template<typename Fn>
    void write_in_transaction(TransactionKind kind, Fn&& block) {
        writer_->in_transaction(kind, std::forward<Fn>(block));
    }

    // ========================================================================
    // WAL Management
    // ========================================================================

    /**
     * Run a WAL checkpoint on the writer connection.
     * See https://www.sqlite.org/c3ref/wal_checkpoint_v2.html
     *
     * Readers holding old snapshots limit how much of the log can be
     * reclaimed.
     *
     * @throws DatabaseError with the checkpoint status code
     */
    CheckpointResult checkpoint(CheckpointMode mode = CheckpointMode::Passive) {
        return writer_->run_sync([mode](Database& db) {
            return db.checkpoint(mode);
        });
    }

    // ========================================================================
    // Memory Management
    // ========================================================================

    /**
     * Free as much memory as possible, then close idle readers.
     *
     * Waits for in-flight blocks on each connection before releasing its
     * memory. Closed readers are reopened on demand.
     */
    void release_memory() {
        writer_->release_memory();

        readers_.for_each([](SerializedDatabase& reader) {
            reader.release_memory();
        });

        size_t evicted = readers_.clear();
        log_message(writer_config_, "released memory, closed " + std::to_string(evicted) + " reader(s)");
    }

    // ========================================================================
    // Functions
    // ========================================================================

    // Add or redefine an SQL function on every connection
    void add_function(const Function& function) {
        std::lock_guard<std::mutex> lock(broadcast_mutex_);
        functions_.insert(function);

        writer_->run_sync([&](Database& db) {
            db.add_function(function);
        });

        readers_.for_each([&](SerializedDatabase& reader) {
            reader.run_sync([&](Database& db) {
                db.add_function(function);
            });
        });
    }

    void remove_function(const Function& function) {
        std::lock_guard<std::mutex> lock(broadcast_mutex_);
        functions_.erase(function);

        writer_->run_sync([&](Database& db) {
            db.remove_function(function);
        });

        readers_.for_each([&](SerializedDatabase& reader) {
            reader.run_sync([&](Database& db) {
                db.remove_function(function);
            });
        });
    }

    // ========================================================================
    // Collations
    // ========================================================================

    // Add or redefine a collation on every connection
    void add_collation(const Collation& collation) {
        std::lock_guard<std::mutex> lock(broadcast_mutex_);
        collations_.insert(collation);

        writer_->run_sync([&](Database& db) {
            db.add_collation(collation);
        });

        readers_.for_each([&](SerializedDatabase& reader) {
            reader.run_sync([&](Database& db) {
                db.add_collation(collation);
            });
        });
    }

    void remove_collation(const Collation& collation) {
        std::lock_guard<std::mutex> lock(broadcast_mutex_);
        collations_.erase(collation);

        writer_->run_sync([&](Database& db) {
            db.remove_collation(collation);
        });

        readers_.for_each([&](SerializedDatabase& reader) {
            reader.run_sync([&](Database& db) {
                db.remove_collation(collation);
            });
        });
    }

    // ========================================================================
    // Introspection
    // ========================================================================

    const std::string& path() const { return path_; }
    const Configuration& configuration() const { return writer_config_; }
    size_t maximum_reader_count() const { return maximum_reader_count_; }

    // Readers currently open, idle or checked out
    size_t reader_count() const { return readers_.size(); }

private:
    size_t maximum_reader_count_;
    std::string path_;
    Configuration writer_config_;
    Configuration reader_config_;
    Registry<Function> functions_;
    Registry<Collation> collations_;
    std::mutex broadcast_mutex_;  // Serializes add/remove broadcasts
    std::unique_ptr<SerializedDatabase> writer_;
    Pool<SerializedDatabase> readers_;  // After writer_: readers close first

    // Marks a reader worker while it runs a read block of this pool
    class ReadScope {
    public:
        explicit ReadScope(const DatabasePool* pool) : previous_(current_read_pool()) {
            current_read_pool() = pool;
        }
        ~ReadScope() { current_read_pool() = previous_; }

        ReadScope(const ReadScope&) = delete;
        ReadScope& operator=(const ReadScope&) = delete;

    private:
        const DatabasePool* previous_;
    };

    static const DatabasePool*& current_read_pool() {
        thread_local const DatabasePool* current = nullptr;
        return current;
    }

    static Configuration writer_configuration(Configuration config) {
        config.readonly = false;
        return config;
    }

    static Configuration reader_configuration(Configuration config) {
        config.readonly = true;
        config.default_transaction_kind = TransactionKind::Deferred;
        return config;
    }

    static size_t validated_reader_count(int count) {
        if (count < 2) {
            throw std::invalid_argument(
                "maximum_reader_count must be at least 2, got " + std::to_string(count));
        }
        return static_cast<size_t>(count);
    }

    void activate_wal() {
        std::string mode = writer_->run_sync([](Database& db) {
            return db.scalar("PRAGMA journal_mode=WAL");
        });
        if (detail::lowercase(mode) != "wal") {
            throw DatabaseError(SQLITE_ERROR, "could not activate WAL mode at path: " + path_);
        }
        log_message(writer_config_, "WAL mode active at path: " + path_);
    }

    // Reader factory: the registry is read now, not at pool construction
    std::unique_ptr<SerializedDatabase> make_reader() {
        auto reader = std::make_unique<SerializedDatabase>(path_, reader_config_);

        auto functions = functions_.snapshot();
        auto collations = collations_.snapshot();
        reader->run_sync([&](Database& db) {
            for (const auto& function : functions) {
                db.add_function(function);
            }
            for (const auto& collation : collations) {
                db.add_collation(collation);
            }
        });

        log_message(reader_config_, "opened reader on " + path_);
        return reader;
    }
};

} // namespace dbpool
