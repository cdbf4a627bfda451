/**
 * dbpool/serialized_database.hpp - One connection, one worker thread
 *
 * Part of dbpool - concurrent access to a single SQLite database.
 *
 * SerializedDatabase owns a Database and a dedicated worker thread. Work is
 * submitted through a FIFO queue and runs on the worker, one block at a time,
 * in submission order. Callers block until their block has run and receive
 * its value or its exception.
 *
 *   dbpool::SerializedDatabase writer("/tmp/app.sqlite", config);
 *   int64_t n = writer.run_sync([](dbpool::Database& db) {
 *       return db.scalar_int64("SELECT COUNT(*) FROM items");
 *   });
 *
 * Submitting from a block already running on the same worker would deadlock;
 * it throws DatabaseError(SQLITE_MISUSE) instead.
 */

#pragma once

#include "database.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace dbpool {

class SerializedDatabase {
public:
    /**
     * Open the connection on the calling thread, then start the worker.
     * @throws DatabaseError if the connection cannot be opened
     */
    SerializedDatabase(const std::string& path, const Configuration& config)
        : db_(path, config)
        , worker_([this] { run(); }) {}

    ~SerializedDatabase() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        cv_.notify_one();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    // Non-copyable, non-movable: the worker captures this
    SerializedDatabase(const SerializedDatabase&) = delete;
    SerializedDatabase& operator=(const SerializedDatabase&) = delete;

    /**
     * Run block(Database&) on the worker and wait for it.
     * @return The block's value
     * @throws Whatever the block throws; DatabaseError(SQLITE_MISUSE) when
     *         called from this connection's own worker
     */
    template<typename Fn>
    auto run_sync(Fn&& block) -> decltype(block(std::declval<Database&>())) {
        using R = decltype(block(std::declval<Database&>()));

        if (is_current_thread()) {
            throw DatabaseError(SQLITE_MISUSE,
                                "reentrant database access is not allowed: " + db_.path());
        }

        std::packaged_task<R()> task([&]() -> R { return block(db_); });
        std::future<R> done = task.get_future();
        submit([&task] { task(); });
        return done.get();
    }

    /**
     * Run block(Database&) inside an explicit transaction on the worker.
     * The block returns TransactionCompletion; see Database::in_transaction.
     */
    template<typename Fn>
    void in_transaction(TransactionKind kind, Fn&& block) {
        run_sync([&](Database& db) {
            db.in_transaction(kind, block);
        });
    }

    // Queues behind any in-flight block
    void release_memory() {
        run_sync([](Database& db) {
            db.release_memory();
        });
    }

    bool is_current_thread() const { return current_context() == this; }

    const std::string& path() const { return db_.path(); }
    const Configuration& configuration() const { return db_.configuration(); }

private:
    Database db_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool stopping_ = false;
    std::thread worker_;  // Last: starts once everything above exists

    static const SerializedDatabase*& current_context() {
        thread_local const SerializedDatabase* current = nullptr;
        return current;
    }

    void submit(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw DatabaseError(SQLITE_MISUSE, "database is closing: " + db_.path());
            }
            queue_.push_back(std::move(job));
        }
        cv_.notify_one();
    }

    void run() {
        current_context() = this;
        for (;;) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (queue_.empty()) {
                    break;
                }
                job = std::move(queue_.front());
                queue_.pop_front();
            }
            // packaged_task stores exceptions in its future
            job();
        }
        current_context() = nullptr;
    }
};

} // namespace dbpool
