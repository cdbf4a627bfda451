/**
 * concurrent_access.cpp - Readers and a writer sharing one database file
 *
 * Demonstrates dbpool::DatabasePool: one writer thread inserts rows while
 * several reader threads count them, and an SQL function registered once is
 * usable from every connection.
 *
 * Usage:
 *   ./concurrent_access [path]
 */

#include <dbpool/dbpool.hpp>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <string>
#include <thread>
#include <utility>
#include <vector>

int main(int argc, char** argv) {
    std::string path = argc > 1 ? argv[1] : "concurrent_access.sqlite";

    try {
        dbpool::DatabasePool pool(path, dbpool::Configuration(), 4);

        pool.write([](dbpool::Database& db) {
            db.execute("DROP TABLE IF EXISTS events");
            db.execute("CREATE TABLE events (id INTEGER PRIMARY KEY, label TEXT)");
        });

        pool.add_function(dbpool::Function("shout", 1,
            [](sqlite3_context* ctx, int, sqlite3_value** argv) {
                std::string text = dbpool::arg_text(argv[0]);
                for (auto& c : text) c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
                dbpool::result_text(ctx, text + "!");
            }));

        std::atomic<bool> done{false};

        std::thread writer([&] {
            for (int i = 0; i < 50; ++i) {
                pool.write_in_transaction([i](dbpool::Database& db) {
                    db.execute("INSERT INTO events (label) VALUES ('event " + std::to_string(i) + "')");
                    return dbpool::TransactionCompletion::Commit;
                });
            }
            done = true;
        });

        std::vector<std::thread> readers;
        for (int r = 0; r < 4; ++r) {
            readers.emplace_back([&pool, &done, r] {
                int observations = 0;
                while (!done) {
                    // Both counts come from the same snapshot
                    auto counts = pool.read([](dbpool::Database& db) {
                        int64_t before = db.scalar_int64("SELECT COUNT(*) FROM events");
                        int64_t after = db.scalar_int64("SELECT COUNT(*) FROM events");
                        return std::make_pair(before, after);
                    });
                    if (counts.first != counts.second) {
                        fprintf(stderr, "reader %d saw a torn snapshot\n", r);
                    }
                    ++observations;
                }
                printf("reader %d: %d consistent reads\n", r, observations);
            });
        }

        writer.join();
        for (auto& t : readers) {
            t.join();
        }

        auto last = pool.read([](dbpool::Database& db) {
            return db.scalar("SELECT shout(label) FROM events ORDER BY id DESC LIMIT 1");
        });
        printf("last event: %s\n", last.c_str());

        auto checkpoint = pool.checkpoint(dbpool::CheckpointMode::Truncate);
        printf("checkpoint: %d/%d frames\n", checkpoint.checkpointed_frames, checkpoint.log_frames);

        pool.release_memory();
        printf("readers after release: %zu\n", pool.reader_count());
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    return 0;
}
