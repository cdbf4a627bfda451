/**
 * dbpool/dbpool.hpp - Master include for dbpool
 *
 * dbpool - concurrent access to a single SQLite database
 *
 * Include this single header to get:
 *   - Database - RAII connection with query and transaction helpers
 *   - SerializedDatabase - connection confined to its own worker thread
 *   - Pool - bounded pool of lazily created elements
 *   - DatabasePool - one writer and a pool of readers in WAL mode
 *   - Function, Collation - definitions broadcast to every connection
 *   - PoolOptions and JSON configuration loading
 *
 * Example:
 *
 *   #include <dbpool/dbpool.hpp>
 *
 *   dbpool::DatabasePool pool("app.sqlite");
 *   pool.add_function(dbpool::Function("twice", 1,
 *       [](sqlite3_context* ctx, int, sqlite3_value** argv) {
 *           dbpool::result_int64(ctx, 2 * dbpool::arg_int64(argv[0]));
 *       }));
 *
 *   auto value = pool.read([](dbpool::Database& db) {
 *       return db.scalar("SELECT twice(21)");
 *   });
 */

#pragma once

#include "types.hpp"
#include "error.hpp"
#include "functions.hpp"
#include "database.hpp"
#include "serialized_database.hpp"
#include "pool.hpp"
#include "registry.hpp"
#include "database_pool.hpp"
#include "config.hpp"
