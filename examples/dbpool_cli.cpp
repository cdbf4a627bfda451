/**
 * dbpool_cli.cpp - Command line front end for dbpool
 *
 * Direct mode opens a DatabasePool on the file and runs the SQL once.
 * Serve mode keeps the pool open and answers HTTP requests.
 * Client mode sends the SQL to a running server.
 *
 * Usage:
 *   ./dbpool_cli -s app.db -w -c "CREATE TABLE items (name TEXT)"
 *   ./dbpool_cli -s app.db -c "SELECT * FROM items"
 *   ./dbpool_cli -s app.db --serve --port 8080
 *   ./dbpool_cli --port 8080 -c "SELECT COUNT(*) FROM items"
 */

#include <dbpool/dbpool.hpp>
#include <dbpool/thinclient/thinclient.hpp>

#include <iostream>
#include <string>

namespace {

using namespace dbpool;
using namespace dbpool::thinclient;

void print_csv(const Result& result) {
    for (size_t i = 0; i < result.columns.size(); ++i) {
        if (i > 0) std::cout << ",";
        std::cout << result.columns[i];
    }
    std::cout << "\n";
    for (const auto& row : result) {
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) std::cout << ",";
            std::cout << row[i];
        }
        std::cout << "\n";
    }
}

void print_result(const Result& result, const std::string& format) {
    if (format == "json") {
        std::cout << result_to_json(result) << "\n";
    } else {
        print_csv(result);
    }
}

PoolOptions make_options(const cli_args& args) {
    PoolOptions options;
    if (!args.config_file.empty()) {
        options = load_pool_options(args.config_file);
    }
    if (args.readers > 0) {
        options.maximum_reader_count = args.readers;
    }
    return options;
}

int run_direct(const cli_args& args) {
    PoolOptions options = make_options(args);
    DatabasePool pool(args.database, options.configuration, options.maximum_reader_count);
    std::string sql = args.get_sql();

    if (args.write) {
        int changes = 0;
        pool.write_in_transaction([&](Database& db) {
            db.execute(sql);
            changes = db.changes();
            return TransactionCompletion::Commit;
        });
        std::cout << "changes: " << changes << "\n";
        return 0;
    }

    Result result = pool.read([&](Database& db) {
        return db.query(sql);
    });
    if (!result.ok()) {
        std::cerr << "Query error: " << result.error << "\n";
        return 1;
    }
    print_result(result, args.output_format);
    return 0;
}

int run_serve(const cli_args& args) {
    PoolOptions options = make_options(args);
    DatabasePool pool(args.database, options.configuration, options.maximum_reader_count);

    server_config config;
    config.port = args.port;
    config.bind_address = args.bind_address;
    config.auth_token = args.auth_token;
    config.tool_name = "dbpool_cli";

    // Runs until POST /shutdown
    thinclient::server srv(pool, config);
    return srv.run() ? 0 : 1;
}

int run_client(const cli_args& args) {
    client_config config;
    config.port = args.port;
    config.auth_token = args.auth_token;
    client cli(config);

    std::string sql = args.get_sql();
    if (args.write) {
        std::cout << "changes: " << cli.exec(sql) << "\n";
        return 0;
    }
    print_result(cli.query(sql), args.output_format);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    auto args = parse_args(argc, argv, "dbpool_cli",
                           "dbpool_cli - concurrent SQLite access through one writer and a reader pool");
    if (!args) {
        return 1;
    }

    try {
        switch (args->mode) {
            case cli_mode::direct: return run_direct(*args);
            case cli_mode::serve:  return run_serve(*args);
            case cli_mode::client: return run_client(*args);
        }
    } catch (const std::exception& e) {
        std::cerr << "dbpool_cli: " << e.what() << "\n";
        return 1;
    }
    return 1;
}
