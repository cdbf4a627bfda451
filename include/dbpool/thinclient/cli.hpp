#pragma once

/**
 * @file cli.hpp
 * @brief Command line parsing for the dbpool tool
 *
 * Three modes:
 *   direct  -s db -c sql          open the pool, run, exit
 *   serve   -s db --serve         open the pool, serve HTTP
 *   client  --port N -c sql       send SQL to a running server
 */

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace dbpool::thinclient {

// ============================================================================
// CLI Modes
// ============================================================================

enum class cli_mode {
    direct,
    serve,
    client
};

// ============================================================================
// CLI Arguments
// ============================================================================

struct cli_args {
    cli_mode mode = cli_mode::direct;

    // Database path (direct/serve modes)
    std::string database;

    // Query options
    std::string query;           // -c "..."
    std::string query_file;      // -f file.sql
    bool write = false;          // run on the writer instead of a reader

    // Pool options
    std::string config_file;     // --config options.json
    int readers = 0;             // --readers N, 0 keeps the configured count

    // Server options
    int port = 5555;
    std::string bind_address = "127.0.0.1";
    std::string auth_token;
    bool serve = false;

    // Output options
    std::string output_format = "csv";  // csv, json

    // Misc
    bool help = false;
    bool version = false;

    // Get the SQL to execute (from -c or -f)
    std::string get_sql() const {
        if (!query.empty()) {
            return query;
        }
        if (!query_file.empty()) {
            return read_file(query_file);
        }
        return {};
    }

private:
    static std::string read_file(const std::string& path) {
        std::ifstream file(path);
        if (!file) {
            throw std::runtime_error("Cannot open file: " + path);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
};

// ============================================================================
// Argument Parser
// ============================================================================

class arg_parser {
public:
    arg_parser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}

    std::optional<cli_args> parse(int argc, char** argv) {
        cli_args args;
        bool port_given = false;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.help = true;
            }
            else if (arg == "--version") {
                args.version = true;
            }
            else if (arg == "-s" || arg == "--source") {
                if (!next_value(argc, argv, i, arg, args.database)) return std::nullopt;
            }
            else if (arg == "-c" || arg == "--command") {
                if (!next_value(argc, argv, i, arg, args.query)) return std::nullopt;
            }
            else if (arg == "-f" || arg == "--file") {
                if (!next_value(argc, argv, i, arg, args.query_file)) return std::nullopt;
            }
            else if (arg == "-o" || arg == "--output") {
                if (!next_value(argc, argv, i, arg, args.output_format)) return std::nullopt;
            }
            else if (arg == "--config") {
                if (!next_value(argc, argv, i, arg, args.config_file)) return std::nullopt;
            }
            else if (arg == "--token") {
                if (!next_value(argc, argv, i, arg, args.auth_token)) return std::nullopt;
            }
            else if (arg == "--bind") {
                if (!next_value(argc, argv, i, arg, args.bind_address)) return std::nullopt;
            }
            else if (arg == "--write" || arg == "-w") {
                args.write = true;
            }
            else if (arg == "--serve") {
                args.serve = true;
            }
            else if (arg == "--port") {
                if (!next_int(argc, argv, i, arg, args.port)) return std::nullopt;
                port_given = true;
            }
            else if (arg == "--readers") {
                if (!next_int(argc, argv, i, arg, args.readers)) return std::nullopt;
            }
            else if (arg[0] == '-') {
                error("Unknown option: " + arg);
                return std::nullopt;
            }
            else {
                // Positional argument - treat as database if not set
                if (args.database.empty()) {
                    args.database = arg;
                } else {
                    error("Unexpected argument: " + arg);
                    return std::nullopt;
                }
            }
        }

        if (args.help) {
            print_help();
            return std::nullopt;
        }

        if (args.version) {
            std::cout << program_name_ << " version 1.0.0\n";
            return std::nullopt;
        }

        args.mode = detect_mode(args, port_given);

        if (!validate(args)) {
            return std::nullopt;
        }

        return args;
    }

private:
    std::string program_name_;
    std::string description_;

    bool next_value(int argc, char** argv, int& i, const std::string& arg, std::string& out) {
        if (++i >= argc) {
            error("Missing argument for " + arg);
            return false;
        }
        out = argv[i];
        return true;
    }

    bool next_int(int argc, char** argv, int& i, const std::string& arg, int& out) {
        std::string value;
        if (!next_value(argc, argv, i, arg, value)) return false;
        try {
            size_t used = 0;
            out = std::stoi(value, &used);
            if (used != value.size()) {
                throw std::invalid_argument(value);
            }
        } catch (const std::logic_error&) {
            error("Invalid number for " + arg + ": " + value);
            return false;
        }
        return true;
    }

    cli_mode detect_mode(const cli_args& args, bool port_given) {
        if (args.serve) {
            return cli_mode::serve;
        }
        if (args.database.empty() && (port_given || !args.query.empty() || !args.query_file.empty())) {
            // No database: talk to a server, default port unless given
            return cli_mode::client;
        }
        return cli_mode::direct;
    }

    bool validate(const cli_args& args) {
        if (args.output_format != "csv" && args.output_format != "json") {
            error("Unknown output format: " + args.output_format);
            return false;
        }
        if (args.readers != 0 && args.readers < 2) {
            error("--readers must be at least 2");
            return false;
        }

        switch (args.mode) {
        case cli_mode::direct:
            if (args.database.empty()) {
                error("No database specified. Use -s <database>");
                print_usage();
                return false;
            }
            if (args.query.empty() && args.query_file.empty()) {
                error("No query specified. Use -c <query> or -f <file>");
                print_usage();
                return false;
            }
            break;

        case cli_mode::serve:
            if (args.database.empty()) {
                error("No database specified for serve mode. Use -s <database>");
                print_usage();
                return false;
            }
            break;

        case cli_mode::client:
            if (args.query.empty() && args.query_file.empty()) {
                error("No query specified for client mode. Use -c <query> or -f <file>");
                print_usage();
                return false;
            }
            break;
        }
        return true;
    }

    void error(const std::string& msg) {
        std::cerr << program_name_ << ": error: " << msg << "\n";
    }

    void print_usage() {
        std::cerr << "Usage: " << program_name_ << " [options]\n";
        std::cerr << "Try '" << program_name_ << " --help' for more information.\n";
    }

    void print_help() {
        std::cout << description_ << "\n\n";
        std::cout << "Usage:\n";
        std::cout << "  " << program_name_ << " -s <database> -c <query>     Direct mode: query and exit\n";
        std::cout << "  " << program_name_ << " -s <database> -f <file>      Direct mode: run SQL file\n";
        std::cout << "  " << program_name_ << " -s <database> --serve        Server mode: listen for queries\n";
        std::cout << "  " << program_name_ << " --port <N> -c <query>        Client mode: query running server\n";
        std::cout << "\n";
        std::cout << "Options:\n";
        std::cout << "  -s, --source <path>    Database file path\n";
        std::cout << "  -c, --command <sql>    SQL to execute\n";
        std::cout << "  -f, --file <path>      SQL file to execute\n";
        std::cout << "  -w, --write            Run on the writer in a transaction\n";
        std::cout << "  -o, --output <format>  Output format: csv, json (default: csv)\n";
        std::cout << "  --config <path>        JSON pool options\n";
        std::cout << "  --readers <N>          Maximum reader count (at least 2)\n";
        std::cout << "\n";
        std::cout << "Server options:\n";
        std::cout << "  --serve                Start HTTP server mode\n";
        std::cout << "  --port <N>             Port number (default: 5555)\n";
        std::cout << "  --bind <addr>          Bind address (default: 127.0.0.1)\n";
        std::cout << "  --token <secret>       Require a bearer token\n";
        std::cout << "\n";
        std::cout << "Other:\n";
        std::cout << "  -h, --help             Show this help\n";
        std::cout << "  --version              Show version\n";
        std::cout << "\n";
        std::cout << "Examples:\n";
        std::cout << "  " << program_name_ << " -s app.db -w -c \"CREATE TABLE items (name TEXT)\"\n";
        std::cout << "  " << program_name_ << " -s app.db --serve --port 8080 --readers 8\n";
        std::cout << "  " << program_name_ << " --port 8080 -c \"SELECT COUNT(*) FROM items\"\n";
        std::cout << "  curl localhost:8080/query -d \"SELECT * FROM items\"\n";
    }
};

// ============================================================================
// Convenience function
// ============================================================================

/**
 * Parse command line arguments.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param program_name Name of the program (for help/errors)
 * @param description Brief description (for help)
 * @return Parsed arguments, or nullopt if --help or error
 */
inline std::optional<cli_args> parse_args(
    int argc, char** argv,
    const std::string& program_name,
    const std::string& description)
{
    arg_parser parser(program_name, description);
    return parser.parse(argc, argv);
}

}  // namespace dbpool::thinclient
