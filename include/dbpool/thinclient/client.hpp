#pragma once

/**
 * @file client.hpp
 * @brief HTTP client for a running dbpool server
 *
 * Uses cpp-httplib. Every call throws std::runtime_error when the server
 * cannot be reached or answers with an error.
 */

#include <dbpool/database.hpp>
#include <dbpool/json.hpp>
#include <dbpool/thinclient/json_helpers.hpp>
#include <dbpool/types.hpp>

#include <httplib.h>
#include <stdexcept>
#include <string>

namespace dbpool::thinclient {

// ============================================================================
// Client Configuration
// ============================================================================

struct client_config {
    std::string host = "127.0.0.1";
    int port = 5555;
    int timeout_sec = 30;
    std::string auth_token;
};

// ============================================================================
// HTTP Client
// ============================================================================

class client {
public:
    explicit client(const client_config& config = {})
        : config_(config)
        , cli_(config.host, config.port)
    {
        cli_.set_connection_timeout(config.timeout_sec);
        cli_.set_read_timeout(config.timeout_sec);
        cli_.set_write_timeout(config.timeout_sec);
        if (!config.auth_token.empty()) {
            cli_.set_bearer_token_auth(config.auth_token);
        }
    }

    /**
     * Run a read-only query on the server's reader pool.
     * @throws std::runtime_error on connection or query error
     */
    Result query(const std::string& sql) {
        auto res = cli_.Post("/query", sql, "text/plain");
        check_response(res, "query");
        return result_from_json(res->body);
    }

    /**
     * Run statements on the server's writer inside a transaction.
     * @return Number of rows changed by the last statement
     */
    int exec(const std::string& sql) {
        auto res = cli_.Post("/exec", sql, "text/plain");
        check_response(res, "exec");
        return json::parse(res->body).value("changes", 0);
    }

    json checkpoint(CheckpointMode mode = CheckpointMode::Passive) {
        std::string path = std::string("/checkpoint?mode=") + checkpoint_mode_name(mode);
        auto res = cli_.Post(path.c_str(), "", "text/plain");
        check_response(res, "checkpoint");
        return json::parse(res->body);
    }

    void release_memory() {
        auto res = cli_.Post("/release-memory", "", "text/plain");
        check_response(res, "release-memory");
    }

    /**
     * Get server status.
     */
    json status() {
        auto res = cli_.Get("/status");
        check_response(res, "status");
        return json::parse(res->body);
    }

    /**
     * Request server shutdown.
     */
    void shutdown() {
        // The server may close the connection before responding
        auto res = cli_.Post("/shutdown", "", "text/plain");
        (void)res;
    }

    /**
     * Check if server is reachable.
     */
    bool ping() {
        auto res = cli_.Get("/status");
        return res && res->status == 200;
    }

private:
    client_config config_;
    httplib::Client cli_;

    void check_response(const httplib::Result& res, const char* operation) {
        if (!res) {
            std::string msg = "Connection failed (" + std::string(operation) + "): ";
            msg += "Could not connect to " + config_.host + ":" + std::to_string(config_.port);
            throw std::runtime_error(msg);
        }
        if (res->status != 200) {
            std::string error = res->body;
            auto j = json::parse(res->body, nullptr, false);
            if (!j.is_discarded() && j.is_object()) {
                error = j.value("error", error);
            }
            throw std::runtime_error(std::string(operation) + " error: " + error);
        }
    }
};

}  // namespace dbpool::thinclient
