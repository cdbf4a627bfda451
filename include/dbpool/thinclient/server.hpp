#pragma once

/**
 * @file server.hpp
 * @brief HTTP front end for a DatabasePool
 *
 * Serves SQL over HTTP using cpp-httplib. Reads go through the reader pool,
 * writes through the single writer, so concurrent HTTP requests get the
 * same isolation guarantees as in-process callers.
 *
 *   POST /query           SQL body, run with DatabasePool::read
 *   POST /exec            SQL body, run with write_in_transaction
 *   POST /checkpoint      ?mode=passive|full|restart|truncate
 *   POST /release-memory
 *   GET  /status
 *   POST /shutdown
 */

#include <dbpool/config.hpp>
#include <dbpool/database_pool.hpp>
#include <dbpool/thinclient/json_helpers.hpp>

#include <httplib.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace dbpool::thinclient {

// ============================================================================
// Server Configuration
// ============================================================================

struct server_config {
    int port = 5555;
    std::string bind_address = "127.0.0.1";
    std::string auth_token;
    std::string tool_name = "dbpool";

    // Optional: called on shutdown request
    std::function<void()> on_shutdown;

    log_func_t log;
    bool verbose = true;
};

// ============================================================================
// HTTP Server
// ============================================================================

class server {
public:
    server(DatabasePool& pool, const server_config& config)
        : pool_(pool), config_(config), running_(false) {}

    ~server() {
        stop();
    }

    // Non-copyable
    server(const server&) = delete;
    server& operator=(const server&) = delete;

    /**
     * Start server (blocking).
     * @return false if the address could not be bound
     */
    bool run() {
        setup_routes();
        running_ = true;
        log("Listening on " + config_.bind_address + ":" + std::to_string(config_.port));
        bool ok = svr_.listen(config_.bind_address.c_str(), config_.port);
        running_ = false;
        if (!ok) {
            log("Failed to listen on " + config_.bind_address + ":" + std::to_string(config_.port));
        }
        return ok;
    }

    /**
     * Start server in background thread.
     * @return true once the server accepts connections
     */
    bool run_async() {
        server_thread_ = std::thread([this] { run(); });
        for (int i = 0; i < 200 && !svr_.is_running(); i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return svr_.is_running();
    }

    /**
     * Stop server gracefully.
     */
    void stop() {
        if (svr_.is_running()) {
            svr_.stop();
        }
        if (server_thread_.joinable()) {
            server_thread_.join();
        }
        // Handlers have finished once listen() returned
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
        if (shutdown_thread_.joinable()) {
            shutdown_thread_.join();
        }
        running_ = false;
    }

    bool is_running() const { return running_; }
    int port() const { return config_.port; }

private:
    DatabasePool& pool_;
    server_config config_;
    httplib::Server svr_;
    std::thread server_thread_;
    std::mutex shutdown_mutex_;
    std::thread shutdown_thread_;  // Delayed stop requested by POST /shutdown
    std::atomic<bool> running_;

    void log(const std::string& msg) const {
        write_log(config_.log, config_.verbose, msg);
    }

    void setup_routes() {
        svr_.Post("/query", [this](const httplib::Request& req, httplib::Response& res) {
            handle_query(req, res);
        });

        svr_.Post("/exec", [this](const httplib::Request& req, httplib::Response& res) {
            handle_exec(req, res);
        });

        svr_.Post("/checkpoint", [this](const httplib::Request& req, httplib::Response& res) {
            handle_checkpoint(req, res);
        });

        svr_.Post("/release-memory", [this](const httplib::Request& req, httplib::Response& res) {
            handle_release_memory(req, res);
        });

        svr_.Get("/status", [this](const httplib::Request& req, httplib::Response& res) {
            handle_status(req, res);
        });

        svr_.Post("/shutdown", [this](const httplib::Request& req, httplib::Response& res) {
            handle_shutdown(req, res);
        });

        svr_.Get("/", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(config_.tool_name + " server running. POST /query with SQL.\n", "text/plain");
        });
    }

    bool authorize(const httplib::Request& req, httplib::Response& res) const {
        if (config_.auth_token.empty()) return true;

        std::string token;
        if (req.has_header("X-DBPOOL-Token")) {
            token = req.get_header_value("X-DBPOOL-Token");
        } else if (req.has_header("Authorization")) {
            const std::string auth = req.get_header_value("Authorization");
            const std::string prefix = "Bearer ";
            if (auth.rfind(prefix, 0) == 0) {
                token = auth.substr(prefix.size());
            }
        }

        if (token == config_.auth_token) return true;

        res.status = 401;
        res.set_content(make_error_json("Unauthorized"), "application/json");
        return false;
    }

    static void fail(httplib::Response& res, int status, const std::string& error) {
        res.status = status;
        res.set_content(make_error_json(error), "application/json");
    }

    void handle_query(const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) return;

        const std::string& sql = req.body;
        if (sql.empty()) {
            fail(res, 400, "Empty query");
            return;
        }

        try {
            Result result = pool_.read([&](Database& db) {
                return db.query(sql);
            });
            if (!result.ok()) {
                fail(res, 400, result.error);
                return;
            }
            res.set_content(result_to_json(result), "application/json");
        } catch (const std::exception& e) {
            fail(res, 400, e.what());
        }
    }

    void handle_exec(const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) return;

        const std::string& sql = req.body;
        if (sql.empty()) {
            fail(res, 400, "Empty statement");
            return;
        }

        try {
            int changes = 0;
            pool_.write_in_transaction([&](Database& db) {
                db.execute(sql);
                changes = db.changes();
                return TransactionCompletion::Commit;
            });
            json j;
            j["success"] = true;
            j["changes"] = changes;
            res.set_content(j.dump(), "application/json");
        } catch (const std::exception& e) {
            fail(res, 400, e.what());
        }
    }

    void handle_checkpoint(const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) return;

        try {
            CheckpointMode mode = CheckpointMode::Passive;
            if (req.has_param("mode")) {
                mode = parse_checkpoint_mode(req.get_param_value("mode"));
            }
            CheckpointResult result = pool_.checkpoint(mode);
            json j;
            j["success"] = true;
            j["mode"] = checkpoint_mode_name(mode);
            j["log_frames"] = result.log_frames;
            j["checkpointed_frames"] = result.checkpointed_frames;
            res.set_content(j.dump(), "application/json");
        } catch (const std::exception& e) {
            fail(res, 400, e.what());
        }
    }

    void handle_release_memory(const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) return;

        try {
            pool_.release_memory();
            res.set_content(make_success_json("memory released"), "application/json");
        } catch (const std::exception& e) {
            fail(res, 500, e.what());
        }
    }

    void handle_status(const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) return;

        json extra;
        extra["path"] = pool_.path();
        extra["readers"] = pool_.reader_count();
        extra["maximum_reader_count"] = pool_.maximum_reader_count();
        extra["configuration"] = pool_.configuration();
        res.set_content(make_status_json(config_.tool_name, extra), "application/json");
    }

    void handle_shutdown(const httplib::Request& req, httplib::Response& res) {
        if (!authorize(req, res)) return;
        res.set_content(make_success_json("Shutting down"), "application/json");
        if (config_.on_shutdown) {
            config_.on_shutdown();
        }
        // Stop after the response is sent; joined by stop()
        std::lock_guard<std::mutex> lock(shutdown_mutex_);
        if (!shutdown_thread_.joinable()) {
            shutdown_thread_ = std::thread([this] {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
                svr_.stop();
            });
        }
    }
};

}  // namespace dbpool::thinclient
