/**
 * dbpool/log.hpp - Diagnostic logging hook
 *
 * Part of dbpool - concurrent access to a single SQLite database.
 *
 * Logging goes through a plain callback so that host applications can route
 * messages to their own sink. Without a callback, messages are written to
 * stderr when verbose output is enabled.
 */

#pragma once

#include <functional>
#include <iostream>
#include <string>

namespace dbpool {

using log_func_t = std::function<void(const std::string& msg)>;

inline void write_log(const log_func_t& func, bool verbose, const std::string& msg) {
    if (func) {
        func(msg);
    } else if (verbose) {
        std::cerr << "[dbpool] " << msg << std::endl;
    }
}

} // namespace dbpool
