/**
 * dbpool/config.hpp - JSON configuration loading
 *
 * Part of dbpool - concurrent access to a single SQLite database.
 *
 * Example file:
 *
 *   {
 *     "maximum_reader_count": 8,
 *     "configuration": {
 *       "busy_timeout_ms": 2000,
 *       "default_transaction_kind": "immediate",
 *       "verbose": true
 *     }
 *   }
 *
 * Missing keys keep their defaults. Callbacks (trace, log) are never
 * serialized.
 */

#pragma once

#include "json.hpp"
#include "types.hpp"

#include <fstream>
#include <stdexcept>
#include <string>

namespace dbpool {

struct PoolOptions {
    Configuration configuration;
    int maximum_reader_count = 5;
};

inline TransactionKind parse_transaction_kind(const std::string& name) {
    if (name == "deferred") return TransactionKind::Deferred;
    if (name == "immediate") return TransactionKind::Immediate;
    if (name == "exclusive") return TransactionKind::Exclusive;
    throw std::invalid_argument("Unknown transaction kind: " + name);
}

inline CheckpointMode parse_checkpoint_mode(const std::string& name) {
    if (name == "passive") return CheckpointMode::Passive;
    if (name == "full") return CheckpointMode::Full;
    if (name == "restart") return CheckpointMode::Restart;
    if (name == "truncate") return CheckpointMode::Truncate;
    throw std::invalid_argument("Unknown checkpoint mode: " + name);
}

// nlohmann ADL hooks

inline void to_json(json& j, TransactionKind kind) {
    j = transaction_kind_name(kind);
}

inline void from_json(const json& j, TransactionKind& kind) {
    kind = parse_transaction_kind(j.get<std::string>());
}

inline void to_json(json& j, const Configuration& config) {
    j = json{
        {"readonly", config.readonly},
        {"foreign_keys_enabled", config.foreign_keys_enabled},
        {"busy_timeout_ms", config.busy_timeout_ms},
        {"default_transaction_kind", config.default_transaction_kind},
        {"verbose", config.verbose},
    };
}

inline void from_json(const json& j, Configuration& config) {
    if (!j.is_object()) {
        throw std::invalid_argument("configuration must be a JSON object");
    }
    config.readonly = j.value("readonly", config.readonly);
    config.foreign_keys_enabled = j.value("foreign_keys_enabled", config.foreign_keys_enabled);
    config.busy_timeout_ms = j.value("busy_timeout_ms", config.busy_timeout_ms);
    if (j.contains("default_transaction_kind")) {
        config.default_transaction_kind = j.at("default_transaction_kind").get<TransactionKind>();
    }
    config.verbose = j.value("verbose", config.verbose);
}

inline void to_json(json& j, const PoolOptions& options) {
    j = json{
        {"maximum_reader_count", options.maximum_reader_count},
        {"configuration", options.configuration},
    };
}

inline void from_json(const json& j, PoolOptions& options) {
    if (!j.is_object()) {
        throw std::invalid_argument("pool options must be a JSON object");
    }
    options.maximum_reader_count = j.value("maximum_reader_count", options.maximum_reader_count);
    if (j.contains("configuration")) {
        j.at("configuration").get_to(options.configuration);
    }
}

/**
 * Parse pool options from a JSON document.
 * @throws json::parse_error on malformed JSON, std::invalid_argument on bad values
 */
inline PoolOptions parse_pool_options(const std::string& text) {
    PoolOptions options;
    json::parse(text).get_to(options);
    return options;
}

inline PoolOptions load_pool_options(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    PoolOptions options;
    json::parse(file).get_to(options);
    return options;
}

} // namespace dbpool
