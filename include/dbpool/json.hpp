#pragma once
/// @file json.hpp
/// @brief JSON library alias for dbpool
///
/// Configuration files and thin client responses use nlohmann/json through
/// this alias.

#include <nlohmann/json.hpp>

namespace dbpool {

/// JSON type alias
using json = nlohmann::json;

/// Ordered JSON (preserves insertion order)
using ordered_json = nlohmann::ordered_json;

} // namespace dbpool
