#pragma once

/**
 * @file json_helpers.hpp
 * @brief JSON response builders for the HTTP server
 *
 * Every response has a boolean "success" member:
 *   {"success":false,"error":"message"}
 *   {"success":true,"columns":[...],"rows":[[...]],"row_count":N}
 *
 * Cells are strings, or null for SQL NULL.
 */

#include <dbpool/database.hpp>
#include <dbpool/json.hpp>

#include <string>

namespace dbpool::thinclient {

/**
 * Create a JSON error response.
 * @return {"success":false,"error":"message"}
 */
inline std::string make_error_json(const std::string& error) {
    json j;
    j["success"] = false;
    j["error"] = error;
    return j.dump();
}

/**
 * Create a simple JSON success response.
 * @return {"success":true} or {"success":true,"message":"msg"}
 */
inline std::string make_success_json(const std::string& message = "") {
    json j;
    j["success"] = true;
    if (!message.empty()) {
        j["message"] = message;
    }
    return j.dump();
}

/**
 * Create a JSON status response.
 * @param tool Tool name
 * @param extra Additional members merged into the object
 */
inline std::string make_status_json(const std::string& tool, const json& extra = json::object()) {
    json j;
    j["success"] = true;
    j["status"] = "ok";
    j["tool"] = tool;
    for (const auto& item : extra.items()) {
        j[item.key()] = item.value();
    }
    return j.dump();
}

/**
 * Convert a query result to JSON. Failed results become error responses.
 */
inline std::string result_to_json(const Result& result) {
    if (!result.ok()) {
        return make_error_json(result.error);
    }

    json j;
    j["success"] = true;
    j["columns"] = result.columns;

    auto rows = json::array();
    for (const auto& row : result.rows) {
        auto cells = json::array();
        for (size_t i = 0; i < row.size(); ++i) {
            if (row.is_null(i)) {
                cells.push_back(nullptr);
            } else {
                cells.push_back(row[i]);
            }
        }
        rows.push_back(std::move(cells));
    }
    j["rows"] = std::move(rows);
    j["row_count"] = result.rows.size();
    return j.dump();
}

// Result parsed back from a response produced by result_to_json()
inline Result result_from_json(const std::string& text) {
    Result result;
    auto j = json::parse(text);
    if (!j.value("success", false)) {
        result.error = j.value("error", std::string("unknown error"));
        result.code = SQLITE_ERROR;
        return result;
    }
    result.columns = j.at("columns").get<std::vector<std::string>>();
    for (const auto& values : j.at("rows")) {
        Row row;
        for (const auto& cell : values) {
            row.nulls.push_back(cell.is_null());
            row.values.push_back(cell.is_null() ? std::string() : cell.get<std::string>());
        }
        result.rows.push_back(std::move(row));
    }
    return result;
}

}  // namespace dbpool::thinclient
