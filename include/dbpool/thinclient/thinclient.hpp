#pragma once

/**
 * @file thinclient.hpp
 * @brief Master include for the HTTP front end
 *
 * Includes CLI parsing, HTTP server, and HTTP client.
 * Requires cpp-httplib (DBPOOL_WITH_THINCLIENT CMake option).
 */

#include <dbpool/thinclient/cli.hpp>
#include <dbpool/thinclient/server.hpp>
#include <dbpool/thinclient/client.hpp>
