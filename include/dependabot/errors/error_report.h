/**
 * @file error_report.h
 * @brief JSON rendering and logging of taxonomy errors
 *
 * Report layout:
 * @code
 * {
 *   "error-type": "dependency_file_not_found",
 *   "error-detail": { "message": "/Gemfile not found", "file-path": "/Gemfile" }
 * }
 * @endcode
 *
 * Only sanitized fields reach the report or the log.
 */

#pragma once

#include "dependabot/errors/errors.h"

#include <string>
#include <json/json.h>

namespace dependabot::errors {

/**
 * @brief Kind-specific fields, kebab-case keys
 */
Json::Value errorDetails(const ErrorKind& kind);

/**
 * @brief {"error-type": ..., "error-detail": ...}
 */
Json::Value toJson(const DependabotError& error);

/**
 * @brief Compact JSON string of toJson()
 */
std::string toJsonString(const DependabotError& error);

/**
 * @brief Log "[context] <error-type>: <message>" at error level
 */
void logError(const std::string& logContext, const DependabotError& error);

} // namespace dependabot::errors
