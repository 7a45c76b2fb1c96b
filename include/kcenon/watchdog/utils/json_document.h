#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file json_document.h
 * @brief JSON text and file helpers for the persisted records
 *
 * Both the state record and the anomaly snapshot are JSON documents stored on
 * local disk. Writes go to a sibling temporary file that is renamed over the
 * target, so a crash mid-write never leaves a truncated record behind.
 */

#include "../core/result_types.h"

#include <json/json.h>

#include <string>

namespace kcenon { namespace watchdog {

/**
 * @brief Parse JSON text
 * @return The parsed value, or state_corrupted with the parser's message
 */
result<Json::Value> parse_json(const std::string& text);

/**
 * @brief Serialize a value with two-space indentation
 */
std::string write_json(const Json::Value& value);

/**
 * @brief Read a whole file
 * @return state_file_not_found when the path does not exist,
 *         state_read_failed when it exists but cannot be read
 */
result<std::string> read_text_file(const std::string& path);

/**
 * @brief Replace a file's content through a temporary sibling and rename
 */
result_void write_text_file_atomic(const std::string& path, const std::string& content);

} } // namespace kcenon::watchdog
