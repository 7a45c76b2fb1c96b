#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file result_types.h
 * @brief Result aliases and error constructors used across the watchdog
 *
 * Every fallible watchdog operation returns common_system's Result or
 * VoidResult. The error carries the numeric watchdog_error_code, a message
 * (the code's description when none is given), the "watchdog_system" module
 * tag and, where one is known, the offending path or target in details.
 */

#include "error_codes.h"
#include <kcenon/common/patterns/result.h>

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace kcenon { namespace watchdog {

inline constexpr const char* error_module = "watchdog_system";

template<typename T>
using result = common::Result<T>;

using result_void = common::VoidResult;

inline common::error_info make_error_info(watchdog_error_code code,
                                          const std::string& message = "",
                                          const std::optional<std::string>& context = std::nullopt) {
    common::error_info info(static_cast<int>(code),
                            message.empty() ? error_code_to_string(code) : message,
                            error_module);
    info.details = context;
    return info;
}

/**
 * @brief One-line rendering of an error for logs: "[description] message (details)"
 */
inline std::string describe(const common::error_info& error) {
    std::string text = "[" + error_code_to_string(static_cast<watchdog_error_code>(error.code)) +
                       "] " + error.message;
    if (error.details && !error.details->empty()) {
        text += " (" + *error.details + ")";
    }
    return text;
}

template<typename T>
common::Result<std::decay_t<T>> make_success(T&& value) {
    return common::ok<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T>
common::Result<T> make_error(watchdog_error_code code, const std::string& message = "") {
    return common::Result<T>::err(make_error_info(code, message));
}

/// VoidResult error with the path or target that caused it
inline common::VoidResult make_result_void(watchdog_error_code code,
                                           const std::string& message = "",
                                           const std::optional<std::string>& context = std::nullopt) {
    return common::VoidResult::err(make_error_info(code, message, context));
}

inline common::VoidResult make_void_error(watchdog_error_code code,
                                          const std::string& message = "") {
    return common::VoidResult::err(make_error_info(code, message));
}

inline common::VoidResult make_void_success() {
    return common::VoidResult(std::monostate{});
}

} } // namespace kcenon::watchdog
