#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file logging.h
 * @brief Helpers for writing through an injected common_system ILogger
 *
 * Components never own a global logger. Each one receives a logger_ptr in its
 * constructor; a null pointer disables logging for that component.
 */

#include <kcenon/common/interfaces/logger_interface.h>

#include <iostream>
#include <memory>
#include <string>

namespace kcenon { namespace watchdog {

using log_level = common::interfaces::log_level;
using logger_ptr = std::shared_ptr<common::interfaces::ILogger>;

/**
 * @brief Write a message if a logger is attached and the level is enabled
 *
 * A failing logger cannot report through itself, so its error goes to stderr.
 */
inline void log_message(const logger_ptr& logger, log_level level, const std::string& message) {
    if (!logger || !logger->is_enabled(level)) {
        return;
    }
    auto result = logger->log(level, message);
    if (result.is_err()) {
        std::cerr << "[watchdog] logger rejected message: " << result.error().message << '\n';
    }
}

inline void log_debug(const logger_ptr& logger, const std::string& message) {
    log_message(logger, log_level::debug, message);
}

inline void log_info(const logger_ptr& logger, const std::string& message) {
    log_message(logger, log_level::info, message);
}

inline void log_warning(const logger_ptr& logger, const std::string& message) {
    log_message(logger, log_level::warning, message);
}

inline void log_error(const logger_ptr& logger, const std::string& message) {
    log_message(logger, log_level::error, message);
}

} } // namespace kcenon::watchdog
