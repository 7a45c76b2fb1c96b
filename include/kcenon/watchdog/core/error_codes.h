#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file error_codes.h
 * @brief Watchdog system specific error codes
 *
 * Codes are grouped by range so that a numeric code read from a log line
 * identifies the failing subsystem at a glance.
 */

#include <cstdint>
#include <string>

namespace kcenon { namespace watchdog {

/**
 * @enum watchdog_error_code
 * @brief Error codes for watchdog system operations
 */
enum class watchdog_error_code : std::uint32_t {
    success = 0,

    // State and persistence errors (2000-2999)
    state_file_not_found = 2000,
    state_read_failed = 2001,
    state_write_failed = 2002,
    state_corrupted = 2003,
    snapshot_invalid = 2004,

    // Configuration errors (3000-3999)
    invalid_configuration = 3000,
    invalid_interval = 3001,
    invalid_capacity = 3002,
    invalid_argument = 3003,

    // Lifecycle errors (4000-4999)
    already_started = 4000,
    not_started = 4001,
    operation_timeout = 4002,
    operation_failed = 4003,

    // Check execution errors (7000-7999)
    check_failed = 7000,
    check_timeout = 7001,
    checker_not_registered = 7002,
    probe_unavailable = 7003,

    // Notification errors (8000-8999)
    notification_failed = 8000,
    transport_unavailable = 8001,

    unknown_error = 9999
};

/**
 * @brief Convert error code to string representation
 * @param code The error code to convert
 * @return String representation of the error code
 */
inline std::string error_code_to_string(watchdog_error_code code) {
    switch (code) {
        case watchdog_error_code::success:
            return "Success";

        case watchdog_error_code::state_file_not_found:
            return "State file not found";
        case watchdog_error_code::state_read_failed:
            return "State read failed";
        case watchdog_error_code::state_write_failed:
            return "State write failed";
        case watchdog_error_code::state_corrupted:
            return "State is corrupted";
        case watchdog_error_code::snapshot_invalid:
            return "Snapshot is invalid";

        case watchdog_error_code::invalid_configuration:
            return "Invalid configuration";
        case watchdog_error_code::invalid_interval:
            return "Invalid interval";
        case watchdog_error_code::invalid_capacity:
            return "Invalid capacity";
        case watchdog_error_code::invalid_argument:
            return "Invalid argument";

        case watchdog_error_code::already_started:
            return "Already started";
        case watchdog_error_code::not_started:
            return "Not started";
        case watchdog_error_code::operation_timeout:
            return "Operation timeout";
        case watchdog_error_code::operation_failed:
            return "Operation failed";

        case watchdog_error_code::check_failed:
            return "Check failed";
        case watchdog_error_code::check_timeout:
            return "Check timeout";
        case watchdog_error_code::checker_not_registered:
            return "Checker not registered";
        case watchdog_error_code::probe_unavailable:
            return "Probe source unavailable";

        case watchdog_error_code::notification_failed:
            return "Notification failed";
        case watchdog_error_code::transport_unavailable:
            return "Transport unavailable";

        case watchdog_error_code::unknown_error:
        default:
            return "Unknown error";
    }
}

} } // namespace kcenon::watchdog
