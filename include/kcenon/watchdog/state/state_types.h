#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file state_types.h
 * @brief Value types of the failure / recovery / flapping state machine
 */

#include "../core/clock.h"
#include "../core/result_types.h"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace kcenon { namespace watchdog {

/**
 * @enum health_state
 * @brief Observed polarity recorded in a transition
 */
enum class health_state : std::uint8_t {
    healthy,
    unhealthy
};

inline std::string health_state_to_string(health_state state) {
    return state == health_state::healthy ? "healthy" : "unhealthy";
}

/**
 * @enum alert_action
 * @brief Decision returned by state_engine::record_failure
 */
enum class alert_action : std::uint8_t {
    first_failure,    ///< No failure was tracked; alert now
    ongoing_failure,  ///< Cooldown elapsed since the last alert; alert again
    suppressed        ///< Still inside the cooldown; stay quiet
};

inline std::string alert_action_to_string(alert_action action) {
    switch (action) {
        case alert_action::first_failure: return "first_failure";
        case alert_action::ongoing_failure: return "ongoing_failure";
        case alert_action::suppressed: return "suppressed";
        default: return "unknown";
    }
}

/**
 * @struct failure_record
 * @brief Tracked failure of one currently-unhealthy service
 *
 * last_alert_sent only moves when a re-alert is actually emitted.
 */
struct failure_record {
    time_point first_seen;
    time_point last_alert_sent;
    std::string error;
    std::uint32_t consecutive_failures = 1;
};

/**
 * @struct state_transition
 * @brief One observed health flip
 */
struct state_transition {
    time_point time;
    health_state state = health_state::healthy;
};

/**
 * @struct recovery_info
 * @brief Returned when a tracked failure ends
 */
struct recovery_info {
    std::chrono::milliseconds downtime{0};
    std::uint32_t failures_seen = 0;
    time_point first_seen;
};

/**
 * @struct flapping_info
 * @brief Current flap predicate with the transitions inside the window
 */
struct flapping_info {
    bool is_flapping = false;
    size_t transition_count = 0;
    std::vector<state_transition> transitions;
};

/**
 * @struct state_stats
 * @brief Counts across all tracked services
 */
struct state_stats {
    size_t total_failures = 0;
    size_t flapping_services = 0;
    size_t acknowledged_services = 0;
    size_t tracked_ssl_certs = 0;
};

/**
 * @struct state_engine_config
 * @brief Cooldown, flap detection and persistence settings
 */
struct state_engine_config {
    std::chrono::minutes cooldown{30};
    size_t flapping_threshold = 3;
    std::chrono::minutes flapping_window{10};
    size_t max_transitions = 10;
    std::string state_path = "./state.json";
    std::chrono::milliseconds auto_save_interval{60000};
    bool load_on_construct = true;

    result_void validate() const {
        if (cooldown.count() < 0) {
            return make_result_void(watchdog_error_code::invalid_configuration,
                                    "Cooldown must not be negative");
        }
        if (flapping_threshold == 0) {
            return make_result_void(watchdog_error_code::invalid_configuration,
                                    "Flapping threshold must be positive");
        }
        if (flapping_window.count() <= 0) {
            return make_result_void(watchdog_error_code::invalid_interval,
                                    "Flapping window must be positive");
        }
        if (max_transitions < flapping_threshold) {
            return make_result_void(watchdog_error_code::invalid_capacity,
                                    "Transition log must hold at least flapping_threshold entries");
        }
        if (auto_save_interval.count() <= 0) {
            return make_result_void(watchdog_error_code::invalid_interval,
                                    "Auto-save interval must be positive");
        }
        return make_void_success();
    }
};

} } // namespace kcenon::watchdog
