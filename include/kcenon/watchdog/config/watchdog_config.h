#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file watchdog_config.h
 * @brief Aggregated configuration for all watchdog components
 *
 * Recognised keys of the flat configuration map:
 *
 * | Key                          | Default  | Notes                         |
 * |------------------------------|----------|-------------------------------|
 * | intervals.services           | 60s      | duration, plain number = ms   |
 * | intervals.endpoints          | 5m       |                               |
 * | intervals.resources          | 5m       |                               |
 * | intervals.tls                | 24h      | "intervals.ssl" also accepted |
 * | alerts.cooldown              | 30m      | plain number = minutes        |
 * | alerts.recovery_notify       | true     |                               |
 * | alerts.flapping_threshold    | 3        |                               |
 * | alerts.flapping_window       | 10m      | plain number = minutes        |
 * | anomaly.enabled              | true     |                               |
 * | anomaly.multiplier           | 3.0      |                               |
 * | anomaly.sample_size          | 20       |                               |
 * | anomaly.min_samples          | 5        |                               |
 * | thresholds.disk / ram / cpu  | 85/90/95 | percent                       |
 * | state.path                   | ./state.json                             |
 * | state.auto_save_interval     | 60s      |                               |
 * | state.anomaly_path           | (empty)  | empty disables the snapshot   |
 * | notifications.min_interval   | 33ms     |                               |
 * | notifications.drain_on_stop  | true     |                               |
 */

#include "../anomaly/anomaly_detector.h"
#include "../checkers/resource_checker.h"
#include "../core/result_types.h"
#include "../notification/notification_dispatcher.h"
#include "../scheduler/check_scheduler.h"
#include "../state/state_types.h"
#include "../utils/config_parser.h"

#include <functional>
#include <string>

namespace kcenon { namespace watchdog {

struct watchdog_config {
    state_engine_config state;
    anomaly_detector_config anomaly;
    scheduler_config scheduler;
    dispatcher_config notifications;
    resource_thresholds thresholds;

    /**
     * @brief Validate every section; the first failure is returned
     */
    result_void validate() const;

    /**
     * @brief Build a configuration from a flat key/value map
     *
     * Missing or unparseable keys keep their defaults. The assembled
     * configuration is validated before it is returned.
     */
    static result<watchdog_config> from_config_map(const config_map& values);
};

/**
 * @brief Environment variable lookup; returns null when unset
 */
using env_lookup = std::function<const char*(const char*)>;

/**
 * @brief Translate the watchdog environment variables into config keys
 *
 * CHECK_INTERVAL_* are in seconds, ALERT_COOLDOWN_MINUTES and
 * FLAPPING_WINDOW_MINUTES in minutes. Unset variables produce no entry.
 * An empty @p lookup reads the process environment.
 */
config_map environment_overrides(const env_lookup& lookup = nullptr);

/**
 * @brief Read a "key = value" file
 *
 * Blank lines and lines starting with '#' or ';' are ignored. A "[section]"
 * line prefixes the keys that follow with "section.".
 */
result<config_map> load_config_file(const std::string& path);

/**
 * @brief Overlay @p overrides on @p base; keys in overrides win
 */
config_map merge_config(config_map base, const config_map& overrides);

} } // namespace kcenon::watchdog
