#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file message_formatter.h
 * @brief Plain-text alert bodies for chat-style transports
 */

#include "../anomaly/anomaly_detector.h"
#include "../checkers/service_checker.h"
#include "../core/clock.h"
#include "../state/state_types.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace kcenon { namespace watchdog {

/**
 * @struct alert_subject
 * @brief Who an alert is about
 */
struct alert_subject {
    std::string name;
    std::string type;
};

/**
 * @struct startup_summary
 * @brief Target counts announced when monitoring starts
 */
struct startup_summary {
    size_t services = 0;
    size_t endpoints = 0;
    size_t resources = 0;
    size_t tls = 0;
};

class message_formatter {
public:
    /**
     * @param flapping_window Window length quoted in flapping alerts
     * @param cooldown Suppression period quoted in flapping alerts
     */
    explicit message_formatter(std::chrono::minutes flapping_window = std::chrono::minutes(10),
                               std::chrono::minutes cooldown = std::chrono::minutes(30))
        : flapping_window_(flapping_window)
        , cooldown_(cooldown) {}

    /**
     * @brief "SERVICE DOWN" for first_failure, "SERVICE STILL DOWN" otherwise
     *
     * "status" and "restarts" metadata are appended when present.
     */
    std::string format_service_down(const alert_subject& subject,
                                    const check_result& result,
                                    alert_action action) const;

    std::string format_recovery(const alert_subject& subject, const recovery_info& recovery) const;

    std::string format_performance(const std::string& endpoint, const anomaly_result& anomaly) const;

    std::string format_flapping(const alert_subject& subject, size_t transition_count) const;

    /**
     * @brief Resource warning; red marker at 95% usage and above
     */
    std::string format_resource_warning(const std::string& resource, const check_result& result) const;

    /**
     * @brief TLS certificate expiry warning from "days_remaining" and
     *        "expires_at" (epoch ms) metadata; red marker below 7 days
     */
    std::string format_ssl_warning(const std::string& domain, const check_result& result) const;

    std::string format_startup(const startup_summary& summary) const;

    std::string format_shutdown() const;

    /**
     * @brief Human-readable duration: "Xd Yh", "Xh Ym", "Xm Ys" or "Xs"
     */
    static std::string format_duration(std::chrono::milliseconds duration);

private:
    std::chrono::minutes flapping_window_;
    std::chrono::minutes cooldown_;
};

} } // namespace kcenon::watchdog
