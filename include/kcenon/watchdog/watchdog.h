#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file watchdog.h
 * @brief Top-level object wiring state, anomaly detection, scheduling and
 *        notification into one lifecycle
 *
 * @code
 * auto config = watchdog_config::from_config_map(values);
 * watchdog_service dog(config.value(), std::make_shared<log_transport>(logger), logger);
 * dog.scheduler().register_checker("docker", docker_probe);
 * dog.scheduler().add_target(check_category::services, {"api", "docker"});
 * dog.start();
 * ...
 * dog.stop();
 * @endcode
 */

#include "anomaly/anomaly_detector.h"
#include "checkers/resource_checker.h"
#include "config/watchdog_config.h"
#include "core/clock.h"
#include "core/logging.h"
#include "core/result_types.h"
#include "notification/message_formatter.h"
#include "notification/message_transport.h"
#include "notification/notification_dispatcher.h"
#include "scheduler/check_scheduler.h"
#include "state/state_engine.h"

#include <atomic>
#include <memory>

namespace kcenon { namespace watchdog {

class watchdog_service {
public:
    /**
     * @brief Build all components; restores persisted state and latency history
     *
     * A resource_checker built from the configured thresholds is registered
     * under the "resource" type.
     * @throws std::invalid_argument if transport is null or the configuration is invalid
     */
    watchdog_service(const watchdog_config& config,
                     std::shared_ptr<message_transport> transport,
                     logger_ptr logger = nullptr,
                     time_provider clock = system_time_provider());

    ~watchdog_service();

    watchdog_service(const watchdog_service&) = delete;
    watchdog_service& operator=(const watchdog_service&) = delete;

    /**
     * @brief Start delivery, auto-save and the category timers
     *
     * Sends the startup notice. With @p warm_up every category is checked
     * once before the timers take over.
     */
    result_void start(bool warm_up = true);

    /**
     * @brief Stop the timers, persist state, send the shutdown notice and
     *        drain the notification queue
     */
    result_void stop();

    bool is_running() const { return running_.load(); }

    /**
     * @brief Silence notifications for a service id until unacknowledged
     */
    void acknowledge(const std::string& service_id);
    void unacknowledge(const std::string& service_id);

    check_scheduler& scheduler() { return *scheduler_; }
    state_engine& state() { return *state_; }
    anomaly_detector& detector() { return *detector_; }
    notification_dispatcher& dispatcher() { return *dispatcher_; }

    const watchdog_config& config() const { return config_; }

private:
    startup_summary summarize() const;
    /// Stops what start() brought up before a later step failed
    void unwind_start();

    watchdog_config config_;
    logger_ptr logger_;
    message_formatter formatter_;
    std::shared_ptr<state_engine> state_;
    std::shared_ptr<anomaly_detector> detector_;
    std::shared_ptr<notification_dispatcher> dispatcher_;
    std::unique_ptr<check_scheduler> scheduler_;
    std::atomic<bool> running_{false};
};

} } // namespace kcenon::watchdog
