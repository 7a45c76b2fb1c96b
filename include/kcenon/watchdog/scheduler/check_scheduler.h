#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file check_scheduler.h
 * @brief Periodic check orchestration and per-result alert decisions
 *
 * Each check category runs on its own timer thread. A firing fans out one
 * asynchronous probe per target and joins on all of them; a probe that throws
 * is logged and contributes no sample, so one broken target never fails the
 * cycle. Every result then flows through the state engine (and, for
 * endpoints, the anomaly detector) and produces at most one failure-side
 * alert, handed to the notification dispatcher.
 */

#include "../anomaly/anomaly_detector.h"
#include "../checkers/service_checker.h"
#include "../core/logging.h"
#include "../core/result_types.h"
#include "../notification/message_formatter.h"
#include "../notification/notification_dispatcher.h"
#include "../state/state_engine.h"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace kcenon { namespace watchdog {

/**
 * @enum check_category
 * @brief Groups of targets that share a check interval
 */
enum class check_category : std::uint8_t {
    services,   ///< Containers, managed processes, OS services
    endpoints,  ///< HTTP endpoints, with latency anomaly detection
    resources,  ///< Host disk, memory, CPU
    tls         ///< Certificate expiry of HTTPS endpoints
};

inline constexpr std::array<check_category, 4> all_check_categories = {
    check_category::services, check_category::endpoints,
    check_category::resources, check_category::tls};

inline std::string category_to_string(check_category category) {
    switch (category) {
        case check_category::services: return "services";
        case check_category::endpoints: return "endpoints";
        case check_category::resources: return "resources";
        case check_category::tls: return "tls";
        default: return "unknown";
    }
}

/**
 * @struct scheduler_config
 * @brief Per-category intervals and alerting switches
 */
struct scheduler_config {
    std::chrono::milliseconds services_interval{60000};
    std::chrono::milliseconds endpoints_interval{300000};
    std::chrono::milliseconds resources_interval{300000};
    std::chrono::milliseconds tls_interval{86400000};
    bool recovery_notify = true;
    std::string anomaly_snapshot_path;  ///< Empty disables anomaly persistence

    std::chrono::milliseconds interval_for(check_category category) const {
        switch (category) {
            case check_category::services: return services_interval;
            case check_category::endpoints: return endpoints_interval;
            case check_category::resources: return resources_interval;
            case check_category::tls: return tls_interval;
            default: return services_interval;
        }
    }

    result_void validate() const {
        for (auto category : all_check_categories) {
            if (interval_for(category).count() <= 0) {
                return make_result_void(watchdog_error_code::invalid_interval,
                                        "Interval for " + category_to_string(category) +
                                            " must be positive");
            }
        }
        return make_void_success();
    }
};

/**
 * @struct cycle_report
 * @brief Outcome of one fan-out over a category
 */
struct cycle_report {
    check_category category = check_category::services;
    size_t targets = 0;
    size_t checked = 0;     ///< Probes that produced a result
    size_t no_sample = 0;   ///< Probes that threw or had no checker
    size_t unhealthy = 0;
    size_t alerts_emitted = 0;
    std::chrono::milliseconds elapsed{0};
};

struct scheduler_stats {
    bool running = false;
    size_t active_timers = 0;
    size_t registered_checkers = 0;
    size_t total_targets = 0;
    size_t cycles_completed = 0;
    state_stats state;
    anomaly_summary anomalies;
};

class check_scheduler {
public:
    /**
     * @throws std::invalid_argument if a collaborator is null or the configuration is invalid
     */
    check_scheduler(std::shared_ptr<state_engine> state,
                    std::shared_ptr<anomaly_detector> detector,
                    std::shared_ptr<notification_dispatcher> dispatcher,
                    const scheduler_config& config = {},
                    logger_ptr logger = nullptr);

    ~check_scheduler();

    check_scheduler(const check_scheduler&) = delete;
    check_scheduler& operator=(const check_scheduler&) = delete;

    /**
     * @brief Map a checker type ("docker", "http", "resource", ...) to a probe
     */
    result_void register_checker(const std::string& type, std::shared_ptr<service_checker> checker);

    bool has_checker(const std::string& type) const;

    /**
     * @brief Add a target to a category
     *
     * TLS targets must carry an https:// address.
     */
    result_void add_target(check_category category, check_target target);

    std::vector<check_target> targets(check_category category) const;

    /**
     * @brief Stable identity of a target across all subsystems
     *
     * services: "<type>:<name>", endpoints: "http:<address>",
     * tls: "ssl:<address>", resources: "resource:<name>".
     */
    static std::string make_service_id(check_category category, const check_target& target);

    /**
     * @brief Check every target of a category concurrently and wait for all
     */
    cycle_report run_category(check_category category);

    /**
     * @brief Run all four categories once, independent of the timers
     */
    std::vector<cycle_report> run_all_once();

    /**
     * @brief Apply one check result to the state machine and emit alerts
     *
     * Results are handled one at a time. Acknowledged services still update
     * their state but never enqueue a notification.
     * @return Number of alerts enqueued
     */
    size_t handle_check_result(check_category category,
                               const check_target& target,
                               const check_result& result);

    /**
     * @brief Start one timer thread per category
     */
    result_void start();

    result_void stop();

    bool is_running() const { return running_.load(); }

    scheduler_stats get_stats() const;

    /**
     * @brief Stop timers, persist the anomaly snapshot and flush state
     */
    result_void shutdown();

    const scheduler_config& config() const { return config_; }

private:
    struct target_outcome {
        bool sampled = false;
        bool healthy = false;
        size_t alerts = 0;
    };

    static std::string resolve_type(check_category category, const check_target& target);
    std::shared_ptr<service_checker> find_checker(const std::string& type) const;
    target_outcome check_target_once(check_category category, const check_target& target);
    std::string failure_message(check_category category, const check_target& target,
                                const check_result& result, alert_action action) const;
    void refresh_ssl_expiry(const check_target& target, const check_result& result);
    void emit(const std::string& service_id, std::string message);
    void timer_loop(check_category category);

    std::shared_ptr<state_engine> state_;
    std::shared_ptr<anomaly_detector> detector_;
    std::shared_ptr<notification_dispatcher> dispatcher_;
    scheduler_config config_;
    logger_ptr logger_;
    message_formatter formatter_;

    mutable std::mutex checkers_mutex_;
    std::unordered_map<std::string, std::shared_ptr<service_checker>> checkers_;

    mutable std::mutex targets_mutex_;
    std::map<check_category, std::vector<check_target>> targets_;

    std::mutex result_mutex_;

    std::atomic<bool> running_{false};
    std::atomic<size_t> active_timers_{0};
    std::atomic<size_t> cycles_completed_{0};
    std::vector<std::thread> timer_threads_;
    std::condition_variable cv_;
    std::mutex cv_mutex_;
};

} } // namespace kcenon::watchdog
