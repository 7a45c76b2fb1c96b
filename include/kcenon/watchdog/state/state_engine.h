#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file state_engine.h
 * @brief Authoritative failure, cooldown, flapping and acknowledgment state
 *
 * The engine owns four collections (failures, transition logs, acknowledged
 * ids, TLS expiry cache) behind a single mutex and exposes only
 * operation-level calls, so two concurrent reports for the same service id
 * can never interleave their mutations. It also owns persistence timing: a
 * background thread saves on a fixed interval and shutdown() flushes once
 * more.
 */

#include "state_types.h"
#include "../core/clock.h"
#include "../core/logging.h"
#include "../core/result_types.h"

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace kcenon { namespace watchdog {

/**
 * @class state_engine
 * @brief Thread-safe per-service health state machine with persistence
 *
 * Example:
 * @code
 * state_engine_config config;
 * config.state_path = "/var/lib/watchdog/state.json";
 * state_engine engine(config, logger);
 *
 * auto action = engine.record_failure("docker:api", "container exited");
 * if (action == alert_action::first_failure) {
 *     // alert
 * }
 * @endcode
 */
class state_engine {
public:
    /**
     * @brief Construct the engine and restore persisted state
     *
     * A missing or corrupt state file starts fresh; the failure is logged.
     * @throws std::invalid_argument if the configuration does not validate
     */
    explicit state_engine(const state_engine_config& config = {},
                          logger_ptr logger = nullptr,
                          time_provider clock = system_time_provider());

    ~state_engine();

    state_engine(const state_engine&) = delete;
    state_engine& operator=(const state_engine&) = delete;

    /**
     * @brief Record a failed check
     *
     * Creates a failure record on first failure. On later failures the count
     * grows and the error is replaced; ongoing_failure is returned (and the
     * alert clock restarted) only once the cooldown has elapsed since the
     * last alert.
     */
    alert_action record_failure(const std::string& service_id, const std::string& error);

    /**
     * @brief Record a successful check for a service that may be failing
     * @return Downtime summary, or nullopt if no failure was tracked
     */
    std::optional<recovery_info> record_recovery(const std::string& service_id);

    /**
     * @brief Append a health flip to the service's transition log
     *
     * Call only when the observed health differs from the previous
     * observation.
     * @return Whether the service is flapping after this transition
     */
    bool record_state_change(const std::string& service_id, health_state new_state);

    bool is_flapping(const std::string& service_id) const;

    flapping_info get_flapping_info(const std::string& service_id) const;

    void clear_flapping_history(const std::string& service_id);

    /**
     * @brief Drop transitions that have aged out of the flapping window
     */
    void prune_flapping_history(const std::string& service_id);

    void acknowledge(const std::string& service_id);
    void unacknowledge(const std::string& service_id);
    bool is_acknowledged(const std::string& service_id) const;
    std::vector<std::string> acknowledged_services() const;

    std::optional<failure_record> get_failure(const std::string& service_id) const;
    std::map<std::string, failure_record> get_all_failures() const;

    void update_ssl_expiry(const std::string& domain, time_point expires_at);
    std::optional<time_point> get_ssl_expiry(const std::string& domain) const;

    state_stats get_stats() const;

    /**
     * @brief Write a consistent snapshot of all collections to state_path
     */
    result_void save();

    /**
     * @brief Replace in-memory state with the content of state_path
     *
     * Collections absent from the document load as empty. Malformed entries
     * inside a collection are skipped with a warning.
     */
    result_void load();

    /**
     * @brief Serialize all collections as a JSON document
     */
    std::string export_json() const;

    /**
     * @brief Replace in-memory state from a document written by export_json()
     */
    result_void import_json(const std::string& document);

    result_void start_auto_save();
    result_void stop_auto_save();
    bool is_auto_saving() const { return auto_save_running_.load(); }

    /**
     * @brief Stop auto-save and flush a final save
     */
    result_void shutdown();

    std::optional<time_point> last_saved() const;

    const state_engine_config& config() const { return config_; }

private:
    time_point now() const { return clock_(); }
    size_t count_in_window(const std::vector<state_transition>& log, time_point now) const;
    void auto_save_loop();

    state_engine_config config_;
    logger_ptr logger_;
    time_provider clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, failure_record> failures_;
    std::unordered_map<std::string, std::vector<state_transition>> transitions_;
    std::set<std::string> acknowledged_;
    std::unordered_map<std::string, time_point> ssl_expiry_;
    std::optional<time_point> last_saved_;

    std::mutex save_mutex_;

    std::atomic<bool> auto_save_running_{false};
    std::thread auto_save_thread_;
    std::condition_variable cv_;
    std::mutex cv_mutex_;
};

} } // namespace kcenon::watchdog
