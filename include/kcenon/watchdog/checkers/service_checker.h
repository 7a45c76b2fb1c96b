#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file service_checker.h
 * @brief Probe contract consumed by the check scheduler
 *
 * A checker answers one question about one target: is it healthy right now.
 * A down service is a healthy=false result, never an exception. Exceptions
 * are reserved for the probe itself failing to run, and the scheduler treats
 * those as "no sample this cycle".
 */

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace kcenon { namespace watchdog {

using metadata_map = std::map<std::string, std::string>;

/**
 * @struct check_target
 * @brief One monitored target as handed to a checker
 */
struct check_target {
    std::string name;      ///< Display name (container, process, unit, resource)
    std::string type;      ///< Checker type used for registry lookup (docker, http, ...)
    std::string address;   ///< URL for endpoint and TLS targets
    metadata_map options;  ///< Checker-specific settings
};

/**
 * @struct check_result
 * @brief Outcome of one probe invocation
 */
struct check_result {
    bool healthy = false;
    std::optional<double> response_time_ms;
    std::string error;
    metadata_map metadata;

    static check_result ok(std::optional<double> response_time_ms = std::nullopt) {
        check_result result;
        result.healthy = true;
        result.response_time_ms = response_time_ms;
        return result;
    }

    static check_result failed(std::string error) {
        check_result result;
        result.healthy = false;
        result.error = std::move(error);
        return result;
    }
};

/**
 * @class service_checker
 * @brief Capability interface implemented independently by each probe type
 */
class service_checker {
public:
    virtual ~service_checker() = default;

    /**
     * @brief Probe one target
     *
     * Implementations must bound their own running time.
     */
    virtual check_result check(const check_target& target) = 0;

    virtual std::string name() const = 0;
};

/**
 * @class functional_checker
 * @brief Checker backed by a callable
 */
class functional_checker : public service_checker {
public:
    using check_func = std::function<check_result(const check_target&)>;

    functional_checker(std::string checker_name, check_func func)
        : name_(std::move(checker_name))
        , func_(std::move(func)) {}

    check_result check(const check_target& target) override {
        if (!func_) {
            return check_result::failed("No check function configured");
        }
        return func_(target);
    }

    std::string name() const override { return name_; }

private:
    std::string name_;
    check_func func_;
};

/**
 * @class timed_checker
 * @brief Decorator that bounds another checker's running time
 *
 * The wrapped probe runs on its own thread. If it has not answered within
 * the timeout the caller receives a healthy=false result immediately and the
 * late answer is discarded, so a stalled probe cannot hold up the scheduler's
 * fan-in.
 *
 * At most one probe per target is in flight. While an overrun probe for a
 * target has not returned, further checks of that target fail at once
 * without starting another thread. A probe that never returns therefore
 * pins one thread for the life of the process and no more.
 */
class timed_checker : public service_checker {
public:
    /**
     * @throws std::invalid_argument if inner is null or timeout is not positive
     */
    timed_checker(std::shared_ptr<service_checker> inner, std::chrono::milliseconds timeout);

    /**
     * @brief Run the wrapped probe with the timeout
     *
     * An exception thrown by the wrapped probe within the timeout is
     * rethrown to the caller.
     */
    check_result check(const check_target& target) override;

    std::string name() const override { return inner_->name(); }

    std::chrono::milliseconds timeout() const { return timeout_; }

    /// Number of targets whose probe has not returned yet
    size_t in_flight() const;

private:
    struct in_flight_set {
        std::mutex mutex;
        std::set<std::string> keys;
    };

    std::shared_ptr<service_checker> inner_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<in_flight_set> in_flight_;
};

} } // namespace kcenon::watchdog
