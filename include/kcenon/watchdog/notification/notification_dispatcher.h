#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file notification_dispatcher.h
 * @brief Rate-limited FIFO queue in front of a message transport
 *
 * Alert decisions are made synchronously by the scheduler; delivery happens
 * here on a single drain thread. enqueue() never waits for the transport.
 * Messages go out strictly in enqueue order with at least min_interval
 * between consecutive send attempts. A failed send is logged and dropped.
 */

#include "message_transport.h"
#include "../core/clock.h"
#include "../core/logging.h"
#include "../core/result_types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace kcenon { namespace watchdog {

/**
 * @struct dispatcher_config
 * @brief Configuration for the notification dispatcher
 */
struct dispatcher_config {
    std::chrono::milliseconds min_interval{33};  // at most ~30 messages per second
    bool drain_on_stop = true;

    result_void validate() const {
        if (min_interval.count() < 0) {
            return make_result_void(watchdog_error_code::invalid_interval,
                                    "Minimum send interval must not be negative");
        }
        return make_void_success();
    }
};

/**
 * @struct queue_status
 * @brief Point-in-time view of the dispatcher queue
 */
struct queue_status {
    size_t queue_length = 0;
    bool processing = false;
    size_t sent = 0;
    size_t failed = 0;
    std::optional<time_point> last_sent_time;
};

class notification_dispatcher {
public:
    /**
     * @throws std::invalid_argument if transport is null or the configuration is invalid
     */
    notification_dispatcher(std::shared_ptr<message_transport> transport,
                            const dispatcher_config& config = {},
                            logger_ptr logger = nullptr);

    ~notification_dispatcher();

    notification_dispatcher(const notification_dispatcher&) = delete;
    notification_dispatcher& operator=(const notification_dispatcher&) = delete;

    /**
     * @brief Append a message and return immediately
     *
     * Messages enqueued before start() wait until the drain thread runs.
     */
    void enqueue(std::string message);

    result_void start();

    /**
     * @brief Stop the drain thread
     *
     * With drain_on_stop the queue is emptied first, still honoring the
     * send interval; otherwise pending messages stay queued.
     */
    result_void stop();

    bool is_running() const { return running_.load(); }

    queue_status status() const;

    /**
     * @brief Block until the queue is empty and no send is in flight
     * @return false if the timeout elapsed first
     */
    bool wait_until_idle(std::chrono::milliseconds timeout) const;

private:
    void drain_loop();
    void deliver(const std::string& message);

    std::shared_ptr<message_transport> transport_;
    dispatcher_config config_;
    logger_ptr logger_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    mutable std::condition_variable idle_cv_;
    std::deque<std::string> queue_;
    bool processing_ = false;
    size_t sent_ = 0;
    size_t failed_ = 0;
    std::optional<std::chrono::steady_clock::time_point> last_attempt_;
    std::optional<time_point> last_sent_time_;

    std::atomic<bool> running_{false};
    std::thread drain_thread_;
};

} } // namespace kcenon::watchdog
