#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file message_transport.h
 * @brief Outbound channel contract used by the notification dispatcher
 *
 * A transport receives a pre-formatted message and attempts delivery once.
 * Failures are reported through the result; the dispatcher logs them and
 * drops the message.
 */

#include "../core/logging.h"
#include "../core/result_types.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace kcenon { namespace watchdog {

/**
 * @class message_transport
 * @brief Base class for delivery channels (chat bot API, log, callback)
 */
class message_transport {
public:
    virtual ~message_transport() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Attempt to deliver one message
     */
    virtual result_void send(const std::string& message) = 0;

    virtual bool is_ready() const = 0;
};

/**
 * @class callback_transport
 * @brief Transport that hands each message to a user-supplied callable
 *
 * The callable reports delivery failure through its result, which lets
 * callers plug in any client library without subclassing.
 */
class callback_transport : public message_transport {
public:
    using send_func = std::function<result_void(const std::string&)>;

    callback_transport(std::string transport_name, send_func func)
        : name_(std::move(transport_name))
        , func_(std::move(func)) {}

    std::string name() const override { return name_; }

    result_void send(const std::string& message) override {
        if (!func_) {
            return make_void_error(watchdog_error_code::transport_unavailable,
                                   "No send function configured");
        }
        return func_(message);
    }

    bool is_ready() const override { return static_cast<bool>(func_); }

private:
    std::string name_;
    send_func func_;
};

/**
 * @class log_transport
 * @brief Writes every message to the injected logger at info level
 */
class log_transport : public message_transport {
public:
    explicit log_transport(logger_ptr logger, std::string transport_name = "log")
        : logger_(std::move(logger))
        , name_(std::move(transport_name)) {}

    std::string name() const override { return name_; }

    result_void send(const std::string& message) override {
        if (!logger_) {
            return make_void_error(watchdog_error_code::transport_unavailable,
                                   "No logger attached");
        }
        auto logged = logger_->log(log_level::info, "[ALERT] " + message);
        if (logged.is_err()) {
            return make_void_error(watchdog_error_code::notification_failed,
                                   logged.error().message);
        }
        return make_void_success();
    }

    bool is_ready() const override { return logger_ != nullptr; }

private:
    logger_ptr logger_;
    std::string name_;
};

/**
 * @class multi_transport
 * @brief Fans one message out to several transports
 *
 * Every child is attempted. The first failure is returned after all
 * attempts.
 */
class multi_transport : public message_transport {
public:
    explicit multi_transport(std::string transport_name)
        : name_(std::move(transport_name)) {}

    void add_transport(std::shared_ptr<message_transport> transport) {
        std::lock_guard<std::mutex> lock(mutex_);
        transports_.push_back(std::move(transport));
    }

    std::string name() const override { return name_; }

    result_void send(const std::string& message) override {
        std::vector<std::shared_ptr<message_transport>> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            targets = transports_;
        }

        result_void first_error = make_void_success();
        for (const auto& transport : targets) {
            auto sent = transport->send(message);
            if (sent.is_err() && first_error.is_ok()) {
                first_error = sent;
            }
        }
        return first_error;
    }

    bool is_ready() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !transports_.empty();
    }

private:
    std::string name_;
    std::vector<std::shared_ptr<message_transport>> transports_;
    mutable std::mutex mutex_;
};

} } // namespace kcenon::watchdog
