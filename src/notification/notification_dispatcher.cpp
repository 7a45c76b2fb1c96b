// BSD 3-Clause License
//
// Copyright (c) 2021-2025, kcenon
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "kcenon/watchdog/notification/notification_dispatcher.h"

#include <exception>
#include <stdexcept>

namespace kcenon::watchdog {

notification_dispatcher::notification_dispatcher(std::shared_ptr<message_transport> transport,
                                                 const dispatcher_config& config,
                                                 logger_ptr logger)
    : transport_(std::move(transport))
    , config_(config)
    , logger_(std::move(logger)) {
    if (!transport_) {
        throw std::invalid_argument("notification_dispatcher requires a transport");
    }
    auto validation = config_.validate();
    if (validation.is_err()) {
        throw std::invalid_argument("Invalid dispatcher configuration: " +
                                    validation.error().message);
    }
}

notification_dispatcher::~notification_dispatcher() {
    if (running_.load()) {
        auto stopped = stop();
        if (stopped.is_err()) {
            log_error(logger_, "Failed to stop dispatcher: " + stopped.error().message);
        }
    }
}

void notification_dispatcher::enqueue(std::string message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(message));
    }
    cv_.notify_one();
}

result_void notification_dispatcher::start() {
    if (running_.exchange(true)) {
        return make_void_error(watchdog_error_code::already_started,
                               "Notification dispatcher is already running");
    }

    drain_thread_ = std::thread(&notification_dispatcher::drain_loop, this);
    return make_void_success();
}

result_void notification_dispatcher::stop() {
    if (!running_.load()) {
        return make_void_success();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    cv_.notify_all();

    if (drain_thread_.joinable()) {
        drain_thread_.join();
    }

    return make_void_success();
}

queue_status notification_dispatcher::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_status status;
    status.queue_length = queue_.size();
    status.processing = processing_;
    status.sent = sent_;
    status.failed = failed_;
    status.last_sent_time = last_sent_time_;
    return status;
}

bool notification_dispatcher::wait_until_idle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout,
                             [this] { return queue_.empty() && !processing_; });
}

void notification_dispatcher::drain_loop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        cv_.wait(lock, [this] { return !running_.load() || !queue_.empty(); });

        const bool stopping = !running_.load();
        if (queue_.empty() || (stopping && !config_.drain_on_stop)) {
            if (stopping) {
                break;
            }
            continue;
        }

        if (last_attempt_) {
            auto next_slot = *last_attempt_ + config_.min_interval;
            bool abandoned = cv_.wait_until(lock, next_slot, [this] {
                return !running_.load() && !config_.drain_on_stop;
            });
            if (abandoned) {
                break;
            }
        }

        std::string message = std::move(queue_.front());
        queue_.pop_front();
        processing_ = true;

        lock.unlock();
        deliver(message);
        lock.lock();

        processing_ = false;
        last_attempt_ = std::chrono::steady_clock::now();
        idle_cv_.notify_all();
    }

    idle_cv_.notify_all();
}

void notification_dispatcher::deliver(const std::string& message) {
    bool delivered = false;
    try {
        auto sent = transport_->send(message);
        if (sent.is_err()) {
            log_error(logger_, "Failed to send notification via " + transport_->name() + ": " +
                                   sent.error().message);
        } else {
            delivered = true;
        }
    } catch (const std::exception& e) {
        log_error(logger_, "Notification transport " + transport_->name() + " threw: " + e.what());
    }

    std::lock_guard<std::mutex> guard(mutex_);
    if (delivered) {
        sent_++;
        last_sent_time_ = wall_clock::now();
        log_debug(logger_, "Notification sent via " + transport_->name());
    } else {
        failed_++;
    }
}

} // namespace kcenon::watchdog
