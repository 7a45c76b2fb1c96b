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

#include "kcenon/watchdog/watchdog.h"

#include <stdexcept>

namespace kcenon::watchdog {

watchdog_service::watchdog_service(const watchdog_config& config,
                                   std::shared_ptr<message_transport> transport,
                                   logger_ptr logger,
                                   time_provider clock)
    : config_(config)
    , logger_(std::move(logger))
    , formatter_(config.state.flapping_window, config.state.cooldown) {
    auto validation = config_.validate();
    if (validation.is_err()) {
        throw std::invalid_argument("Invalid watchdog configuration: " +
                                    validation.error().message);
    }

    state_ = std::make_shared<state_engine>(config_.state, logger_, std::move(clock));
    detector_ = std::make_shared<anomaly_detector>(config_.anomaly, logger_);
    dispatcher_ = std::make_shared<notification_dispatcher>(std::move(transport),
                                                            config_.notifications, logger_);
    scheduler_ = std::make_unique<check_scheduler>(state_, detector_, dispatcher_,
                                                   config_.scheduler, logger_);

    auto registered = scheduler_->register_checker(
        "resource", std::make_shared<resource_checker>(config_.thresholds));
    if (registered.is_err()) {
        throw std::invalid_argument("Failed to register resource checker: " +
                                    registered.error().message);
    }
}

watchdog_service::~watchdog_service() {
    if (running_.load()) {
        auto stopped = stop();
        if (stopped.is_err()) {
            log_error(logger_, "Failed to stop watchdog: " + stopped.error().message);
        }
    }
}

startup_summary watchdog_service::summarize() const {
    startup_summary summary;
    summary.services = scheduler_->targets(check_category::services).size();
    summary.endpoints = scheduler_->targets(check_category::endpoints).size();
    summary.resources = scheduler_->targets(check_category::resources).size();
    summary.tls = scheduler_->targets(check_category::tls).size();
    return summary;
}

result_void watchdog_service::start(bool warm_up) {
    if (running_.exchange(true)) {
        return make_void_error(watchdog_error_code::already_started,
                               "Watchdog is already running");
    }

    auto started = dispatcher_->start();
    if (started.is_err()) {
        running_.store(false);
        return started;
    }

    started = state_->start_auto_save();
    if (started.is_err()) {
        log_warning(logger_, "Auto-save not started: " + started.error().message);
    }

    dispatcher_->enqueue(formatter_.format_startup(summarize()));

    if (warm_up) {
        scheduler_->run_all_once();
    }

    started = scheduler_->start();
    if (started.is_err()) {
        log_error(logger_, "Scheduler failed to start: " + describe(started.error()));
        unwind_start();
        return started;
    }

    log_info(logger_, "Watchdog started");
    return make_void_success();
}

void watchdog_service::unwind_start() {
    if (state_->is_auto_saving()) {
        auto stopped = state_->stop_auto_save();
        if (stopped.is_err()) {
            log_error(logger_, "Failed to stop auto-save: " + describe(stopped.error()));
        }
    }
    auto stopped = dispatcher_->stop();
    if (stopped.is_err()) {
        log_error(logger_, "Failed to stop dispatcher: " + describe(stopped.error()));
    }
    running_.store(false);
}

result_void watchdog_service::stop() {
    if (!running_.exchange(false)) {
        return make_void_success();
    }

    // Shutdown saves state; the notice still goes out if that fails.
    auto persisted = scheduler_->shutdown();
    if (persisted.is_err()) {
        log_error(logger_, "Failed to persist state on shutdown: " +
                               describe(persisted.error()));
    }

    dispatcher_->enqueue(formatter_.format_shutdown());
    auto stopped = dispatcher_->stop();
    if (stopped.is_err()) {
        return stopped;
    }

    log_info(logger_, "Watchdog stopped");
    return persisted;
}

void watchdog_service::acknowledge(const std::string& service_id) {
    state_->acknowledge(service_id);
}

void watchdog_service::unacknowledge(const std::string& service_id) {
    state_->unacknowledge(service_id);
}

} // namespace kcenon::watchdog
