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

#include "kcenon/watchdog/scheduler/check_scheduler.h"

#include <exception>
#include <future>
#include <stdexcept>

namespace kcenon::watchdog {

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

check_scheduler::check_scheduler(std::shared_ptr<state_engine> state,
                                 std::shared_ptr<anomaly_detector> detector,
                                 std::shared_ptr<notification_dispatcher> dispatcher,
                                 const scheduler_config& config,
                                 logger_ptr logger)
    : state_(std::move(state))
    , detector_(std::move(detector))
    , dispatcher_(std::move(dispatcher))
    , config_(config)
    , logger_(std::move(logger))
    , formatter_(state_ ? message_formatter(state_->config().flapping_window,
                                            state_->config().cooldown)
                        : message_formatter()) {
    if (!state_ || !detector_ || !dispatcher_) {
        throw std::invalid_argument(
            "check_scheduler requires a state engine, anomaly detector and dispatcher");
    }
    auto validation = config_.validate();
    if (validation.is_err()) {
        throw std::invalid_argument("Invalid scheduler configuration: " +
                                    validation.error().message);
    }

    if (!config_.anomaly_snapshot_path.empty()) {
        auto restored = detector_->load_from_file(config_.anomaly_snapshot_path);
        if (restored.is_err()) {
            log_info(logger_, "No latency history restored from " +
                                  config_.anomaly_snapshot_path + ": " +
                                  restored.error().message);
        }
    }
}

check_scheduler::~check_scheduler() {
    if (running_.load()) {
        auto stopped = stop();
        if (stopped.is_err()) {
            log_error(logger_, "Failed to stop scheduler: " + stopped.error().message);
        }
    }
}

result_void check_scheduler::register_checker(const std::string& type,
                                              std::shared_ptr<service_checker> checker) {
    if (type.empty()) {
        return make_void_error(watchdog_error_code::invalid_argument,
                               "Checker type cannot be empty");
    }
    if (!checker) {
        return make_void_error(watchdog_error_code::invalid_argument,
                               "Checker cannot be null");
    }

    std::lock_guard<std::mutex> lock(checkers_mutex_);
    checkers_[type] = std::move(checker);
    return make_void_success();
}

bool check_scheduler::has_checker(const std::string& type) const {
    std::lock_guard<std::mutex> lock(checkers_mutex_);
    return checkers_.count(type) > 0;
}

std::shared_ptr<service_checker> check_scheduler::find_checker(const std::string& type) const {
    std::lock_guard<std::mutex> lock(checkers_mutex_);
    auto it = checkers_.find(type);
    return it != checkers_.end() ? it->second : nullptr;
}

result_void check_scheduler::add_target(check_category category, check_target target) {
    if (target.name.empty() && target.address.empty()) {
        return make_void_error(watchdog_error_code::invalid_argument,
                               "Target needs a name or an address");
    }
    if (category == check_category::tls && !starts_with(target.address, "https://")) {
        return make_void_error(watchdog_error_code::invalid_argument,
                               "TLS targets require an https:// address: " + target.address);
    }
    if (category == check_category::services && target.type.empty()) {
        return make_void_error(watchdog_error_code::invalid_argument,
                               "Service targets require a checker type: " + target.name);
    }
    if (category == check_category::endpoints && target.address.empty()) {
        target.address = target.name;
    }
    if (target.type.empty()) {
        target.type = resolve_type(category, target);
    }

    std::lock_guard<std::mutex> lock(targets_mutex_);
    targets_[category].push_back(std::move(target));
    return make_void_success();
}

std::vector<check_target> check_scheduler::targets(check_category category) const {
    std::lock_guard<std::mutex> lock(targets_mutex_);
    auto it = targets_.find(category);
    return it != targets_.end() ? it->second : std::vector<check_target>{};
}

std::string check_scheduler::resolve_type(check_category category, const check_target& target) {
    if (!target.type.empty()) {
        return target.type;
    }
    switch (category) {
        case check_category::endpoints: return "http";
        case check_category::resources: return "resource";
        case check_category::tls: return "ssl";
        case check_category::services:
        default: return "";
    }
}

std::string check_scheduler::make_service_id(check_category category,
                                             const check_target& target) {
    const std::string& address = target.address.empty() ? target.name : target.address;
    switch (category) {
        case check_category::endpoints: return "http:" + address;
        case check_category::tls: return "ssl:" + address;
        case check_category::resources: return "resource:" + target.name;
        case check_category::services:
        default: return resolve_type(category, target) + ":" + target.name;
    }
}

check_scheduler::target_outcome check_scheduler::check_target_once(check_category category,
                                                                   const check_target& target) {
    target_outcome outcome;
    const auto id = make_service_id(category, target);
    const auto type = resolve_type(category, target);

    auto checker = find_checker(type);
    if (!checker) {
        log_error(logger_, "No checker registered for type '" + type + "', skipping " + id);
        return outcome;
    }

    check_result result;
    try {
        result = checker->check(target);
    } catch (const std::exception& e) {
        log_error(logger_, "Check failed for " + id + ": " + e.what());
        return outcome;
    }

    outcome.sampled = true;
    outcome.healthy = result.healthy;
    outcome.alerts = handle_check_result(category, target, result);
    return outcome;
}

cycle_report check_scheduler::run_category(check_category category) {
    const auto start = std::chrono::steady_clock::now();
    const auto list = targets(category);

    cycle_report report;
    report.category = category;
    report.targets = list.size();

    std::vector<std::future<target_outcome>> pending;
    pending.reserve(list.size());
    for (const auto& target : list) {
        pending.push_back(std::async(std::launch::async, [this, category, target]() {
            return check_target_once(category, target);
        }));
    }

    for (size_t i = 0; i < pending.size(); ++i) {
        try {
            auto outcome = pending[i].get();
            if (!outcome.sampled) {
                report.no_sample++;
                continue;
            }
            report.checked++;
            if (!outcome.healthy) {
                report.unhealthy++;
            }
            report.alerts_emitted += outcome.alerts;
        } catch (const std::exception& e) {
            report.no_sample++;
            log_error(logger_, "Check task for " + make_service_id(category, list[i]) +
                                   " failed: " + e.what());
        }
    }

    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    cycles_completed_++;

    log_debug(logger_, "Checked " + std::to_string(report.checked) + "/" +
                           std::to_string(report.targets) + " " +
                           category_to_string(category) + " targets, " +
                           std::to_string(report.unhealthy) + " unhealthy, " +
                           std::to_string(report.alerts_emitted) + " alerts");
    return report;
}

std::vector<cycle_report> check_scheduler::run_all_once() {
    std::vector<cycle_report> reports;
    reports.reserve(all_check_categories.size());
    for (auto category : all_check_categories) {
        reports.push_back(run_category(category));
    }
    return reports;
}

size_t check_scheduler::handle_check_result(check_category category,
                                            const check_target& target,
                                            const check_result& result) {
    const auto id = make_service_id(category, target);
    const alert_subject subject{target.name.empty() ? target.address : target.name,
                                resolve_type(category, target)};
    size_t alerts = 0;

    std::lock_guard<std::mutex> lock(result_mutex_);

    const bool muted = state_->is_acknowledged(id);
    const auto previous = state_->get_failure(id);
    const bool was_healthy = !previous.has_value();

    if (was_healthy != result.healthy) {
        state_->record_state_change(id, result.healthy ? health_state::healthy
                                                       : health_state::unhealthy);
    }

    if (category == check_category::tls) {
        refresh_ssl_expiry(target, result);
    }

    if (!result.healthy) {
        const auto action = state_->record_failure(id, result.error);
        const auto flapping = state_->get_flapping_info(id);

        if (flapping.is_flapping) {
            if (!muted) {
                emit(id, formatter_.format_flapping(subject, flapping.transition_count));
                alerts++;
            }
        } else if (action != alert_action::suppressed) {
            if (!muted) {
                emit(id, failure_message(category, target, result, action));
                alerts++;
            }
        } else {
            log_debug(logger_, "Alert for " + id + " suppressed by cooldown");
        }
    } else if (previous) {
        auto recovery = state_->record_recovery(id);
        if (recovery) {
            state_->prune_flapping_history(id);
            if (config_.recovery_notify && !muted) {
                emit(id, formatter_.format_recovery(subject, *recovery));
                alerts++;
            }
        }
    }

    if (category == check_category::endpoints && result.healthy && result.response_time_ms) {
        const double sample = *result.response_time_ms;
        detector_->record(id, sample);
        const auto anomaly = detector_->check(id, sample);
        if (anomaly.is_anomaly && !muted) {
            emit(id, formatter_.format_performance(target.address, anomaly));
            alerts++;
        }
    }

    return alerts;
}

std::string check_scheduler::failure_message(check_category category,
                                             const check_target& target,
                                             const check_result& result,
                                             alert_action action) const {
    switch (category) {
        case check_category::tls:
            return formatter_.format_ssl_warning(target.address, result);
        case check_category::resources:
            return formatter_.format_resource_warning(target.name, result);
        default:
            return formatter_.format_service_down(
                alert_subject{target.name.empty() ? target.address : target.name,
                              resolve_type(category, target)},
                result, action);
    }
}

void check_scheduler::refresh_ssl_expiry(const check_target& target, const check_result& result) {
    auto it = result.metadata.find("expires_at");
    if (it == result.metadata.end()) {
        return;
    }
    std::optional<time_point> expires;
    try {
        expires = checked_from_epoch_ms(std::stoll(it->second));
    } catch (const std::exception& e) {
        log_warning(logger_, "Ignoring unparseable certificate expiry for " + target.address +
                                 ": " + e.what());
        return;
    }
    if (!expires) {
        log_warning(logger_, "Ignoring out-of-range certificate expiry for " + target.address +
                                 ": " + it->second);
        return;
    }
    state_->update_ssl_expiry(target.address, *expires);
}

void check_scheduler::emit(const std::string& service_id, std::string message) {
    log_info(logger_, "Alert queued for " + service_id);
    dispatcher_->enqueue(std::move(message));
}

result_void check_scheduler::start() {
    if (running_.exchange(true)) {
        return make_void_error(watchdog_error_code::already_started,
                               "Check scheduler is already running");
    }

    for (auto category : all_check_categories) {
        timer_threads_.emplace_back(&check_scheduler::timer_loop, this, category);
    }

    log_info(logger_, "Check scheduler started");
    return make_void_success();
}

result_void check_scheduler::stop() {
    if (!running_.load()) {
        return make_void_success();
    }

    running_.store(false);

    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }

    for (auto& thread : timer_threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    timer_threads_.clear();

    log_info(logger_, "Check scheduler stopped");
    return make_void_success();
}

void check_scheduler::timer_loop(check_category category) {
    active_timers_++;
    const auto interval = config_.interval_for(category);

    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(cv_mutex_);
            if (cv_.wait_for(lock, interval, [this] { return !running_.load(); })) {
                break;
            }
        }

        try {
            run_category(category);
        } catch (const std::exception& e) {
            log_error(logger_, "Scheduled " + category_to_string(category) +
                                   " run failed: " + e.what());
        }
    }

    active_timers_--;
}

scheduler_stats check_scheduler::get_stats() const {
    scheduler_stats stats;
    stats.running = running_.load();
    stats.active_timers = active_timers_.load();
    stats.cycles_completed = cycles_completed_.load();
    {
        std::lock_guard<std::mutex> lock(checkers_mutex_);
        stats.registered_checkers = checkers_.size();
    }
    {
        std::lock_guard<std::mutex> lock(targets_mutex_);
        for (const auto& [category, list] : targets_) {
            stats.total_targets += list.size();
        }
    }
    stats.state = state_->get_stats();
    stats.anomalies = detector_->get_summary();
    return stats;
}

result_void check_scheduler::shutdown() {
    auto stopped = stop();
    if (stopped.is_err()) {
        return stopped;
    }

    if (!config_.anomaly_snapshot_path.empty()) {
        auto saved = detector_->save_to_file(config_.anomaly_snapshot_path);
        if (saved.is_err()) {
            log_error(logger_, "Failed to save latency history: " + describe(saved.error()));
        }
    }

    return state_->shutdown();
}

} // namespace kcenon::watchdog
