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

#include "kcenon/watchdog/state/state_engine.h"
#include "kcenon/watchdog/utils/json_document.h"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace kcenon::watchdog {

namespace {

struct state_document {
    std::unordered_map<std::string, failure_record> failures;
    std::unordered_map<std::string, std::vector<state_transition>> transitions;
    std::set<std::string> acknowledged;
    std::unordered_map<std::string, time_point> ssl_expiry;
};

Json::Value failure_to_json(const failure_record& record) {
    Json::Value item(Json::objectValue);
    item["first_seen"] = static_cast<Json::Int64>(to_epoch_ms(record.first_seen));
    item["last_alert_sent"] = static_cast<Json::Int64>(to_epoch_ms(record.last_alert_sent));
    item["error"] = record.error;
    item["consecutive_failures"] = static_cast<Json::UInt>(record.consecutive_failures);
    return item;
}

std::optional<failure_record> failure_from_json(const Json::Value& item) {
    if (!item.isObject() || !item["first_seen"].isInt64()) {
        return std::nullopt;
    }

    auto first_seen = checked_from_epoch_ms(item["first_seen"].asInt64());
    if (!first_seen) {
        return std::nullopt;
    }

    failure_record record;
    record.first_seen = *first_seen;
    record.last_alert_sent = record.first_seen;
    if (item["last_alert_sent"].isInt64()) {
        auto last_alert_sent = checked_from_epoch_ms(item["last_alert_sent"].asInt64());
        if (!last_alert_sent) {
            return std::nullopt;
        }
        record.last_alert_sent = *last_alert_sent;
    }
    record.error = item["error"].isString() ? item["error"].asString() : std::string();
    if (item["consecutive_failures"].isUInt() && item["consecutive_failures"].asUInt() > 0) {
        record.consecutive_failures = item["consecutive_failures"].asUInt();
    }
    return record;
}

std::optional<state_transition> transition_from_json(const Json::Value& item) {
    if (!item.isObject() || !item["time"].isInt64() || !item["state"].isString()) {
        return std::nullopt;
    }
    const std::string state = item["state"].asString();
    if (state != "healthy" && state != "unhealthy") {
        return std::nullopt;
    }
    auto time = checked_from_epoch_ms(item["time"].asInt64());
    if (!time) {
        return std::nullopt;
    }
    return state_transition{*time,
                            state == "healthy" ? health_state::healthy : health_state::unhealthy};
}

}  // namespace

state_engine::state_engine(const state_engine_config& config,
                           logger_ptr logger,
                           time_provider clock)
    : config_(config)
    , logger_(std::move(logger))
    , clock_(clock ? std::move(clock) : system_time_provider()) {
    auto validation = config_.validate();
    if (validation.is_err()) {
        throw std::invalid_argument("Invalid state_engine configuration: " +
                                    validation.error().message);
    }

    if (!config_.load_on_construct) {
        return;
    }

    auto loaded = load();
    if (loaded.is_ok()) {
        return;
    }
    if (loaded.error().code == static_cast<int>(watchdog_error_code::state_file_not_found)) {
        log_info(logger_, "No saved state at " + config_.state_path + ", starting fresh");
    } else {
        log_error(logger_, "Failed to load state from " + config_.state_path + ": " +
                               loaded.error().message + "; starting fresh");
    }
}

state_engine::~state_engine() {
    if (auto_save_running_.load()) {
        auto stopped = stop_auto_save();
        if (stopped.is_err()) {
            log_error(logger_, "Failed to stop auto-save: " + stopped.error().message);
        }
    }
}

alert_action state_engine::record_failure(const std::string& service_id,
                                          const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto current = now();

    auto it = failures_.find(service_id);
    if (it == failures_.end()) {
        failures_.emplace(service_id, failure_record{current, current, error, 1});
        log_debug(logger_, "First failure for " + service_id + ": " + error);
        return alert_action::first_failure;
    }

    auto& record = it->second;
    record.consecutive_failures++;
    record.error = error;

    if (current - record.last_alert_sent >= config_.cooldown) {
        record.last_alert_sent = current;
        return alert_action::ongoing_failure;
    }
    return alert_action::suppressed;
}

std::optional<recovery_info> state_engine::record_recovery(const std::string& service_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = failures_.find(service_id);
    if (it == failures_.end()) {
        return std::nullopt;
    }

    recovery_info info;
    info.downtime = std::chrono::duration_cast<std::chrono::milliseconds>(
        now() - it->second.first_seen);
    info.failures_seen = it->second.consecutive_failures;
    info.first_seen = it->second.first_seen;
    failures_.erase(it);

    log_info(logger_, service_id + " recovered after " +
                          std::to_string(info.failures_seen) + " failed checks");
    return info;
}

size_t state_engine::count_in_window(const std::vector<state_transition>& log,
                                     time_point current) const {
    return static_cast<size_t>(std::count_if(log.begin(), log.end(),
        [&](const state_transition& t) { return current - t.time < config_.flapping_window; }));
}

bool state_engine::record_state_change(const std::string& service_id, health_state new_state) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto current = now();

    auto& log = transitions_[service_id];
    log.push_back(state_transition{current, new_state});
    if (log.size() > config_.max_transitions) {
        log.erase(log.begin(), log.begin() + static_cast<std::ptrdiff_t>(
                                                 log.size() - config_.max_transitions));
    }

    bool flapping = count_in_window(log, current) >= config_.flapping_threshold;
    if (flapping) {
        log_warning(logger_, service_id + " is flapping (" +
                                 std::to_string(count_in_window(log, current)) +
                                 " state changes in window)");
    }
    return flapping;
}

bool state_engine::is_flapping(const std::string& service_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transitions_.find(service_id);
    if (it == transitions_.end()) {
        return false;
    }
    return count_in_window(it->second, now()) >= config_.flapping_threshold;
}

flapping_info state_engine::get_flapping_info(const std::string& service_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    flapping_info info;
    auto it = transitions_.find(service_id);
    if (it == transitions_.end()) {
        return info;
    }

    const auto current = now();
    for (const auto& t : it->second) {
        if (current - t.time < config_.flapping_window) {
            info.transitions.push_back(t);
        }
    }
    info.transition_count = info.transitions.size();
    info.is_flapping = info.transition_count >= config_.flapping_threshold;
    return info;
}

void state_engine::clear_flapping_history(const std::string& service_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    transitions_.erase(service_id);
}

void state_engine::prune_flapping_history(const std::string& service_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transitions_.find(service_id);
    if (it == transitions_.end()) {
        return;
    }

    const auto current = now();
    auto& log = it->second;
    log.erase(std::remove_if(log.begin(), log.end(),
                  [&](const state_transition& t) {
                      return current - t.time >= config_.flapping_window;
                  }),
              log.end());
    if (log.empty()) {
        transitions_.erase(it);
    }
}

void state_engine::acknowledge(const std::string& service_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        acknowledged_.insert(service_id);
    }
    log_info(logger_, "Service acknowledged: " + service_id);
}

void state_engine::unacknowledge(const std::string& service_id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        acknowledged_.erase(service_id);
    }
    log_info(logger_, "Service unacknowledged: " + service_id);
}

bool state_engine::is_acknowledged(const std::string& service_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return acknowledged_.count(service_id) > 0;
}

std::vector<std::string> state_engine::acknowledged_services() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(acknowledged_.begin(), acknowledged_.end());
}

std::optional<failure_record> state_engine::get_failure(const std::string& service_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = failures_.find(service_id);
    if (it == failures_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, failure_record> state_engine::get_all_failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::map<std::string, failure_record>(failures_.begin(), failures_.end());
}

void state_engine::update_ssl_expiry(const std::string& domain, time_point expires_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    ssl_expiry_[domain] = expires_at;
}

std::optional<time_point> state_engine::get_ssl_expiry(const std::string& domain) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = ssl_expiry_.find(domain);
    if (it == ssl_expiry_.end()) {
        return std::nullopt;
    }
    return it->second;
}

state_stats state_engine::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    state_stats stats;
    stats.total_failures = failures_.size();
    stats.acknowledged_services = acknowledged_.size();
    stats.tracked_ssl_certs = ssl_expiry_.size();

    const auto current = now();
    for (const auto& [id, log] : transitions_) {
        if (count_in_window(log, current) >= config_.flapping_threshold) {
            stats.flapping_services++;
        }
    }
    return stats;
}

std::string state_engine::export_json() const {
    Json::Value root(Json::objectValue);
    Json::Value failures(Json::objectValue);
    Json::Value flapping(Json::objectValue);
    Json::Value acknowledged(Json::arrayValue);
    Json::Value ssl_expiry(Json::objectValue);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, record] : failures_) {
            failures[id] = failure_to_json(record);
        }
        for (const auto& [id, log] : transitions_) {
            Json::Value items(Json::arrayValue);
            for (const auto& t : log) {
                Json::Value item(Json::objectValue);
                item["time"] = static_cast<Json::Int64>(to_epoch_ms(t.time));
                item["state"] = health_state_to_string(t.state);
                items.append(item);
            }
            flapping[id] = items;
        }
        for (const auto& id : acknowledged_) {
            acknowledged.append(id);
        }
        for (const auto& [domain, expires_at] : ssl_expiry_) {
            ssl_expiry[domain] = static_cast<Json::Int64>(to_epoch_ms(expires_at));
        }
    }

    root["failures"] = failures;
    root["flapping"] = flapping;
    root["acknowledged"] = acknowledged;
    root["ssl_expiry"] = ssl_expiry;
    root["last_saved"] = to_iso8601(now());
    return write_json(root);
}

result_void state_engine::import_json(const std::string& document) {
    auto parsed = parse_json(document);
    if (parsed.is_err()) {
        return make_void_error(watchdog_error_code::state_corrupted, parsed.error().message);
    }

    const Json::Value& root = parsed.value();
    if (!root.isObject()) {
        return make_void_error(watchdog_error_code::state_corrupted,
                               "State record must be a JSON object");
    }

    state_document doc;
    size_t skipped = 0;

    const Json::Value& failures = root["failures"];
    if (failures.isObject()) {
        for (const auto& id : failures.getMemberNames()) {
            auto record = failure_from_json(failures[id]);
            if (!record) {
                skipped++;
                continue;
            }
            doc.failures.emplace(id, *record);
        }
    }

    const Json::Value& flapping = root["flapping"];
    if (flapping.isObject()) {
        for (const auto& id : flapping.getMemberNames()) {
            const Json::Value& items = flapping[id];
            if (!items.isArray()) {
                skipped++;
                continue;
            }
            std::vector<state_transition> log;
            for (const auto& item : items) {
                auto t = transition_from_json(item);
                if (!t) {
                    skipped++;
                    continue;
                }
                log.push_back(*t);
            }
            if (log.size() > config_.max_transitions) {
                log.erase(log.begin(), log.begin() + static_cast<std::ptrdiff_t>(
                                                         log.size() - config_.max_transitions));
            }
            if (!log.empty()) {
                doc.transitions.emplace(id, std::move(log));
            }
        }
    }

    const Json::Value& acknowledged = root["acknowledged"];
    if (acknowledged.isArray()) {
        for (const auto& id : acknowledged) {
            if (!id.isString()) {
                skipped++;
                continue;
            }
            doc.acknowledged.insert(id.asString());
        }
    }

    const Json::Value& ssl_expiry = root["ssl_expiry"];
    if (ssl_expiry.isObject()) {
        for (const auto& domain : ssl_expiry.getMemberNames()) {
            auto expires = ssl_expiry[domain].isInt64()
                               ? checked_from_epoch_ms(ssl_expiry[domain].asInt64())
                               : std::nullopt;
            if (!expires) {
                skipped++;
                continue;
            }
            doc.ssl_expiry.emplace(domain, *expires);
        }
    }

    if (skipped > 0) {
        log_warning(logger_, "Skipped " + std::to_string(skipped) +
                                 " malformed entries while loading state");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    failures_ = std::move(doc.failures);
    transitions_ = std::move(doc.transitions);
    acknowledged_ = std::move(doc.acknowledged);
    ssl_expiry_ = std::move(doc.ssl_expiry);
    return make_void_success();
}

result_void state_engine::save() {
    std::lock_guard<std::mutex> save_lock(save_mutex_);

    auto written = write_text_file_atomic(config_.state_path, export_json());
    if (written.is_err()) {
        return written;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    last_saved_ = now();
    return make_void_success();
}

result_void state_engine::load() {
    auto content = read_text_file(config_.state_path);
    if (content.is_err()) {
        return make_void_error(static_cast<watchdog_error_code>(content.error().code),
                               content.error().message);
    }

    auto imported = import_json(content.value());
    if (imported.is_err()) {
        return imported;
    }

    auto stats = get_stats();
    log_info(logger_, "State loaded from " + config_.state_path + " (" +
                          std::to_string(stats.total_failures) + " failures, " +
                          std::to_string(stats.acknowledged_services) + " acknowledged)");
    return make_void_success();
}

std::optional<time_point> state_engine::last_saved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_saved_;
}

result_void state_engine::start_auto_save() {
    if (auto_save_running_.exchange(true)) {
        return make_void_error(watchdog_error_code::already_started,
                               "Auto-save is already running");
    }

    auto_save_thread_ = std::thread(&state_engine::auto_save_loop, this);
    return make_void_success();
}

result_void state_engine::stop_auto_save() {
    if (!auto_save_running_.load()) {
        return make_void_success();
    }

    auto_save_running_.store(false);

    {
        std::lock_guard<std::mutex> lock(cv_mutex_);
        cv_.notify_all();
    }

    if (auto_save_thread_.joinable()) {
        auto_save_thread_.join();
    }

    return make_void_success();
}

void state_engine::auto_save_loop() {
    while (auto_save_running_.load()) {
        {
            std::unique_lock<std::mutex> lock(cv_mutex_);
            cv_.wait_for(lock, config_.auto_save_interval,
                         [this] { return !auto_save_running_.load(); });
        }

        if (!auto_save_running_.load()) {
            break;
        }

        auto saved = save();
        if (saved.is_err()) {
            log_error(logger_, "Auto-save failed, retrying next interval: " +
                                   saved.error().message);
        }
    }
}

result_void state_engine::shutdown() {
    auto stopped = stop_auto_save();
    if (stopped.is_err()) {
        return stopped;
    }

    auto saved = save();
    if (saved.is_err()) {
        log_error(logger_, "Failed to save state on shutdown: " + describe(saved.error()));
        return saved;
    }

    log_info(logger_, "State saved to " + config_.state_path);
    return make_void_success();
}

} // namespace kcenon::watchdog
