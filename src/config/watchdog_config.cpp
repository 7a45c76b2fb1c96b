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

#include "kcenon/watchdog/config/watchdog_config.h"

#include <cstdlib>
#include <fstream>
#include <utility>

namespace kcenon::watchdog {

namespace {

using std::chrono::milliseconds;
using std::chrono::minutes;

struct env_mapping {
    const char* variable;
    const char* key;
    const char* suffix;
};

constexpr env_mapping ENV_MAPPINGS[] = {
    {"CHECK_INTERVAL_SERVICES", "intervals.services", "s"},
    {"CHECK_INTERVAL_ENDPOINTS", "intervals.endpoints", "s"},
    {"CHECK_INTERVAL_RESOURCES", "intervals.resources", "s"},
    {"CHECK_INTERVAL_SSL", "intervals.tls", "s"},
    {"DISK_THRESHOLD_PERCENT", "thresholds.disk", ""},
    {"RAM_THRESHOLD_PERCENT", "thresholds.ram", ""},
    {"CPU_THRESHOLD_PERCENT", "thresholds.cpu", ""},
    {"ALERT_COOLDOWN_MINUTES", "alerts.cooldown", "m"},
    {"RECOVERY_NOTIFY", "alerts.recovery_notify", ""},
    {"FLAPPING_THRESHOLD", "alerts.flapping_threshold", ""},
    {"FLAPPING_WINDOW_MINUTES", "alerts.flapping_window", "m"},
    {"ANOMALY_DETECTION_ENABLED", "anomaly.enabled", ""},
    {"ANOMALY_MULTIPLIER", "anomaly.multiplier", ""},
    {"ANOMALY_SAMPLE_SIZE", "anomaly.sample_size", ""},
    {"WATCHDOG_STATE_PATH", "state.path", ""},
};

}  // namespace

result_void watchdog_config::validate() const {
    auto check = state.validate();
    if (check.is_err()) {
        return check;
    }
    check = anomaly.validate();
    if (check.is_err()) {
        return check;
    }
    check = scheduler.validate();
    if (check.is_err()) {
        return check;
    }
    check = notifications.validate();
    if (check.is_err()) {
        return check;
    }
    return thresholds.validate();
}

result<watchdog_config> watchdog_config::from_config_map(const config_map& values) {
    watchdog_config config;

    auto& sched = config.scheduler;
    sched.services_interval =
        config_parser::get_duration(values, "intervals.services", sched.services_interval);
    sched.endpoints_interval =
        config_parser::get_duration(values, "intervals.endpoints", sched.endpoints_interval);
    sched.resources_interval =
        config_parser::get_duration(values, "intervals.resources", sched.resources_interval);
    sched.tls_interval = config_parser::get_duration(values, "intervals.ssl", sched.tls_interval);
    sched.tls_interval = config_parser::get_duration(values, "intervals.tls", sched.tls_interval);
    sched.recovery_notify =
        config_parser::get<bool>(values, "alerts.recovery_notify", sched.recovery_notify);
    sched.anomaly_snapshot_path =
        config_parser::get<std::string>(values, "state.anomaly_path", sched.anomaly_snapshot_path);

    auto& st = config.state;
    st.cooldown = config_parser::get_duration<minutes>(values, "alerts.cooldown", st.cooldown);
    st.flapping_threshold =
        config_parser::get<size_t>(values, "alerts.flapping_threshold", st.flapping_threshold);
    st.flapping_window =
        config_parser::get_duration<minutes>(values, "alerts.flapping_window", st.flapping_window);
    st.state_path = config_parser::get<std::string>(values, "state.path", st.state_path);
    st.auto_save_interval = config_parser::get_duration<milliseconds>(
        values, "state.auto_save_interval", st.auto_save_interval);

    auto& an = config.anomaly;
    an.enabled = config_parser::get<bool>(values, "anomaly.enabled", an.enabled);
    an.multiplier = config_parser::get<double>(values, "anomaly.multiplier", an.multiplier);
    an.sample_size = config_parser::get<size_t>(values, "anomaly.sample_size", an.sample_size);
    an.min_samples = config_parser::get<size_t>(values, "anomaly.min_samples", an.min_samples);

    auto& th = config.thresholds;
    th.disk = config_parser::get<double>(values, "thresholds.disk", th.disk);
    th.ram = config_parser::get<double>(values, "thresholds.ram", th.ram);
    th.cpu = config_parser::get<double>(values, "thresholds.cpu", th.cpu);

    auto& nt = config.notifications;
    nt.min_interval = config_parser::get_duration<milliseconds>(
        values, "notifications.min_interval", nt.min_interval);
    nt.drain_on_stop =
        config_parser::get<bool>(values, "notifications.drain_on_stop", nt.drain_on_stop);

    auto validation = config.validate();
    if (validation.is_err()) {
        return make_error<watchdog_config>(watchdog_error_code::invalid_configuration,
                                           validation.error().message);
    }
    return make_success(std::move(config));
}

config_map environment_overrides(const env_lookup& lookup) {
    config_map overrides;
    for (const auto& mapping : ENV_MAPPINGS) {
        const char* value = lookup ? lookup(mapping.variable) : std::getenv(mapping.variable);
        if (value == nullptr || *value == '\0') {
            continue;
        }
        overrides[mapping.key] = config_parser::trim(value) + mapping.suffix;
    }
    return overrides;
}

result<config_map> load_config_file(const std::string& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return make_error<config_map>(watchdog_error_code::invalid_configuration,
                                      "Cannot open configuration file: " + path);
    }

    config_map values;
    std::string section;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        line_number++;
        line = config_parser::trim(line);
        if (line.empty() || line.front() == '#' || line.front() == ';') {
            continue;
        }

        if (line.front() == '[') {
            if (line.back() != ']') {
                return make_error<config_map>(
                    watchdog_error_code::invalid_configuration,
                    path + ":" + std::to_string(line_number) + ": unterminated section header");
            }
            section = config_parser::trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto separator = line.find('=');
        if (separator == std::string::npos) {
            return make_error<config_map>(
                watchdog_error_code::invalid_configuration,
                path + ":" + std::to_string(line_number) + ": expected key = value");
        }

        auto key = config_parser::trim(line.substr(0, separator));
        auto value = config_parser::trim(line.substr(separator + 1));
        if (key.empty()) {
            return make_error<config_map>(
                watchdog_error_code::invalid_configuration,
                path + ":" + std::to_string(line_number) + ": empty key");
        }
        values[section.empty() ? key : section + "." + key] = value;
    }

    if (input.bad()) {
        return make_error<config_map>(watchdog_error_code::invalid_configuration,
                                      "Failed to read configuration file: " + path);
    }
    return make_success(std::move(values));
}

config_map merge_config(config_map base, const config_map& overrides) {
    for (const auto& [key, value] : overrides) {
        base[key] = value;
    }
    return base;
}

} // namespace kcenon::watchdog
