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

#include "kcenon/watchdog/checkers/resource_checker.h"

#if defined(__linux__)
#include <sys/statvfs.h>
#endif

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace kcenon::watchdog {

namespace {

std::string format_percent(double value) {
    return std::to_string(static_cast<long long>(std::lround(value)));
}

}  // namespace

resource_checker::resource_checker(const resource_thresholds& thresholds,
                                   std::chrono::milliseconds cpu_sample_interval)
    : thresholds_(thresholds)
    , cpu_sample_interval_(cpu_sample_interval) {
    auto validation = thresholds_.validate();
    if (validation.is_err()) {
        throw std::invalid_argument("Invalid resource_checker configuration: " +
                                    validation.error().message);
    }
}

check_result resource_checker::check(const check_target& target) {
    const auto start = std::chrono::steady_clock::now();

    std::optional<double> usage;
    std::string label;
    double threshold = 0.0;

    if (target.name == "disk") {
        auto it = target.options.find("path");
        usage = disk_usage_percent(it != target.options.end() ? it->second : "/");
        label = "Disk";
        threshold = thresholds_.disk;
    } else if (target.name == "ram") {
        usage = memory_usage_percent();
        label = "RAM";
        threshold = thresholds_.ram;
    } else if (target.name == "cpu") {
        usage = cpu_usage_percent();
        label = "CPU";
        threshold = thresholds_.cpu;
    } else {
        return check_result::failed("Unknown resource: " + target.name);
    }

    if (!usage) {
        return check_result::failed(label + " usage unavailable");
    }

    auto result = evaluate(label, *usage, threshold);
    result.response_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    return result;
}

check_result resource_checker::evaluate(const std::string& label, double usage, double threshold) {
    check_result result;
    const auto rounded = static_cast<double>(std::lround(usage));
    result.healthy = rounded < threshold;
    result.metadata["usage"] = format_percent(rounded);
    result.metadata["threshold"] = format_percent(threshold);
    if (!result.healthy) {
        result.error = label + " usage at " + format_percent(rounded) +
                       "% (threshold: " + format_percent(threshold) + "%)";
    }
    return result;
}

std::optional<double> resource_checker::disk_usage_percent(const std::string& path) {
#if defined(__linux__)
    struct statvfs stat;
    if (statvfs(path.c_str(), &stat) != 0) {
        return std::nullopt;
    }

    const double total = static_cast<double>(stat.f_blocks) * stat.f_frsize;
    if (total <= 0.0) {
        return std::nullopt;
    }
    // Same convention as df: used / (used + available to unprivileged users)
    const double used = static_cast<double>(stat.f_blocks - stat.f_bfree) * stat.f_frsize;
    const double avail = static_cast<double>(stat.f_bavail) * stat.f_frsize;
    if (used + avail <= 0.0) {
        return std::nullopt;
    }
    return 100.0 * used / (used + avail);
#else
    (void)path;
    return std::nullopt;
#endif
}

std::optional<double> resource_checker::memory_usage_percent(const std::string& meminfo_path) {
    std::ifstream file(meminfo_path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    return parse_meminfo(file);
}

std::optional<double> resource_checker::parse_meminfo(std::istream& input) {
    std::optional<double> total;
    std::optional<double> available;

    std::string line;
    while (std::getline(input, line)) {
        std::istringstream iss(line);
        std::string key;
        double value = 0.0;
        if (!(iss >> key >> value)) {
            continue;
        }
        if (key == "MemTotal:") {
            total = value;
        } else if (key == "MemAvailable:") {
            available = value;
        }
        if (total && available) {
            break;
        }
    }

    if (!total || !available || *total <= 0.0) {
        return std::nullopt;
    }
    return 100.0 * (*total - *available) / *total;
}

std::optional<cpu_times> resource_checker::parse_cpu_line(const std::string& line) {
    std::istringstream iss(line);
    std::string label;
    if (!(iss >> label) || label != "cpu") {
        return std::nullopt;
    }

    // user nice system idle iowait irq softirq steal
    cpu_times times;
    std::uint64_t value = 0;
    size_t index = 0;
    while (iss >> value && index < 8) {
        times.total += value;
        if (index == 3 || index == 4) {
            times.idle += value;
        }
        ++index;
    }

    if (index < 4) {
        return std::nullopt;
    }
    return times;
}

std::optional<double> resource_checker::cpu_usage_percent(const std::string& stat_path) const {
    auto sample = [&stat_path]() -> std::optional<cpu_times> {
        std::ifstream file(stat_path);
        std::string line;
        if (!file.is_open() || !std::getline(file, line)) {
            return std::nullopt;
        }
        return parse_cpu_line(line);
    };

    auto first = sample();
    if (!first) {
        return std::nullopt;
    }
    std::this_thread::sleep_for(cpu_sample_interval_);
    auto second = sample();
    if (!second || second->total <= first->total) {
        return std::nullopt;
    }

    const double total_delta = static_cast<double>(second->total - first->total);
    const double idle_delta = static_cast<double>(second->idle - first->idle);
    return std::clamp(100.0 * (total_delta - idle_delta) / total_delta, 0.0, 100.0);
}

} // namespace kcenon::watchdog
