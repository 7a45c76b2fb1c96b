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

#include "kcenon/watchdog/anomaly/anomaly_detector.h"
#include "kcenon/watchdog/utils/json_document.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace kcenon::watchdog {

namespace {

std::string format_ms(double value) {
    std::ostringstream oss;
    oss.precision(1);
    oss << std::fixed << value << "ms";
    return oss.str();
}

}  // namespace

anomaly_detector::anomaly_detector(const anomaly_detector_config& config, logger_ptr logger)
    : config_(config)
    , logger_(std::move(logger)) {
    auto validation = config_.validate();
    if (validation.is_err()) {
        throw std::invalid_argument("Invalid anomaly_detector configuration: " +
                                    validation.error().message);
    }
}

void anomaly_detector::record(const std::string& service_id, double sample_ms) {
    if (!config_.enabled) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(service_id);
    if (it == buffers_.end()) {
        it = buffers_.emplace(service_id, ring_buffer<double>(config_.sample_size)).first;
    }
    it->second.push(sample_ms);
}

anomaly_result anomaly_detector::check(const std::string& service_id, double sample_ms) const {
    anomaly_result result;
    result.response_time = sample_ms;
    result.multiplier = config_.multiplier;
    result.samples_needed = config_.min_samples;

    if (!config_.enabled) {
        result.reason = "detection disabled";
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = buffers_.find(service_id);
        if (it == buffers_.end() || it->second.count() < config_.min_samples) {
            result.reason = "insufficient samples";
            result.samples = it == buffers_.end() ? 0 : it->second.count();
            return result;
        }

        auto summary = it->second.statistics();
        result.samples = summary.count;
        result.median = summary.median;
        result.average = summary.mean;
    }

    result.threshold = result.median * config_.multiplier;
    if (result.median > 0.0) {
        result.deviation = sample_ms / result.median;
        result.is_anomaly = sample_ms > result.threshold;
    }

    if (result.is_anomaly) {
        std::ostringstream oss;
        oss.precision(1);
        oss << "Anomaly detected for " << service_id << ": " << format_ms(sample_ms)
            << " vs median " << format_ms(result.median) << " (" << std::fixed
            << result.deviation << "x)";
        log_warning(logger_, oss.str());
    }

    return result;
}

latency_stats anomaly_detector::make_stats(const ring_buffer<double>& buffer) const {
    auto summary = buffer.statistics();
    latency_stats stats;
    stats.samples = summary.count;
    stats.median = summary.median;
    stats.average = summary.mean;
    stats.min = summary.min;
    stats.max = summary.max;
    stats.values = buffer.values();
    return stats;
}

std::optional<latency_stats> anomaly_detector::get_stats(const std::string& service_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(service_id);
    if (it == buffers_.end()) {
        return std::nullopt;
    }
    return make_stats(it->second);
}

std::vector<std::string> anomaly_detector::tracked_services() const {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ids.reserve(buffers_.size());
        for (const auto& [id, buffer] : buffers_) {
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void anomaly_detector::clear_history(const std::string& service_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffers_.erase(service_id);
}

void anomaly_detector::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffers_.clear();
}

anomaly_summary anomaly_detector::get_summary() const {
    anomaly_summary summary;
    summary.enabled = config_.enabled;
    summary.multiplier = config_.multiplier;
    summary.sample_size = config_.sample_size;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, buffer] : buffers_) {
        summary.services.emplace(id, make_stats(buffer));
    }
    return summary;
}

anomaly_snapshot anomaly_detector::export_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    anomaly_snapshot snapshot;
    for (const auto& [id, buffer] : buffers_) {
        snapshot.emplace(id, buffer.snapshot());
    }
    return snapshot;
}

size_t anomaly_detector::import_snapshot(const anomaly_snapshot& snapshot) {
    size_t restored = 0;
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, entry] : snapshot) {
        auto rebuilt = ring_buffer<double>::from_snapshot(entry);
        if (rebuilt.is_err()) {
            log_warning(logger_, "Skipping latency history for " + id + ": " +
                                     rebuilt.error().message);
            continue;
        }
        buffers_.insert_or_assign(id, std::move(rebuilt.value()));
        ++restored;
    }
    return restored;
}

std::string anomaly_detector::export_json() const {
    Json::Value root(Json::objectValue);
    for (const auto& [id, entry] : export_snapshot()) {
        Json::Value item(Json::objectValue);
        item["capacity"] = static_cast<Json::UInt64>(entry.capacity);
        Json::Value values(Json::arrayValue);
        for (double v : entry.values) {
            values.append(v);
        }
        item["values"] = values;
        root[id] = item;
    }
    return write_json(root);
}

result<size_t> anomaly_detector::import_json(const std::string& document) {
    auto parsed = parse_json(document);
    if (parsed.is_err()) {
        return make_error<size_t>(watchdog_error_code::snapshot_invalid,
                                  parsed.error().message);
    }

    const Json::Value& root = parsed.value();
    if (!root.isObject()) {
        return make_error<size_t>(watchdog_error_code::snapshot_invalid,
                                  "Anomaly snapshot must be a JSON object");
    }

    anomaly_snapshot snapshot;
    for (const auto& id : root.getMemberNames()) {
        const Json::Value& item = root[id];
        if (!item.isObject() || !item["capacity"].isUInt64() || !item["values"].isArray()) {
            log_warning(logger_, "Skipping malformed latency history for " + id);
            continue;
        }

        const Json::UInt64 capacity = item["capacity"].asUInt64();
        if (capacity == 0 || capacity > ring_buffer_max_capacity) {
            log_warning(logger_, "Skipping latency history with capacity " +
                                     std::to_string(capacity) + " for " + id);
            continue;
        }

        ring_buffer_snapshot<double> entry;
        entry.capacity = static_cast<size_t>(capacity);
        bool valid = true;
        for (const auto& v : item["values"]) {
            if (!v.isNumeric()) {
                valid = false;
                break;
            }
            entry.values.push_back(v.asDouble());
        }
        if (!valid) {
            log_warning(logger_, "Skipping latency history with non-numeric samples for " + id);
            continue;
        }
        snapshot.emplace(id, std::move(entry));
    }

    size_t restored = import_snapshot(snapshot);
    log_info(logger_, "Anomaly detector state restored (" + std::to_string(restored) +
                          " services)");
    return make_success(restored);
}

result_void anomaly_detector::save_to_file(const std::string& path) const {
    return write_text_file_atomic(path, export_json());
}

result<size_t> anomaly_detector::load_from_file(const std::string& path) {
    auto content = read_text_file(path);
    if (content.is_err()) {
        return make_error<size_t>(static_cast<watchdog_error_code>(content.error().code),
                                  content.error().message);
    }
    return import_json(content.value());
}

} // namespace kcenon::watchdog
