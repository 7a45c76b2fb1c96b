#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file anomaly_detector.h
 * @brief Per-service latency anomaly detection against a median baseline
 *
 * Each tracked service owns a ring buffer of recent response times. A sample
 * is anomalous when it exceeds median * multiplier. The median keeps a single
 * slow outlier from shifting the baseline future samples are judged against.
 */

#include "../core/logging.h"
#include "../core/result_types.h"
#include "../utils/ring_buffer.h"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kcenon { namespace watchdog {

/**
 * @struct anomaly_detector_config
 * @brief Configuration for the anomaly detector
 */
struct anomaly_detector_config {
    bool enabled = true;
    double multiplier = 3.0;
    size_t sample_size = 20;
    size_t min_samples = 5;

    result_void validate() const {
        if (multiplier <= 0.0) {
            return make_result_void(watchdog_error_code::invalid_configuration,
                                    "Anomaly multiplier must be positive");
        }
        if (sample_size == 0 || sample_size > ring_buffer_max_capacity) {
            return make_result_void(watchdog_error_code::invalid_capacity,
                                    "Anomaly sample size must be within [1, " +
                                        std::to_string(ring_buffer_max_capacity) + "]");
        }
        if (min_samples == 0 || min_samples > sample_size) {
            return make_result_void(watchdog_error_code::invalid_configuration,
                                    "Minimum samples must be within [1, sample_size]");
        }
        return make_void_success();
    }
};

/**
 * @struct anomaly_result
 * @brief Outcome of checking one latency sample
 *
 * When is_anomaly is false, `reason` tells whether the detector had enough
 * data to judge ("detection disabled", "insufficient samples") or judged the
 * sample normal (empty reason).
 */
struct anomaly_result {
    bool is_anomaly = false;
    std::string reason;
    double response_time = 0.0;
    double median = 0.0;
    double average = 0.0;
    double threshold = 0.0;
    double multiplier = 0.0;
    double deviation = 0.0;
    size_t samples = 0;
    size_t samples_needed = 0;
};

/**
 * @struct latency_stats
 * @brief Summary of the samples held for one service
 */
struct latency_stats {
    size_t samples = 0;
    double median = 0.0;
    double average = 0.0;
    double min = 0.0;
    double max = 0.0;
    std::vector<double> values;
};

struct anomaly_summary {
    bool enabled = true;
    double multiplier = 0.0;
    size_t sample_size = 0;
    std::map<std::string, latency_stats> services;
};

using anomaly_snapshot = std::unordered_map<std::string, ring_buffer_snapshot<double>>;

/**
 * @class anomaly_detector
 * @brief Thread-safe map of service id to latency ring buffer
 *
 * All operations take the same mutex, so overlapping check cycles that touch
 * one service id never race on its buffer.
 */
class anomaly_detector {
public:
    /**
     * @throws std::invalid_argument if the configuration does not validate
     */
    explicit anomaly_detector(const anomaly_detector_config& config = {},
                              logger_ptr logger = nullptr);

    /**
     * @brief Record a latency sample. No-op while detection is disabled.
     */
    void record(const std::string& service_id, double sample_ms);

    /**
     * @brief Judge a sample against the recorded baseline
     *
     * Does not record the sample. Callers record first, then check.
     */
    anomaly_result check(const std::string& service_id, double sample_ms) const;

    std::optional<latency_stats> get_stats(const std::string& service_id) const;

    std::vector<std::string> tracked_services() const;

    void clear_history(const std::string& service_id);

    void clear_all();

    anomaly_summary get_summary() const;

    /**
     * @brief Copy every buffer as {capacity, ordered values}
     */
    anomaly_snapshot export_snapshot() const;

    /**
     * @brief Replace buffers for the ids present in the snapshot
     *
     * Entries that cannot be rebuilt are skipped with a warning.
     * @return Number of buffers restored
     */
    size_t import_snapshot(const anomaly_snapshot& snapshot);

    /**
     * @brief Serialize the snapshot as a JSON document
     */
    std::string export_json() const;

    /**
     * @brief Restore from a JSON document written by export_json()
     *
     * A document that is not a JSON object is an error. Malformed per-service
     * entries are skipped with a warning.
     * @return Number of buffers restored
     */
    result<size_t> import_json(const std::string& document);

    result_void save_to_file(const std::string& path) const;

    result<size_t> load_from_file(const std::string& path);

    const anomaly_detector_config& config() const { return config_; }

private:
    latency_stats make_stats(const ring_buffer<double>& buffer) const;

    anomaly_detector_config config_;
    logger_ptr logger_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ring_buffer<double>> buffers_;
};

} } // namespace kcenon::watchdog
