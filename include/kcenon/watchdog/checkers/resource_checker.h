#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file resource_checker.h
 * @brief Host disk, memory and CPU usage probe
 *
 * The target name selects the resource ("disk", "ram", "cpu"). A resource is
 * unhealthy once its usage reaches the configured threshold. Result metadata
 * always carries "usage" and "threshold" as whole percentages.
 */

#include "service_checker.h"
#include "../core/result_types.h"

#include <chrono>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>

namespace kcenon { namespace watchdog {

/**
 * @struct resource_thresholds
 * @brief Usage percentages at which a resource is reported unhealthy
 */
struct resource_thresholds {
    double disk = 85.0;
    double ram = 90.0;
    double cpu = 95.0;

    result_void validate() const {
        auto in_range = [](double v) { return v > 0.0 && v <= 100.0; };
        if (!in_range(disk) || !in_range(ram) || !in_range(cpu)) {
            return make_result_void(watchdog_error_code::invalid_configuration,
                                    "Resource thresholds must be within (0, 100]");
        }
        return make_void_success();
    }
};

/**
 * @struct cpu_times
 * @brief Aggregate jiffies from the first line of /proc/stat
 */
struct cpu_times {
    std::uint64_t idle = 0;
    std::uint64_t total = 0;
};

class resource_checker : public service_checker {
public:
    /**
     * @param thresholds Usage limits per resource
     * @param cpu_sample_interval Gap between the two /proc/stat reads
     * @throws std::invalid_argument if the thresholds do not validate
     */
    explicit resource_checker(const resource_thresholds& thresholds = {},
                              std::chrono::milliseconds cpu_sample_interval =
                                  std::chrono::milliseconds(250));

    check_result check(const check_target& target) override;

    std::string name() const override { return "resource"; }

    const resource_thresholds& thresholds() const { return thresholds_; }

    /**
     * @brief Used space of the filesystem holding path, in percent
     */
    static std::optional<double> disk_usage_percent(const std::string& path);

    static std::optional<double> memory_usage_percent(const std::string& meminfo_path = "/proc/meminfo");

    std::optional<double> cpu_usage_percent(const std::string& stat_path = "/proc/stat") const;

    /**
     * @brief Memory usage from /proc/meminfo content (MemTotal, MemAvailable)
     */
    static std::optional<double> parse_meminfo(std::istream& input);

    /**
     * @brief Parse the aggregate "cpu" line of /proc/stat
     */
    static std::optional<cpu_times> parse_cpu_line(const std::string& line);

    /**
     * @brief Build the verdict for a measured usage
     */
    static check_result evaluate(const std::string& label, double usage, double threshold);

private:
    resource_thresholds thresholds_;
    std::chrono::milliseconds cpu_sample_interval_;
};

} } // namespace kcenon::watchdog
