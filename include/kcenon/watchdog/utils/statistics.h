// BSD 3-Clause License
//
// Copyright (c) 2021-2025, watchdog_system contributors
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

/**
 * @file statistics.h
 * @brief Summary statistics over latency samples
 * @date 2025
 *
 * Every function returns zero for an empty input. Callers that need to tell
 * "no data" apart from a real zero must check the sample count first.
 */

#pragma once

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <type_traits>
#include <vector>

namespace kcenon {
namespace watchdog {
namespace stats {

/**
 * @struct statistics
 * @brief Statistical summary for a collection of values
 *
 * @tparam T The value type (must be arithmetic)
 */
template <typename T>
struct statistics {
    T min;
    T max;
    T mean;
    T median;
    T total;
    size_t count;
};

/**
 * @brief Calculate percentile from sorted values with linear interpolation
 *
 * @param sorted_values Vector of values in ascending order
 * @param percentile_value Percentile to calculate (0-100)
 *
 * @code
 * std::vector<double> values = {1.0, 2.0, 3.0, 4.0};
 * double p50 = percentile(values, 50.0);  // Returns 2.5
 * @endcode
 */
template <typename T>
T percentile(const std::vector<T>& sorted_values, double percentile_value) {
    static_assert(std::is_arithmetic_v<T>, "percentile requires an arithmetic type");
    if (sorted_values.empty()) {
        return T{0};
    }

    if (percentile_value <= 0.0) {
        return sorted_values.front();
    }

    if (percentile_value >= 100.0) {
        return sorted_values.back();
    }

    double rank = (percentile_value / 100.0) * static_cast<double>(sorted_values.size() - 1);
    size_t lower_idx = static_cast<size_t>(rank);
    size_t upper_idx = lower_idx + 1;

    if (upper_idx >= sorted_values.size()) {
        return sorted_values[lower_idx];
    }

    double fraction = rank - static_cast<double>(lower_idx);
    return static_cast<T>(sorted_values[lower_idx] +
                          fraction * (sorted_values[upper_idx] - sorted_values[lower_idx]));
}

/**
 * @brief Median of unsorted values
 *
 * Sorts a copy. An even count averages the two middle elements.
 */
template <typename T>
T median(std::vector<T> values) {
    if (values.empty()) {
        return T{0};
    }
    std::sort(values.begin(), values.end());
    return percentile(values, 50.0);
}

template <typename T>
T mean(const std::vector<T>& values) {
    if (values.empty()) {
        return T{0};
    }
    T total = std::accumulate(values.begin(), values.end(), T{0});
    return total / static_cast<T>(values.size());
}

template <typename T>
T min_of(const std::vector<T>& values) {
    if (values.empty()) {
        return T{0};
    }
    return *std::min_element(values.begin(), values.end());
}

template <typename T>
T max_of(const std::vector<T>& values) {
    if (values.empty()) {
        return T{0};
    }
    return *std::max_element(values.begin(), values.end());
}

/**
 * @brief Compute the full summary from unsorted values in one sort
 */
template <typename T>
statistics<T> compute(const std::vector<T>& values) {
    statistics<T> result{};
    if (values.empty()) {
        return result;
    }

    std::vector<T> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    result.count = sorted.size();
    result.min = sorted.front();
    result.max = sorted.back();
    result.total = std::accumulate(sorted.begin(), sorted.end(), T{0});
    result.mean = result.total / static_cast<T>(result.count);
    result.median = percentile(sorted, 50.0);
    return result;
}

}  // namespace stats
}  // namespace watchdog
}  // namespace kcenon
