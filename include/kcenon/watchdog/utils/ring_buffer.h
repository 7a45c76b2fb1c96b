#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file ring_buffer.h
 * @brief Fixed-capacity rolling sample store
 *
 * The buffer holds the most recent `capacity` samples. Once full, each push
 * overwrites the oldest one. Readout is always chronological.
 *
 * The buffer itself is not synchronized; owners that share it between
 * threads (the anomaly detector) guard it with their own mutex.
 */

#include "../core/result_types.h"
#include "../core/error_codes.h"
#include "statistics.h"

#include <cstddef>
#include <new>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace kcenon { namespace watchdog {

/// Storage is allocated up front, so capacities above this are refused.
inline constexpr size_t ring_buffer_max_capacity = 1u << 20;

/**
 * @struct ring_buffer_config
 * @brief Configuration for a ring buffer
 */
struct ring_buffer_config {
    size_t capacity = 20;

    result_void validate() const {
        if (capacity == 0) {
            return make_result_void(watchdog_error_code::invalid_capacity,
                                    "Ring buffer capacity must be positive");
        }
        if (capacity > ring_buffer_max_capacity) {
            return make_result_void(watchdog_error_code::invalid_capacity,
                                    "Ring buffer capacity exceeds " +
                                        std::to_string(ring_buffer_max_capacity));
        }
        return make_void_success();
    }
};

/**
 * @struct ring_buffer_snapshot
 * @brief Serializable form of a ring buffer: capacity plus ordered values
 */
template <typename T>
struct ring_buffer_snapshot {
    size_t capacity = 0;
    std::vector<T> values;
};

namespace detail {

/**
 * @brief Calculate ring buffer storage index from a chronological index
 * @param logical_index Chronological index (0 = oldest)
 * @param cursor Next write position
 * @param count Current element count
 * @param capacity Buffer capacity
 * @internal
 */
inline size_t ring_buffer_index(size_t logical_index, size_t cursor,
                                size_t count, size_t capacity) noexcept {
    if (count < capacity) {
        return logical_index;
    }
    return (cursor + logical_index) % capacity;
}

}  // namespace detail

/**
 * @class ring_buffer
 * @brief Rolling window of numeric samples with order-preserving readout
 * @tparam T Sample type (must be arithmetic)
 *
 * Invariant: count() == min(total pushes, capacity()).
 */
template <typename T = double>
class ring_buffer {
    static_assert(std::is_arithmetic_v<T>, "T must be an arithmetic type");

  public:
    /**
     * @throws std::invalid_argument when capacity is zero or above
     *         ring_buffer_max_capacity
     */
    explicit ring_buffer(size_t capacity) : ring_buffer(ring_buffer_config{capacity}) {}

    explicit ring_buffer(const ring_buffer_config& config) : capacity_(config.capacity) {
        auto validation = config.validate();
        if (validation.is_err()) {
            throw std::invalid_argument("Invalid ring_buffer configuration: " +
                                        validation.error().message);
        }
        storage_.resize(capacity_);
    }

    /**
     * @brief Append a sample, overwriting the oldest once full
     */
    void push(T value) noexcept {
        storage_[cursor_] = value;
        cursor_ = (cursor_ + 1) % capacity_;
        if (count_ < capacity_) {
            ++count_;
        }
    }

    /**
     * @brief All held samples, oldest first
     */
    std::vector<T> values() const {
        std::vector<T> result;
        result.reserve(count_);
        for (size_t i = 0; i < count_; ++i) {
            result.push_back(storage_[detail::ring_buffer_index(i, cursor_, count_, capacity_)]);
        }
        return result;
    }

    size_t count() const noexcept { return count_; }
    size_t capacity() const noexcept { return capacity_; }
    size_t cursor() const noexcept { return cursor_; }
    bool empty() const noexcept { return count_ == 0; }
    bool full() const noexcept { return count_ == capacity_; }

    void clear() noexcept {
        cursor_ = 0;
        count_ = 0;
    }

    T median() const { return stats::median(values()); }
    T mean() const { return stats::mean(values()); }
    T min() const { return stats::min_of(values()); }
    T max() const { return stats::max_of(values()); }

    stats::statistics<T> statistics() const { return stats::compute(values()); }

    ring_buffer_snapshot<T> snapshot() const {
        return ring_buffer_snapshot<T>{capacity_, values()};
    }

    /**
     * @brief Rebuild a buffer from its snapshot
     *
     * Values are replayed oldest first, so a snapshot holding more values
     * than its capacity keeps only the newest ones.
     */
    static result<ring_buffer<T>> from_snapshot(const ring_buffer_snapshot<T>& snapshot) {
        auto validation = ring_buffer_config{snapshot.capacity}.validate();
        if (validation.is_err()) {
            return make_error<ring_buffer<T>>(watchdog_error_code::snapshot_invalid,
                                              validation.error().message);
        }

        std::optional<ring_buffer<T>> rebuilt;
        try {
            rebuilt.emplace(snapshot.capacity);
        } catch (const std::bad_alloc&) {
            return make_error<ring_buffer<T>>(watchdog_error_code::snapshot_invalid,
                                              "Cannot allocate snapshot capacity " +
                                                  std::to_string(snapshot.capacity));
        }
        ring_buffer<T>& buffer = *rebuilt;
        for (const auto& value : snapshot.values) {
            buffer.push(value);
        }
        return make_success(std::move(buffer));
    }

  private:
    std::vector<T> storage_;
    size_t capacity_;
    size_t cursor_ = 0;
    size_t count_ = 0;
};

} } // namespace kcenon::watchdog
