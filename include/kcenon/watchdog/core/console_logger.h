#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file console_logger.h
 * @brief Timestamped console implementation of common_system's ILogger
 *
 * Messages below warning go to stdout, warnings and errors to stderr. Safe to
 * share between the scheduler, dispatcher and auto-save threads.
 */

#include "logging.h"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>

namespace kcenon { namespace watchdog {

class console_logger : public common::interfaces::ILogger {
public:
    explicit console_logger(log_level min_level = log_level::info);

    common::VoidResult log(log_level level, const std::string& message) override;

    common::VoidResult log(log_level level, const std::string& message,
                           const std::string& file, int line,
                           const std::string& function) override;

    common::VoidResult log(const common::interfaces::log_entry& entry) override;

    bool is_enabled(log_level level) const override;

    common::VoidResult set_level(log_level level) override;

    log_level get_level() const override;

    common::VoidResult flush() override;

    /**
     * @brief Number of messages written since construction
     */
    size_t message_count() const { return message_count_.load(); }

private:
    std::atomic<log_level> min_level_;
    std::atomic<size_t> message_count_{0};
    std::mutex output_mutex_;
};

} } // namespace kcenon::watchdog
