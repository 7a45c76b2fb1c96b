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

#include "kcenon/watchdog/core/console_logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace kcenon::watchdog {

console_logger::console_logger(log_level min_level)
    : min_level_(min_level) {}

common::VoidResult console_logger::log(log_level level, const std::string& message) {
    if (!is_enabled(level)) {
        return common::ok();
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000;

    // Thread-safe time conversion
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostream& out = static_cast<int>(level) >= static_cast<int>(log_level::warning)
                            ? std::cerr
                            : std::cout;

    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        out << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setw(3) << std::setfill('0') << ms << std::setfill(' ')
            << "] [" << to_string(level) << "] " << message << '\n';
    }

    message_count_++;
    return common::ok();
}

common::VoidResult console_logger::log(log_level level, const std::string& message,
                                       const std::string& file, int line,
                                       const std::string& function) {
    return log(level, message + " [" + file + ":" + std::to_string(line) + " " + function + "]");
}

common::VoidResult console_logger::log(const common::interfaces::log_entry& entry) {
    return log(entry.level, entry.message, entry.file, entry.line, entry.function);
}

bool console_logger::is_enabled(log_level level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_.load());
}

common::VoidResult console_logger::set_level(log_level level) {
    min_level_.store(level);
    return common::ok();
}

log_level console_logger::get_level() const {
    return min_level_.load();
}

common::VoidResult console_logger::flush() {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << std::flush;
    std::cerr << std::flush;
    return common::ok();
}

} // namespace kcenon::watchdog
