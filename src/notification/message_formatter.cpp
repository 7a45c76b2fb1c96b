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

#include "kcenon/watchdog/notification/message_formatter.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>

namespace kcenon::watchdog {

namespace {

constexpr const char* RED_MARKER = "\xF0\x9F\x94\xB4";      // red circle
constexpr const char* GREEN_MARKER = "\xF0\x9F\x9F\xA2";    // green circle
constexpr const char* WARNING_MARKER = "\xE2\x9A\xA0\xEF\xB8\x8F";  // warning sign
constexpr const char* FLAPPING_MARKER = "\xE2\x9A\xA1";     // high voltage
constexpr const char* WATCHDOG_MARKER = "\xF0\x9F\x90\x95";  // dog

std::string metadata_value(const check_result& result, const std::string& key) {
    auto it = result.metadata.find(key);
    return it != result.metadata.end() ? it->second : std::string();
}

double metadata_number(const check_result& result, const std::string& key) {
    auto value = metadata_value(result, key);
    if (value.empty()) {
        return 0.0;
    }
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return 0.0;
    }
}

std::string format_date(time_point tp) {
    auto time = wall_clock::to_time_t(tp);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time);
#else
    gmtime_r(&time, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d");
    return oss.str();
}

}  // namespace

std::string message_formatter::format_service_down(const alert_subject& subject,
                                                   const check_result& result,
                                                   alert_action action) const {
    const bool first = action == alert_action::first_failure;

    std::ostringstream oss;
    oss << (first ? RED_MARKER : WARNING_MARKER) << ' '
        << (first ? "SERVICE DOWN" : "SERVICE STILL DOWN") << "\n\n";
    oss << "Service: " << subject.name << '\n';
    oss << "Type: " << subject.type << '\n';
    oss << "Error: " << result.error << '\n';

    auto status = metadata_value(result, "status");
    if (!status.empty()) {
        oss << "Status: " << status << '\n';
    }
    if (result.metadata.count("restarts") > 0) {
        oss << "Restarts: " << metadata_value(result, "restarts") << '\n';
    }
    return oss.str();
}

std::string message_formatter::format_recovery(const alert_subject& subject,
                                               const recovery_info& recovery) const {
    std::ostringstream oss;
    oss << GREEN_MARKER << " SERVICE RECOVERED\n\n";
    oss << "Service: " << subject.name << '\n';
    oss << "Type: " << subject.type << '\n';
    oss << "Downtime: " << format_duration(recovery.downtime) << '\n';
    oss << "Failures: " << recovery.failures_seen << '\n';
    return oss.str();
}

std::string message_formatter::format_performance(const std::string& endpoint,
                                                  const anomaly_result& anomaly) const {
    std::ostringstream oss;
    oss << WARNING_MARKER << " PERFORMANCE DEGRADATION\n\n";
    oss << "Endpoint: " << endpoint << '\n';
    oss << "Current: " << std::lround(anomaly.response_time) << "ms\n";
    oss << "Normal: " << std::lround(anomaly.median) << "ms\n";
    oss << "Slowdown: " << std::fixed << std::setprecision(1) << anomaly.deviation
        << "x slower\n";
    return oss.str();
}

std::string message_formatter::format_flapping(const alert_subject& subject,
                                               size_t transition_count) const {
    std::ostringstream oss;
    oss << FLAPPING_MARKER << " SERVICE FLAPPING\n\n";
    oss << "Service: " << subject.name << '\n';
    oss << "Type: " << subject.type << '\n';
    oss << "Changes: " << transition_count << " in last " << flapping_window_.count()
        << " minutes\n\n";
    oss << "Service is unstable.\n";
    oss << "Further alerts suppressed for " << cooldown_.count() << " minutes.";
    return oss.str();
}

std::string message_formatter::format_resource_warning(const std::string& resource,
                                                       const check_result& result) const {
    const double usage = metadata_number(result, "usage");
    std::string upper = resource;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::ostringstream oss;
    oss << (usage >= 95.0 ? RED_MARKER : WARNING_MARKER) << ' ' << upper << " WARNING\n\n";
    oss << upper << " usage: " << metadata_value(result, "usage") << "%\n";
    oss << "Threshold: " << metadata_value(result, "threshold") << "%\n";
    return oss.str();
}

std::string message_formatter::format_ssl_warning(const std::string& domain,
                                                  const check_result& result) const {
    const double days = metadata_number(result, "days_remaining");

    std::ostringstream oss;
    oss << (days < 7.0 ? RED_MARKER : WARNING_MARKER) << " SSL CERTIFICATE EXPIRING\n\n";
    oss << "Domain: " << domain << '\n';
    oss << "Days remaining: " << metadata_value(result, "days_remaining") << '\n';

    auto expires = metadata_value(result, "expires_at");
    if (!expires.empty()) {
        std::optional<time_point> when;
        try {
            when = checked_from_epoch_ms(std::stoll(expires));
        } catch (const std::exception&) {
            when = std::nullopt;
        }
        oss << "Expires: " << (when ? format_date(*when) : expires) << '\n';
    }
    if (!result.error.empty()) {
        oss << "Error: " << result.error << '\n';
    }
    oss << "\nAction required: Renew certificate";
    return oss.str();
}

std::string message_formatter::format_startup(const startup_summary& summary) const {
    std::ostringstream oss;
    oss << WATCHDOG_MARKER << " WATCHDOG STARTED\n\n";
    oss << "Monitoring " << (summary.services + summary.endpoints) << " services:\n";
    oss << "\xE2\x80\xA2 Services: " << summary.services << '\n';
    oss << "\xE2\x80\xA2 Endpoints: " << summary.endpoints << '\n';
    oss << "\xE2\x80\xA2 Resources: " << summary.resources << '\n';
    oss << "\xE2\x80\xA2 Certificates: " << summary.tls << '\n';
    return oss.str();
}

std::string message_formatter::format_shutdown() const {
    return std::string(WATCHDOG_MARKER) + " WATCHDOG STOPPED\n\nMonitoring has been stopped.";
}

std::string message_formatter::format_duration(std::chrono::milliseconds duration) {
    const auto seconds = std::max<long long>(0, duration.count() / 1000);
    const auto minutes = seconds / 60;
    const auto hours = minutes / 60;
    const auto days = hours / 24;

    std::ostringstream oss;
    if (days > 0) {
        oss << days << "d " << hours % 24 << 'h';
    } else if (hours > 0) {
        oss << hours << "h " << minutes % 60 << 'm';
    } else if (minutes > 0) {
        oss << minutes << "m " << seconds % 60 << 's';
    } else {
        oss << seconds << 's';
    }
    return oss.str();
}

} // namespace kcenon::watchdog
