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

#include <gtest/gtest.h>
#include <kcenon/watchdog/notification/message_formatter.h>

#include <chrono>
#include <string>

namespace kcenon {
namespace watchdog {
namespace {

using namespace std::chrono_literals;

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

check_result usage_result(const std::string& usage, const std::string& threshold) {
    auto result = check_result::failed("usage above threshold");
    result.metadata["usage"] = usage;
    result.metadata["threshold"] = threshold;
    return result;
}

class MessageFormatterTest : public ::testing::Test {
  protected:
    message_formatter formatter_;
    alert_subject subject_{"api", "docker"};
};

TEST_F(MessageFormatterTest, ServiceDownFirstFailure) {
    auto result = check_result::failed("Container exited");
    result.metadata["status"] = "exited";
    result.metadata["restarts"] = "4";

    auto text = formatter_.format_service_down(subject_, result, alert_action::first_failure);
    EXPECT_TRUE(contains(text, "SERVICE DOWN"));
    EXPECT_FALSE(contains(text, "STILL DOWN"));
    EXPECT_TRUE(contains(text, "Service: api"));
    EXPECT_TRUE(contains(text, "Type: docker"));
    EXPECT_TRUE(contains(text, "Error: Container exited"));
    EXPECT_TRUE(contains(text, "Status: exited"));
    EXPECT_TRUE(contains(text, "Restarts: 4"));
}

TEST_F(MessageFormatterTest, ServiceStillDownOmitsMissingMetadata) {
    auto text = formatter_.format_service_down(subject_, check_result::failed("timeout"),
                                               alert_action::ongoing_failure);
    EXPECT_TRUE(contains(text, "SERVICE STILL DOWN"));
    EXPECT_FALSE(contains(text, "Status:"));
    EXPECT_FALSE(contains(text, "Restarts:"));
}

TEST_F(MessageFormatterTest, Recovery) {
    recovery_info recovery;
    recovery.downtime = 32min;
    recovery.failures_seen = 3;

    auto text = formatter_.format_recovery(subject_, recovery);
    EXPECT_TRUE(contains(text, "SERVICE RECOVERED"));
    EXPECT_TRUE(contains(text, "Downtime: 32m 0s"));
    EXPECT_TRUE(contains(text, "Failures: 3"));
}

TEST_F(MessageFormatterTest, Performance) {
    anomaly_result anomaly;
    anomaly.is_anomaly = true;
    anomaly.response_time = 412.0;
    anomaly.median = 100.4;
    anomaly.deviation = 4.1035;

    auto text = formatter_.format_performance("https://example.com/health", anomaly);
    EXPECT_TRUE(contains(text, "PERFORMANCE DEGRADATION"));
    EXPECT_TRUE(contains(text, "Endpoint: https://example.com/health"));
    EXPECT_TRUE(contains(text, "Current: 412ms"));
    EXPECT_TRUE(contains(text, "Normal: 100ms"));
    EXPECT_TRUE(contains(text, "Slowdown: 4.1x slower"));
}

TEST_F(MessageFormatterTest, FlappingQuotesWindowAndCooldown) {
    message_formatter formatter(15min, 45min);
    auto text = formatter.format_flapping(subject_, 4);

    EXPECT_TRUE(contains(text, "SERVICE FLAPPING"));
    EXPECT_TRUE(contains(text, "Changes: 4 in last 15 minutes"));
    EXPECT_TRUE(contains(text, "suppressed for 45 minutes"));
}

TEST_F(MessageFormatterTest, ResourceWarningMarkers) {
    auto text = formatter_.format_resource_warning("disk", usage_result("91", "85"));
    EXPECT_TRUE(contains(text, "DISK WARNING"));
    EXPECT_TRUE(contains(text, "DISK usage: 91%"));
    EXPECT_TRUE(contains(text, "Threshold: 85%"));
    EXPECT_FALSE(contains(text, "\xF0\x9F\x94\xB4"));

    auto critical = formatter_.format_resource_warning("disk", usage_result("97", "85"));
    EXPECT_TRUE(contains(critical, "\xF0\x9F\x94\xB4"));
}

TEST_F(MessageFormatterTest, SslWarning) {
    check_result result = check_result::failed("Certificate expires in 5 days");
    result.metadata["days_remaining"] = "5";
    // 2024-03-01T00:00:00Z
    result.metadata["expires_at"] = "1709251200000";

    auto text = formatter_.format_ssl_warning("https://example.com", result);
    EXPECT_TRUE(contains(text, "SSL CERTIFICATE EXPIRING"));
    EXPECT_TRUE(contains(text, "Domain: https://example.com"));
    EXPECT_TRUE(contains(text, "Days remaining: 5"));
    EXPECT_TRUE(contains(text, "Expires: 2024-03-01"));
    EXPECT_TRUE(contains(text, "\xF0\x9F\x94\xB4"));
    EXPECT_TRUE(contains(text, "Renew certificate"));
}

TEST_F(MessageFormatterTest, StartupAndShutdown) {
    startup_summary summary{3, 2, 3, 1};
    auto start = formatter_.format_startup(summary);
    EXPECT_TRUE(contains(start, "WATCHDOG STARTED"));
    EXPECT_TRUE(contains(start, "Monitoring 5 services"));
    EXPECT_TRUE(contains(start, "Certificates: 1"));

    EXPECT_TRUE(contains(formatter_.format_shutdown(), "WATCHDOG STOPPED"));
}

TEST_F(MessageFormatterTest, FormatDuration) {
    EXPECT_EQ(message_formatter::format_duration(0ms), "0s");
    EXPECT_EQ(message_formatter::format_duration(45s), "45s");
    EXPECT_EQ(message_formatter::format_duration(32min), "32m 0s");
    EXPECT_EQ(message_formatter::format_duration(2h + 5min + 30s), "2h 5m");
    EXPECT_EQ(message_formatter::format_duration(49h), "2d 1h");
    EXPECT_EQ(message_formatter::format_duration(-5s), "0s");
}

}  // namespace
}  // namespace watchdog
}  // namespace kcenon
