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
#include <kcenon/watchdog/config/watchdog_config.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>

namespace kcenon {
namespace watchdog {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

TEST(ConfigParserTest, TypedLookups) {
    config_map config{{"count", " 42 "},
                      {"ratio", "2.5"},
                      {"enabled", "Yes"},
                      {"disabled", "off"},
                      {"name", "  watchdog  "},
                      {"negative", "-3"},
                      {"garbage", "12abc"}};

    EXPECT_EQ(config_parser::get<int>(config, "count", 0), 42);
    EXPECT_DOUBLE_EQ(config_parser::get<double>(config, "ratio", 0.0), 2.5);
    EXPECT_TRUE(config_parser::get<bool>(config, "enabled", false));
    EXPECT_FALSE(config_parser::get<bool>(config, "disabled", true));
    EXPECT_EQ(config_parser::get<std::string>(config, "name", ""), "watchdog");

    EXPECT_EQ(config_parser::get<int>(config, "missing", 7), 7);
    EXPECT_EQ(config_parser::get<int>(config, "garbage", 7), 7);
    EXPECT_EQ(config_parser::get<size_t>(config, "negative", 9u), 9u);
    EXPECT_EQ(config_parser::get<int>(config, "negative", 0), -3);
    EXPECT_FALSE(config_parser::get_optional<bool>(config, "ratio").has_value());

    EXPECT_TRUE(config_parser::has_key(config, "count"));
    EXPECT_FALSE(config_parser::has_key(config, "missing"));
}

TEST(ConfigParserTest, ClampedLookup) {
    config_map config{{"percent", "140"}, {"low", "-5"}};
    EXPECT_EQ(config_parser::get_clamped<int>(config, "percent", 50, 0, 100), 100);
    EXPECT_EQ(config_parser::get_clamped<int>(config, "low", 50, 0, 100), 0);
    EXPECT_EQ(config_parser::get_clamped<int>(config, "missing", 50, 0, 100), 50);
}

TEST(ConfigParserTest, DurationSuffixes) {
    config_map config{{"plain", "250"},    {"ms", "1500ms"}, {"sec", "30s"},
                      {"min", "5 m"},      {"hour", "2h"},   {"long", "10 minutes"},
                      {"bad", "3 weeks"},  {"empty", ""}};

    EXPECT_EQ(config_parser::get_duration(config, "plain", 1ms), 250ms);
    EXPECT_EQ(config_parser::get_duration(config, "ms", 1ms), 1500ms);
    EXPECT_EQ(config_parser::get_duration(config, "sec", 1ms), 30000ms);
    EXPECT_EQ(config_parser::get_duration(config, "min", 1ms), 300000ms);
    EXPECT_EQ(config_parser::get_duration(config, "hour", std::chrono::minutes(1)), 120min);
    EXPECT_EQ(config_parser::get_duration(config, "long", std::chrono::minutes(1)), 10min);
    EXPECT_EQ(config_parser::get_duration(config, "plain", std::chrono::minutes(1)), 250min);

    EXPECT_EQ(config_parser::get_duration(config, "bad", 42ms), 42ms);
    EXPECT_EQ(config_parser::get_duration(config, "empty", 42ms), 42ms);
    EXPECT_EQ(config_parser::get_duration(config, "missing", 42ms), 42ms);
}

TEST(ConfigParserTest, Lists) {
    config_map config{{"ports", "80, 443,abc,, 8080"}, {"junk", "x,y"}};
    EXPECT_EQ(config_parser::get_list<int>(config, "ports", {}), (std::vector<int>{80, 443, 8080}));
    EXPECT_EQ(config_parser::get_list<int>(config, "junk", {1}), (std::vector<int>{1}));
    EXPECT_EQ(config_parser::get_list<std::string>(config, "missing", {"a"}),
              (std::vector<std::string>{"a"}));
}

TEST(WatchdogConfigTest, DefaultsAreValid) {
    watchdog_config config;
    EXPECT_TRUE(config.validate().is_ok());
    EXPECT_EQ(config.scheduler.services_interval, 60s);
    EXPECT_EQ(config.scheduler.endpoints_interval, 5min);
    EXPECT_EQ(config.scheduler.tls_interval, 24h);
    EXPECT_EQ(config.state.cooldown, 30min);
    EXPECT_EQ(config.state.flapping_threshold, 3u);
    EXPECT_EQ(config.state.flapping_window, 10min);
    EXPECT_DOUBLE_EQ(config.anomaly.multiplier, 3.0);
    EXPECT_EQ(config.anomaly.sample_size, 20u);
    EXPECT_DOUBLE_EQ(config.thresholds.disk, 85.0);
    EXPECT_DOUBLE_EQ(config.thresholds.ram, 90.0);
    EXPECT_DOUBLE_EQ(config.thresholds.cpu, 95.0);
}

TEST(WatchdogConfigTest, FromConfigMap) {
    config_map values{{"intervals.services", "30s"},
                      {"intervals.ssl", "12h"},
                      {"alerts.cooldown", "15"},
                      {"alerts.recovery_notify", "false"},
                      {"alerts.flapping_threshold", "4"},
                      {"anomaly.multiplier", "2.5"},
                      {"anomaly.enabled", "no"},
                      {"thresholds.disk", "80"},
                      {"state.path", "/var/lib/watchdog/state.json"},
                      {"state.anomaly_path", "/var/lib/watchdog/anomaly.json"},
                      {"notifications.min_interval", "50ms"}};

    auto parsed = watchdog_config::from_config_map(values);
    ASSERT_TRUE(parsed.is_ok());
    const auto& config = parsed.value();

    EXPECT_EQ(config.scheduler.services_interval, 30s);
    EXPECT_EQ(config.scheduler.tls_interval, 12h);
    EXPECT_EQ(config.scheduler.endpoints_interval, 5min);
    EXPECT_FALSE(config.scheduler.recovery_notify);
    EXPECT_EQ(config.scheduler.anomaly_snapshot_path, "/var/lib/watchdog/anomaly.json");
    EXPECT_EQ(config.state.cooldown, 15min);
    EXPECT_EQ(config.state.flapping_threshold, 4u);
    EXPECT_EQ(config.state.state_path, "/var/lib/watchdog/state.json");
    EXPECT_FALSE(config.anomaly.enabled);
    EXPECT_DOUBLE_EQ(config.anomaly.multiplier, 2.5);
    EXPECT_DOUBLE_EQ(config.thresholds.disk, 80.0);
    EXPECT_EQ(config.notifications.min_interval, 50ms);
}

TEST(WatchdogConfigTest, TlsKeyWinsOverSslAlias) {
    auto parsed = watchdog_config::from_config_map(
        {{"intervals.ssl", "12h"}, {"intervals.tls", "6h"}});
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().scheduler.tls_interval, 6h);
}

TEST(WatchdogConfigTest, InvalidValuesAreRejected) {
    auto bad_threshold = watchdog_config::from_config_map({{"thresholds.ram", "120"}});
    ASSERT_TRUE(bad_threshold.is_err());
    EXPECT_EQ(static_cast<watchdog_error_code>(bad_threshold.error().code),
              watchdog_error_code::invalid_configuration);

    EXPECT_TRUE(watchdog_config::from_config_map({{"anomaly.min_samples", "50"}}).is_err());
    EXPECT_TRUE(watchdog_config::from_config_map({{"alerts.flapping_threshold", "0"}}).is_err());
    EXPECT_TRUE(watchdog_config::from_config_map({{"intervals.services", "0"}}).is_err());
}

TEST(WatchdogConfigTest, EnvironmentOverrides) {
    const std::map<std::string, std::string> env{{"CHECK_INTERVAL_SERVICES", "45"},
                                                 {"CHECK_INTERVAL_SSL", "3600"},
                                                 {"ALERT_COOLDOWN_MINUTES", "20"},
                                                 {"FLAPPING_WINDOW_MINUTES", "5"},
                                                 {"RAM_THRESHOLD_PERCENT", "75"},
                                                 {"RECOVERY_NOTIFY", "false"},
                                                 {"ANOMALY_SAMPLE_SIZE", ""},
                                                 {"WATCHDOG_STATE_PATH", "/tmp/wd.json"}};
    auto lookup = [&env](const char* name) -> const char* {
        auto it = env.find(name);
        return it != env.end() ? it->second.c_str() : nullptr;
    };

    auto overrides = environment_overrides(lookup);
    EXPECT_EQ(overrides.at("intervals.services"), "45s");
    EXPECT_EQ(overrides.at("intervals.tls"), "3600s");
    EXPECT_EQ(overrides.at("alerts.cooldown"), "20m");
    EXPECT_EQ(overrides.at("alerts.flapping_window"), "5m");
    EXPECT_EQ(overrides.at("thresholds.ram"), "75");
    EXPECT_EQ(overrides.at("state.path"), "/tmp/wd.json");
    EXPECT_EQ(overrides.count("anomaly.sample_size"), 0u);
    EXPECT_EQ(overrides.count("thresholds.disk"), 0u);

    auto parsed = watchdog_config::from_config_map(overrides);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().scheduler.services_interval, 45s);
    EXPECT_EQ(parsed.value().scheduler.tls_interval, 1h);
    EXPECT_EQ(parsed.value().state.cooldown, 20min);
    EXPECT_EQ(parsed.value().state.flapping_window, 5min);
    EXPECT_FALSE(parsed.value().scheduler.recovery_notify);
}

class ConfigFileTest : public ::testing::Test {
  protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
                ("watchdog_config_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 ".ini");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void write(const std::string& content) {
        std::ofstream out(path_);
        out << content;
    }

    fs::path path_;
};

TEST_F(ConfigFileTest, SectionsAndComments) {
    write("# watchdog\n"
          "state.path = /data/state.json\n"
          "\n"
          "[intervals]\n"
          "services = 15s\n"
          "; endpoints = 1m\n"
          "[alerts]\n"
          "cooldown = 10\n");

    auto loaded = load_config_file(path_.string());
    ASSERT_TRUE(loaded.is_ok());
    const auto& values = loaded.value();
    EXPECT_EQ(values.size(), 3u);
    EXPECT_EQ(values.at("state.path"), "/data/state.json");
    EXPECT_EQ(values.at("intervals.services"), "15s");
    EXPECT_EQ(values.at("alerts.cooldown"), "10");
}

TEST_F(ConfigFileTest, MalformedLinesAreErrors) {
    write("[intervals\nservices = 1s\n");
    EXPECT_TRUE(load_config_file(path_.string()).is_err());

    write("just a line\n");
    EXPECT_TRUE(load_config_file(path_.string()).is_err());

    write(" = value\n");
    auto empty_key = load_config_file(path_.string());
    ASSERT_TRUE(empty_key.is_err());
    EXPECT_EQ(static_cast<watchdog_error_code>(empty_key.error().code),
              watchdog_error_code::invalid_configuration);
}

TEST_F(ConfigFileTest, MissingFileIsAnError) {
    EXPECT_TRUE(load_config_file((path_.string() + ".missing")).is_err());
}

TEST(MergeConfigTest, OverridesWin) {
    config_map base{{"a", "1"}, {"b", "2"}};
    auto merged = merge_config(base, {{"b", "20"}, {"c", "30"}});
    EXPECT_EQ(merged.at("a"), "1");
    EXPECT_EQ(merged.at("b"), "20");
    EXPECT_EQ(merged.at("c"), "30");
    EXPECT_EQ(base.at("b"), "2");
}

}  // namespace
}  // namespace watchdog
}  // namespace kcenon
