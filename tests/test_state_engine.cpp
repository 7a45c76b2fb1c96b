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
#include <kcenon/watchdog/state/state_engine.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace kcenon {
namespace watchdog {
namespace {

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class StateEngineTest : public ::testing::Test {
  protected:
    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() /
                    ("watchdog_state_" +
                     std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(temp_dir_);
        now_ = from_epoch_ms(1'700'000'000'000);

        config_.state_path = (temp_dir_ / "state.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }

    std::unique_ptr<state_engine> make_engine() {
        return std::make_unique<state_engine>(config_, nullptr, [this] { return now_; });
    }

    void advance(std::chrono::milliseconds delta) { now_ += delta; }

    fs::path temp_dir_;
    time_point now_;
    state_engine_config config_;
};

TEST_F(StateEngineTest, InvalidConfigurationThrows) {
    config_.flapping_threshold = 0;
    EXPECT_THROW(make_engine(), std::invalid_argument);

    config_ = state_engine_config{};
    config_.max_transitions = 2;
    EXPECT_THROW(make_engine(), std::invalid_argument);
}

TEST_F(StateEngineTest, FirstFailureThenSuppressedThenOngoing) {
    auto engine = make_engine();

    EXPECT_EQ(engine->record_failure("docker:api", "exited"), alert_action::first_failure);

    advance(5min);
    EXPECT_EQ(engine->record_failure("docker:api", "exited"), alert_action::suppressed);

    advance(26min);
    EXPECT_EQ(engine->record_failure("docker:api", "exited (137)"), alert_action::ongoing_failure);

    auto record = engine->get_failure("docker:api");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->consecutive_failures, 3u);
    EXPECT_EQ(record->error, "exited (137)");
    EXPECT_EQ(record->last_alert_sent, now_);
    EXPECT_EQ(record->first_seen, now_ - 31min);
}

TEST_F(StateEngineTest, CooldownBoundaryIsInclusive) {
    auto engine = make_engine();
    engine->record_failure("pm2:worker", "stopped");

    advance(30min - 1ms);
    EXPECT_EQ(engine->record_failure("pm2:worker", "stopped"), alert_action::suppressed);

    advance(1ms);
    EXPECT_EQ(engine->record_failure("pm2:worker", "stopped"), alert_action::ongoing_failure);

    // The cooldown restarts from the last alert
    advance(29min);
    EXPECT_EQ(engine->record_failure("pm2:worker", "stopped"), alert_action::suppressed);
}

TEST_F(StateEngineTest, RecoveryReportsDowntimeAndClearsRecord) {
    auto engine = make_engine();
    engine->record_failure("systemd:nginx", "inactive");
    advance(5min);
    engine->record_failure("systemd:nginx", "inactive");
    advance(27min);

    auto recovery = engine->record_recovery("systemd:nginx");
    ASSERT_TRUE(recovery.has_value());
    EXPECT_EQ(recovery->downtime, std::chrono::milliseconds(32min));
    EXPECT_EQ(recovery->failures_seen, 2u);
    EXPECT_FALSE(engine->get_failure("systemd:nginx").has_value());
}

TEST_F(StateEngineTest, RecoveryWithoutFailureHasNoSideEffect) {
    auto engine = make_engine();
    engine->record_failure("docker:db", "down");

    EXPECT_FALSE(engine->record_recovery("docker:api").has_value());
    EXPECT_EQ(engine->get_all_failures().size(), 1u);
    EXPECT_EQ(engine->get_stats().total_failures, 1u);
}

TEST_F(StateEngineTest, FailureAfterRecoveryIsFirstFailureAgain) {
    auto engine = make_engine();
    engine->record_failure("docker:api", "down");
    engine->record_recovery("docker:api");

    advance(1min);
    EXPECT_EQ(engine->record_failure("docker:api", "down"), alert_action::first_failure);
}

TEST_F(StateEngineTest, ThreeTransitionsInWindowIsFlapping) {
    auto engine = make_engine();

    EXPECT_FALSE(engine->record_state_change("docker:y", health_state::unhealthy));
    advance(3min);
    EXPECT_FALSE(engine->record_state_change("docker:y", health_state::healthy));
    EXPECT_FALSE(engine->is_flapping("docker:y"));

    advance(3min);
    EXPECT_TRUE(engine->record_state_change("docker:y", health_state::unhealthy));
    EXPECT_TRUE(engine->is_flapping("docker:y"));

    auto info = engine->get_flapping_info("docker:y");
    EXPECT_TRUE(info.is_flapping);
    EXPECT_EQ(info.transition_count, 3u);
    ASSERT_EQ(info.transitions.size(), 3u);
    EXPECT_EQ(info.transitions.back().state, health_state::unhealthy);
}

TEST_F(StateEngineTest, TransitionsAgeOutOfWindow) {
    auto engine = make_engine();
    engine->record_state_change("docker:y", health_state::unhealthy);
    advance(1min);
    engine->record_state_change("docker:y", health_state::healthy);
    advance(1min);
    engine->record_state_change("docker:y", health_state::unhealthy);
    EXPECT_TRUE(engine->is_flapping("docker:y"));

    // First transition leaves the 10 minute window
    advance(8min);
    EXPECT_FALSE(engine->is_flapping("docker:y"));
    EXPECT_EQ(engine->get_flapping_info("docker:y").transition_count, 2u);
}

TEST_F(StateEngineTest, TransitionLogIsBounded) {
    config_.max_transitions = 4;
    auto engine = make_engine();

    for (int i = 0; i < 9; ++i) {
        engine->record_state_change("docker:y",
                                    i % 2 == 0 ? health_state::unhealthy : health_state::healthy);
    }
    EXPECT_EQ(engine->get_flapping_info("docker:y").transition_count, 4u);
}

TEST_F(StateEngineTest, PruneKeepsRecentTransitions) {
    auto engine = make_engine();
    engine->record_state_change("docker:y", health_state::unhealthy);
    advance(11min);
    engine->record_state_change("docker:y", health_state::healthy);

    engine->prune_flapping_history("docker:y");
    EXPECT_EQ(engine->get_flapping_info("docker:y").transitions.size(), 1u);

    engine->clear_flapping_history("docker:y");
    EXPECT_EQ(engine->get_flapping_info("docker:y").transition_count, 0u);
}

TEST_F(StateEngineTest, Acknowledgments) {
    auto engine = make_engine();
    EXPECT_FALSE(engine->is_acknowledged("docker:api"));

    engine->acknowledge("docker:api");
    engine->acknowledge("docker:api");
    EXPECT_TRUE(engine->is_acknowledged("docker:api"));
    EXPECT_EQ(engine->acknowledged_services(), (std::vector<std::string>{"docker:api"}));

    engine->unacknowledge("docker:api");
    EXPECT_FALSE(engine->is_acknowledged("docker:api"));
    EXPECT_TRUE(engine->acknowledged_services().empty());
}

TEST_F(StateEngineTest, SslExpiryCache) {
    auto engine = make_engine();
    EXPECT_FALSE(engine->get_ssl_expiry("https://example.com").has_value());

    auto expires = now_ + 24h * 20;
    engine->update_ssl_expiry("https://example.com", expires);
    ASSERT_TRUE(engine->get_ssl_expiry("https://example.com").has_value());
    EXPECT_EQ(*engine->get_ssl_expiry("https://example.com"), expires);
    EXPECT_EQ(engine->get_stats().tracked_ssl_certs, 1u);
}

TEST_F(StateEngineTest, StatsCountFlappingServices) {
    auto engine = make_engine();
    for (auto state : {health_state::unhealthy, health_state::healthy, health_state::unhealthy}) {
        engine->record_state_change("docker:y", state);
    }
    engine->record_state_change("docker:z", health_state::unhealthy);
    engine->record_failure("docker:y", "down");
    engine->acknowledge("docker:z");

    auto stats = engine->get_stats();
    EXPECT_EQ(stats.total_failures, 1u);
    EXPECT_EQ(stats.flapping_services, 1u);
    EXPECT_EQ(stats.acknowledged_services, 1u);
}

TEST_F(StateEngineTest, SaveAndLoadReproduceBehaviour) {
    {
        auto engine = make_engine();
        engine->record_failure("docker:api", "exited");
        engine->record_state_change("docker:api", health_state::unhealthy);
        engine->record_state_change("docker:y", health_state::unhealthy);
        engine->record_state_change("docker:y", health_state::healthy);
        engine->record_state_change("docker:y", health_state::unhealthy);
        engine->acknowledge("docker:noisy");
        engine->update_ssl_expiry("https://example.com", now_ + 72h);
        ASSERT_TRUE(engine->save().is_ok());
        EXPECT_EQ(engine->last_saved(), now_);
    }

    advance(5min);
    auto restored = make_engine();

    auto record = restored->get_failure("docker:api");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->error, "exited");
    EXPECT_EQ(record->first_seen, now_ - 5min);
    EXPECT_EQ(restored->record_failure("docker:api", "exited"), alert_action::suppressed);

    EXPECT_TRUE(restored->is_flapping("docker:y"));
    EXPECT_TRUE(restored->is_acknowledged("docker:noisy"));
    EXPECT_EQ(*restored->get_ssl_expiry("https://example.com"), now_ - 5min + 72h);
}

TEST_F(StateEngineTest, MissingFileStartsFresh) {
    auto engine = make_engine();
    EXPECT_EQ(engine->get_stats().total_failures, 0u);

    auto loaded = engine->load();
    ASSERT_TRUE(loaded.is_err());
    EXPECT_EQ(static_cast<watchdog_error_code>(loaded.error().code),
              watchdog_error_code::state_file_not_found);
}

TEST_F(StateEngineTest, CorruptFileStartsFresh) {
    {
        std::ofstream out(config_.state_path);
        out << "{ this is not json";
    }

    auto engine = make_engine();
    EXPECT_EQ(engine->get_stats().total_failures, 0u);

    auto loaded = engine->load();
    ASSERT_TRUE(loaded.is_err());
    EXPECT_EQ(static_cast<watchdog_error_code>(loaded.error().code),
              watchdog_error_code::state_corrupted);
}

TEST_F(StateEngineTest, MissingCollectionsLoadEmpty) {
    config_.load_on_construct = false;
    auto engine = make_engine();

    ASSERT_TRUE(engine->import_json(R"({"acknowledged": ["docker:api"]})").is_ok());
    EXPECT_TRUE(engine->is_acknowledged("docker:api"));
    EXPECT_TRUE(engine->get_all_failures().empty());
    EXPECT_EQ(engine->get_stats().tracked_ssl_certs, 0u);
}

TEST_F(StateEngineTest, MalformedEntriesAreSkipped) {
    config_.load_on_construct = false;
    auto engine = make_engine();

    auto imported = engine->import_json(R"({
        "failures": {
            "docker:good": {"first_seen": 1700000000000, "last_alert_sent": 1700000000000,
                            "error": "down", "consecutive_failures": 2},
            "docker:bad": {"first_seen": "yesterday"},
            "docker:far": {"first_seen": 9223372036854775807},
            "docker:past": {"first_seen": 1700000000000, "last_alert_sent": -9223372036854775807}
        },
        "flapping": {
            "docker:y": [{"time": 1700000000000, "state": "unhealthy"},
                         {"time": 1700000000000, "state": "sideways"},
                         {"time": 9223372036854775807, "state": "healthy"}]
        },
        "acknowledged": ["docker:x", 42],
        "ssl_expiry": {"https://a.example": 1800000000000, "https://b.example": "soon",
                       "https://c.example": 9223372036854775807}
    })");

    ASSERT_TRUE(imported.is_ok());
    EXPECT_EQ(engine->get_all_failures().size(), 1u);
    EXPECT_EQ(engine->get_failure("docker:good")->consecutive_failures, 2u);
    EXPECT_EQ(engine->get_flapping_info("docker:y").transitions.size(), 1u);
    EXPECT_EQ(engine->acknowledged_services(), (std::vector<std::string>{"docker:x"}));
    EXPECT_TRUE(engine->get_ssl_expiry("https://a.example").has_value());
    EXPECT_FALSE(engine->get_ssl_expiry("https://b.example").has_value());
    EXPECT_FALSE(engine->get_ssl_expiry("https://c.example").has_value());
}

TEST(ClockTest, CheckedConversionRejectsUnrepresentableMilliseconds) {
    EXPECT_FALSE(checked_from_epoch_ms(std::numeric_limits<std::int64_t>::max()).has_value());
    EXPECT_FALSE(checked_from_epoch_ms(std::numeric_limits<std::int64_t>::min()).has_value());

    auto valid = checked_from_epoch_ms(1'700'000'000'000);
    ASSERT_TRUE(valid.has_value());
    EXPECT_EQ(to_epoch_ms(*valid), 1'700'000'000'000);
}

TEST_F(StateEngineTest, ShutdownFlushesState) {
    config_.auto_save_interval = 1h;
    auto engine = make_engine();
    ASSERT_TRUE(engine->start_auto_save().is_ok());
    EXPECT_TRUE(engine->is_auto_saving());
    EXPECT_TRUE(engine->start_auto_save().is_err());

    engine->record_failure("docker:api", "down");
    ASSERT_TRUE(engine->shutdown().is_ok());
    EXPECT_FALSE(engine->is_auto_saving());
    EXPECT_TRUE(fs::exists(config_.state_path));
}

TEST_F(StateEngineTest, AutoSaveWritesPeriodically) {
    config_.auto_save_interval = 20ms;
    auto engine = make_engine();
    engine->record_failure("docker:api", "down");
    ASSERT_TRUE(engine->start_auto_save().is_ok());

    for (int i = 0; i < 100 && !fs::exists(config_.state_path); ++i) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(fs::exists(config_.state_path));
    EXPECT_TRUE(engine->stop_auto_save().is_ok());
}

}  // namespace
}  // namespace watchdog
}  // namespace kcenon
