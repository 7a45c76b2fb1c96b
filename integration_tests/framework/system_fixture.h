/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions are met:

1. Redistributions of source code must retain the above copyright notice, this
   list of conditions and the following disclaimer.

2. Redistributions in binary form must reproduce the above copyright notice,
   this list of conditions and the following disclaimer in the documentation
   and/or other materials provided with the distribution.

3. Neither the name of the copyright holder nor the names of its
   contributors may be used to endorse or promote products derived from
   this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
*****************************************************************************/

#pragma once

#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <kcenon/watchdog/watchdog.h>

#include "test_helpers.h"

namespace integration_tests {

namespace fs = std::filesystem;

/**
 * @class WatchdogSystemFixture
 * @brief Base fixture for integration tests providing common setup and teardown
 *
 * This fixture provides:
 * - A temporary directory for state and latency snapshots
 * - A manually driven wall clock
 * - A recording transport and scripted checkers for every category
 * - Cleanup of the watchdog and its files
 */
class WatchdogSystemFixture : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() /
                    ("watchdog_test_" +
                     std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(temp_dir_);

        transport_ = std::make_shared<RecordingTransport>();
        docker_ = std::make_shared<ScriptedChecker>("docker");
        http_ = std::make_shared<ScriptedChecker>("http");
        ssl_ = std::make_shared<ScriptedChecker>("ssl");
    }

    void TearDown() override {
        if (watchdog_) {
            auto stopped = watchdog_->stop();
            EXPECT_TRUE(stopped.is_ok());
        }
        watchdog_.reset();

        if (fs::exists(temp_dir_)) {
            std::error_code ec;
            fs::remove_all(temp_dir_, ec);
        }
    }

    /**
     * @brief Configuration with files under the temp directory, fast
     *        delivery and timers too slow to interfere with a test
     */
    kcenon::watchdog::watchdog_config DefaultConfig() const {
        using namespace std::chrono_literals;
        kcenon::watchdog::watchdog_config config;
        config.state.state_path = (temp_dir_ / "state.json").string();
        config.state.auto_save_interval = 1h;
        config.scheduler.anomaly_snapshot_path = (temp_dir_ / "anomaly.json").string();
        config.scheduler.services_interval = 1h;
        config.scheduler.endpoints_interval = 1h;
        config.scheduler.resources_interval = 1h;
        config.scheduler.tls_interval = 1h;
        config.notifications.min_interval = 1ms;
        return config;
    }

    /**
     * @brief Build the watchdog and register the scripted checkers
     */
    void CreateWatchdog(const kcenon::watchdog::watchdog_config& config) {
        watchdog_ = std::make_unique<kcenon::watchdog::watchdog_service>(
            config, transport_, nullptr, clock_.provider());
        ASSERT_TRUE(watchdog_->scheduler().register_checker("docker", docker_).is_ok());
        ASSERT_TRUE(watchdog_->scheduler().register_checker("http", http_).is_ok());
        ASSERT_TRUE(watchdog_->scheduler().register_checker("ssl", ssl_).is_ok());
    }

    void CreateWatchdog() { CreateWatchdog(DefaultConfig()); }

    /**
     * @brief Wait until every queued notification has been handed to the transport
     */
    bool Drain(std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        return watchdog_ && watchdog_->dispatcher().wait_until_idle(timeout);
    }

    std::string GetTempFilePath(const std::string& name) const {
        return (temp_dir_ / name).string();
    }

    fs::path temp_dir_;
    ManualClock clock_;
    std::shared_ptr<RecordingTransport> transport_;
    std::shared_ptr<ScriptedChecker> docker_;
    std::shared_ptr<ScriptedChecker> http_;
    std::shared_ptr<ScriptedChecker> ssl_;
    std::unique_ptr<kcenon::watchdog::watchdog_service> watchdog_;
};

}  // namespace integration_tests
