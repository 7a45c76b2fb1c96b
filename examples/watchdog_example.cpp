/**
 * @file watchdog_example.cpp
 * @brief End-to-end watchdog example with simulated probes
 *
 * Demonstrates how watchdog_system is assembled from a configuration file and
 * environment overrides, how probes are registered, and how alerts flow to a
 * transport. Alerts are written through the console logger.
 *
 * Usage:
 *   ./watchdog_example [config.ini] [run_seconds]
 */

#include <kcenon/watchdog/core/console_logger.h>
#include <kcenon/watchdog/watchdog.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <thread>

using namespace kcenon::watchdog;
using namespace std::chrono_literals;

namespace {

config_map example_defaults() {
    return {{"intervals.services", "2s"},
            {"intervals.endpoints", "1s"},
            {"intervals.resources", "5s"},
            {"intervals.tls", "10s"},
            {"alerts.cooldown", "1"},
            {"state.path", "./watchdog_example_state.json"},
            {"state.anomaly_path", "./watchdog_example_latency.json"},
            {"anomaly.min_samples", "3"}};
}

/**
 * @brief Container probe that fails every fourth check
 */
std::shared_ptr<service_checker> make_container_probe() {
    auto counter = std::make_shared<std::atomic<int>>(0);
    return std::make_shared<functional_checker>("docker", [counter](const check_target& target) {
        const int n = ++(*counter);
        if (target.name == "worker" && n % 4 == 0) {
            auto result = check_result::failed("Container exited with code 137");
            result.metadata["status"] = "exited";
            result.metadata["restarts"] = std::to_string(n / 4);
            return result;
        }
        return check_result::ok();
    });
}

/**
 * @brief HTTP probe with jittered latency and an occasional slow response
 */
std::shared_ptr<service_checker> make_http_probe() {
    auto counter = std::make_shared<std::atomic<int>>(0);
    auto probe = std::make_shared<functional_checker>("http", [counter](const check_target&) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<double> jitter(80.0, 120.0);
        const int n = ++(*counter);
        return check_result::ok(n % 7 == 0 ? 900.0 : jitter(gen));
    });
    return std::make_shared<timed_checker>(probe, 2s);
}

/**
 * @brief Certificate probe reporting a certificate close to expiry
 */
std::shared_ptr<service_checker> make_certificate_probe() {
    return std::make_shared<functional_checker>("ssl", [](const check_target&) {
        const auto expires = wall_clock::now() + std::chrono::hours(24 * 5);
        auto result = check_result::failed("Certificate expires in 5 days");
        result.metadata["days_remaining"] = "5";
        result.metadata["expires_at"] = std::to_string(to_epoch_ms(expires));
        return result;
    });
}

}  // namespace

int main(int argc, char** argv) {
    auto logger = std::make_shared<console_logger>(log_level::info);

    config_map values = example_defaults();
    if (argc > 1) {
        auto file = load_config_file(argv[1]);
        if (file.is_err()) {
            std::cerr << "Failed to read " << argv[1] << ": " << file.error().message << std::endl;
            return 1;
        }
        values = merge_config(values, file.value());
    }
    values = merge_config(values, environment_overrides());

    auto config = watchdog_config::from_config_map(values);
    if (config.is_err()) {
        std::cerr << "Invalid configuration: " << config.error().message << std::endl;
        return 1;
    }

    const int run_seconds = argc > 2 ? std::atoi(argv[2]) : 12;

    watchdog_service dog(config.value(), std::make_shared<log_transport>(logger), logger);

    auto& scheduler = dog.scheduler();
    auto registered = scheduler.register_checker("docker", make_container_probe());
    if (registered.is_ok()) {
        registered = scheduler.register_checker("http", make_http_probe());
    }
    if (registered.is_ok()) {
        registered = scheduler.register_checker("ssl", make_certificate_probe());
    }
    if (registered.is_err()) {
        std::cerr << "Failed to register probe: " << registered.error().message << std::endl;
        return 1;
    }

    const check_target targets[] = {
        {"api", "docker", "", {}},
        {"worker", "docker", "", {}},
    };
    for (const auto& target : targets) {
        auto added = scheduler.add_target(check_category::services, target);
        if (added.is_err()) {
            std::cerr << added.error().message << std::endl;
            return 1;
        }
    }

    auto added = scheduler.add_target(check_category::endpoints,
                                      {"health", "http", "https://api.example.com/health", {}});
    if (added.is_ok()) {
        added = scheduler.add_target(check_category::tls,
                                     {"api", "ssl", "https://api.example.com", {}});
    }
    if (added.is_ok()) {
        added = scheduler.add_target(check_category::resources, {"disk", "", "", {{"path", "/"}}});
    }
    if (added.is_ok()) {
        added = scheduler.add_target(check_category::resources, {"ram", "", "", {}});
    }
    if (added.is_err()) {
        std::cerr << added.error().message << std::endl;
        return 1;
    }

    auto started = dog.start();
    if (started.is_err()) {
        std::cerr << "Failed to start: " << started.error().message << std::endl;
        return 1;
    }

    std::this_thread::sleep_for(std::chrono::seconds(run_seconds));

    auto stats = scheduler.get_stats();
    std::cout << "\nCycles: " << stats.cycles_completed
              << ", open failures: " << stats.state.total_failures
              << ", tracked endpoints: " << stats.anomalies.services.size() << std::endl;

    auto stopped = dog.stop();
    if (stopped.is_err()) {
        std::cerr << "Stopped with error: " << stopped.error().message << std::endl;
        return 1;
    }
    return 0;
}
