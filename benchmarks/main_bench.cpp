/**
 * @file main_bench.cpp
 * @brief Main entry point for watchdog_system benchmarks
 * @details Initializes Google Benchmark and runs all registered benchmarks
 *
 * Usage:
 *   ./watchdog_benchmarks                                 # Run all
 *   ./watchdog_benchmarks --benchmark_filter=RingBuffer   # Specific category
 *   ./watchdog_benchmarks --benchmark_format=json         # JSON output
 *   ./watchdog_benchmarks --benchmark_out=results.json    # Save results
 */

#include <benchmark/benchmark.h>
#include <iostream>

int main(int argc, char** argv) {
    std::cout << "========================================\n";
    std::cout << "watchdog_system Performance Benchmarks\n";
    std::cout << "========================================\n\n";

    benchmark::Initialize(&argc, argv);

    if (benchmark::ReportUnrecognizedArguments(argc, argv)) {
        return 1;
    }

    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();

    std::cout << "\n========================================\n";
    std::cout << "Benchmarks Complete\n";
    std::cout << "========================================\n";

    return 0;
}
