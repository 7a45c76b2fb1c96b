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

/**
 * @file anomaly_detector_bench.cpp
 * @brief Benchmarks for latency recording and anomaly checks
 */

#include <benchmark/benchmark.h>
#include <kcenon/watchdog/anomaly/anomaly_detector.h>

#include <string>
#include <vector>

using namespace kcenon::watchdog;

static void BM_AnomalyRecord(benchmark::State& state) {
    anomaly_detector detector;
    double sample = 100.0;

    for (auto _ : state) {
        detector.record("http:https://api.example/health", sample);
        sample = sample > 200.0 ? 100.0 : sample + 1.0;
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AnomalyRecord);

static void BM_AnomalyRecordAndCheck(benchmark::State& state) {
    anomaly_detector detector;
    const std::string id = "http:https://api.example/health";
    for (int i = 0; i < 20; ++i) {
        detector.record(id, 100.0 + i);
    }

    double sample = 100.0;
    for (auto _ : state) {
        detector.record(id, sample);
        auto result = detector.check(id, sample);
        benchmark::DoNotOptimize(result);
        sample = sample > 120.0 ? 100.0 : sample + 1.0;
    }

    state.SetItemsProcessed(state.iterations());
    state.SetLabel("record_then_check");
}
BENCHMARK(BM_AnomalyRecordAndCheck);

static void BM_AnomalyManyServices(benchmark::State& state) {
    anomaly_detector detector;
    std::vector<std::string> ids;
    for (int64_t i = 0; i < state.range(0); ++i) {
        ids.push_back("http:https://service" + std::to_string(i) + ".example/health");
    }

    size_t next = 0;
    for (auto _ : state) {
        const auto& id = ids[next];
        detector.record(id, 90.0);
        auto result = detector.check(id, 90.0);
        benchmark::DoNotOptimize(result);
        next = (next + 1) % ids.size();
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_AnomalyManyServices)->Arg(10)->Arg(100)->Arg(1000);

static void BM_AnomalySnapshotExport(benchmark::State& state) {
    anomaly_detector detector;
    for (int64_t i = 0; i < state.range(0); ++i) {
        const auto id = "http:https://service" + std::to_string(i) + ".example";
        for (int s = 0; s < 20; ++s) {
            detector.record(id, 100.0 + s);
        }
    }

    for (auto _ : state) {
        auto snapshot = detector.export_snapshot();
        benchmark::DoNotOptimize(snapshot);
    }
}
BENCHMARK(BM_AnomalySnapshotExport)->Arg(10)->Arg(100);
