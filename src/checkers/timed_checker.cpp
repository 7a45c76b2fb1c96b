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

#include "kcenon/watchdog/checkers/service_checker.h"

#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace kcenon::watchdog {

namespace {

std::string target_key(const check_target& target) {
    return target.type + "|" + target.name + "|" + target.address;
}

}  // namespace

timed_checker::timed_checker(std::shared_ptr<service_checker> inner,
                             std::chrono::milliseconds timeout)
    : inner_(std::move(inner))
    , timeout_(timeout)
    , in_flight_(std::make_shared<in_flight_set>()) {
    if (!inner_) {
        throw std::invalid_argument("timed_checker requires a checker to wrap");
    }
    if (timeout_.count() <= 0) {
        throw std::invalid_argument("timed_checker timeout must be positive");
    }
}

size_t timed_checker::in_flight() const {
    std::lock_guard<std::mutex> lock(in_flight_->mutex);
    return in_flight_->keys.size();
}

check_result timed_checker::check(const check_target& target) {
    const std::string key = target_key(target);
    {
        std::lock_guard<std::mutex> lock(in_flight_->mutex);
        if (!in_flight_->keys.insert(key).second) {
            return check_result::failed("previous check still running after timeout");
        }
    }

    // The task, the checker and the in-flight set are shared with the worker
    // thread so all of them outlive this call when the probe overruns. The
    // key is released before the result becomes ready.
    auto task = std::make_shared<std::packaged_task<check_result()>>(
        [inner = inner_, target, registry = in_flight_, key]() {
            struct release_key {
                in_flight_set& set;
                const std::string& key;
                ~release_key() {
                    std::lock_guard<std::mutex> lock(set.mutex);
                    set.keys.erase(key);
                }
            } release{*registry, key};
            return inner->check(target);
        });
    auto future = task->get_future();

    try {
        std::thread([task]() { (*task)(); }).detach();
    } catch (const std::system_error& e) {
        std::lock_guard<std::mutex> lock(in_flight_->mutex);
        in_flight_->keys.erase(key);
        return check_result::failed(std::string("cannot start check thread: ") + e.what());
    }

    if (future.wait_for(timeout_) == std::future_status::timeout) {
        return check_result::failed("check timed out after " +
                                    std::to_string(timeout_.count()) + "ms");
    }
    return future.get();
}

} // namespace kcenon::watchdog
