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

#include "kcenon/watchdog/utils/json_document.h"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>

namespace kcenon::watchdog {

result<Json::Value> parse_json(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;

    Json::Value root;
    std::string errors;
    std::istringstream input(text);
    if (!Json::parseFromStream(builder, input, &root, &errors)) {
        return make_error<Json::Value>(watchdog_error_code::state_corrupted,
                                       "Invalid JSON: " + errors);
    }
    return make_success(std::move(root));
}

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

result<std::string> read_text_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return make_error<std::string>(watchdog_error_code::state_file_not_found,
                                       "File not found: " + path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error<std::string>(watchdog_error_code::state_read_failed,
                                       "Failed to open file: " + path);
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return make_error<std::string>(watchdog_error_code::state_read_failed,
                                       "Failed to read file: " + path);
    }
    return make_success(content.str());
}

result_void write_text_file_atomic(const std::string& path, const std::string& content) {
    namespace fs = std::filesystem;

    std::error_code ec;
    fs::path target(path);
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            return make_void_error(watchdog_error_code::state_write_failed,
                                   "Failed to create directory " +
                                       target.parent_path().string() + ": " + ec.message());
        }
    }

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return make_void_error(watchdog_error_code::state_write_failed,
                                   "Failed to open file: " + temp.string());
        }
        file << content;
        file.flush();
        if (!file) {
            return make_void_error(watchdog_error_code::state_write_failed,
                                   "Failed to write file: " + temp.string());
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(temp, ec);
        return make_void_error(watchdog_error_code::state_write_failed,
                               "Failed to replace " + path + ": " + reason);
    }
    return make_void_success();
}

} // namespace kcenon::watchdog
