#pragma once

/*****************************************************************************
BSD 3-Clause License

Copyright (c) 2025, watchdog_system contributors
All rights reserved.
*****************************************************************************/

/**
 * @file config_parser.h
 * @brief Typed lookups over a flat key/value configuration map
 *
 * Keys are dotted paths ("alerts.cooldown", "thresholds.disk"). A missing
 * key or a value that does not parse yields the supplied default.
 *
 * @code
 * config_map config = {{"anomaly.enabled", "yes"}, {"alerts.cooldown", "45m"}};
 *
 * bool enabled = config_parser::get<bool>(config, "anomaly.enabled", true);
 * auto cooldown = config_parser::get_duration(config, "alerts.cooldown",
 *                                             std::chrono::minutes(30));
 * @endcode
 */

#include <cctype>
#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace kcenon { namespace watchdog {

using config_map = std::unordered_map<std::string, std::string>;

class config_parser {
public:
    template <typename T>
    static T get(const config_map& config, const std::string& key, const T& default_value) {
        auto parsed = get_optional<T>(config, key);
        return parsed ? *parsed : default_value;
    }

    template <typename T>
    static std::optional<T> get_optional(const config_map& config, const std::string& key) {
        auto it = config.find(key);
        if (it == config.end()) {
            return std::nullopt;
        }
        return parse_value<T>(it->second);
    }

    static bool has_key(const config_map& config, const std::string& key) {
        return config.find(key) != config.end();
    }

    /**
     * @brief Parsed value clamped to [min_value, max_value]
     */
    template <typename T>
    static T get_clamped(const config_map& config, const std::string& key, const T& default_value,
                         const T& min_value, const T& max_value) {
        static_assert(std::is_arithmetic_v<T>, "get_clamped requires arithmetic type");
        T value = get<T>(config, key, default_value);
        if (value < min_value) {
            return min_value;
        }
        if (value > max_value) {
            return max_value;
        }
        return value;
    }

    /**
     * @brief Duration lookup
     *
     * A plain number is read in Duration's own unit; otherwise the suffixes
     * ms, s, m and h (and their long forms) are accepted.
     */
    template <typename Duration>
    static Duration get_duration(const config_map& config, const std::string& key,
                                 const Duration& default_value) {
        auto it = config.find(key);
        if (it == config.end()) {
            return default_value;
        }
        auto parsed = parse_duration<Duration>(it->second);
        return parsed ? *parsed : default_value;
    }

    /**
     * @brief Comma-separated list; unparseable elements are skipped
     */
    template <typename T>
    static std::vector<T> get_list(const config_map& config, const std::string& key,
                                   const std::vector<T>& default_values) {
        auto it = config.find(key);
        if (it == config.end()) {
            return default_values;
        }

        std::vector<T> values;
        std::string::size_type begin = 0;
        while (begin <= it->second.size()) {
            auto end = it->second.find(',', begin);
            if (end == std::string::npos) {
                end = it->second.size();
            }
            auto element = trim(it->second.substr(begin, end - begin));
            if (!element.empty()) {
                if (auto parsed = parse_value<T>(element)) {
                    values.push_back(*parsed);
                }
            }
            begin = end + 1;
        }
        return values.empty() ? default_values : values;
    }

    static std::string trim(const std::string& str) {
        auto start = str.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) {
            return {};
        }
        auto end = str.find_last_not_of(" \t\r\n");
        return str.substr(start, end - start + 1);
    }

private:
    template <typename T>
    static std::optional<T> parse_value(const std::string& raw) {
        const std::string str = trim(raw);
        try {
            if constexpr (std::is_same_v<T, bool>) {
                return parse_bool(str);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return str;
            } else if constexpr (std::is_integral_v<T>) {
                return parse_integral<T>(str);
            } else if constexpr (std::is_floating_point_v<T>) {
                return parse_floating<T>(str);
            } else {
                return std::nullopt;
            }
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    // "true", "1", "yes", "on" are true; "false", "0", "no", "off" are false
    static std::optional<bool> parse_bool(const std::string& str) {
        std::string lower = str;
        for (auto& c : lower) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
            return true;
        }
        if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
            return false;
        }
        return std::nullopt;
    }

    template <typename T>
    static std::optional<T> parse_integral(const std::string& str) {
        size_t consumed = 0;
        if constexpr (std::is_signed_v<T>) {
            long long value = std::stoll(str, &consumed);
            if (consumed != str.size()) {
                return std::nullopt;
            }
            return static_cast<T>(value);
        } else {
            if (!str.empty() && str.front() == '-') {
                return std::nullopt;
            }
            unsigned long long value = std::stoull(str, &consumed);
            if (consumed != str.size()) {
                return std::nullopt;
            }
            return static_cast<T>(value);
        }
    }

    template <typename T>
    static std::optional<T> parse_floating(const std::string& str) {
        size_t consumed = 0;
        double value = std::stod(str, &consumed);
        if (consumed != str.size()) {
            return std::nullopt;
        }
        return static_cast<T>(value);
    }

    template <typename Duration>
    static std::optional<Duration> parse_duration(const std::string& raw) {
        const std::string str = trim(raw);
        if (str.empty()) {
            return std::nullopt;
        }

        try {
            size_t suffix_start = str.find_first_not_of("0123456789-");
            long long value = std::stoll(str.substr(0, suffix_start));
            if (suffix_start == std::string::npos) {
                return Duration(value);
            }

            std::string suffix = trim(str.substr(suffix_start));
            for (auto& c : suffix) {
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }

            if (suffix == "ms" || suffix == "millisecond" || suffix == "milliseconds") {
                return std::chrono::duration_cast<Duration>(std::chrono::milliseconds(value));
            }
            if (suffix == "s" || suffix == "sec" || suffix == "second" || suffix == "seconds") {
                return std::chrono::duration_cast<Duration>(std::chrono::seconds(value));
            }
            if (suffix == "m" || suffix == "min" || suffix == "minute" || suffix == "minutes") {
                return std::chrono::duration_cast<Duration>(std::chrono::minutes(value));
            }
            if (suffix == "h" || suffix == "hr" || suffix == "hour" || suffix == "hours") {
                return std::chrono::duration_cast<Duration>(std::chrono::hours(value));
            }
            return std::nullopt;
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
};

} } // namespace kcenon::watchdog
