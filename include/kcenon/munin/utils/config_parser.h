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

#pragma once

/**
 * @file config_parser.h
 * @brief Typed access to the plugin environment
 *
 * Munin passes plugin configuration through environment variables. The
 * environment is captured once as a config_map and every component reads it
 * through this utility so that parsing behaves the same everywhere.
 *
 * Usage:
 * @code
 * using kcenon::munin::config_parser;
 *
 * config_map env = {{"MUNIN_STATEFILE", "/var/lib/munin/state"},
 *                   {"include_graphs", "cpu, memory"}};
 *
 * auto path = config_parser::get<std::string>(env, "MUNIN_STATEFILE", "/tmp/state");
 * auto graphs = config_parser::get_list(env, "include_graphs");
 * @endcode
 */

#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace kcenon::munin {

/**
 * @brief Type alias for configuration map
 */
using config_map = std::unordered_map<std::string, std::string>;

/**
 * @class config_parser
 * @brief Unified configuration parsing utility
 *
 * Provides type-safe parsing of configuration values with default value support.
 * Handles integer and string types consistently.
 */
class config_parser {
   public:
    /**
     * @brief Get a configuration value with type conversion
     * @tparam T The target type (int, size_t, std::string, etc.)
     * @param config The configuration map
     * @param key The configuration key to look up
     * @param default_value The default value if key is not found or parsing fails
     * @return The parsed value or default
     */
    template <typename T>
    static T get(const config_map& config, const std::string& key, const T& default_value) {
        auto it = config.find(key);
        if (it == config.end()) {
            return default_value;
        }
        return parse_value_optional<T>(it->second).value_or(default_value);
    }

    /**
     * @brief Check whether a value matches a regex pattern as a whole
     * @param config The configuration map
     * @param key The configuration key to look up
     * @param pattern ECMAScript regex the whole value must match
     * @param icase Match case-insensitively
     * @return false if the key is absent or the value does not match
     */
    static bool value_matches(const config_map& config, const std::string& key,
                              const std::string& pattern, bool icase = false) {
        auto it = config.find(key);
        if (it == config.end()) {
            return false;
        }
        auto flags = std::regex::ECMAScript;
        if (icase) {
            flags |= std::regex::icase;
        }
        return std::regex_match(it->second, std::regex(pattern, flags));
    }

    /**
     * @brief Split a comma-separated value into its entries
     * @param config The configuration map
     * @param key The configuration key to look up
     * @return Trimmed entries, empty ones included; no entries if the key is absent or empty
     *
     * "a,,b" yields {"a", "", "b"} and "," yields {"", ""}. Callers decide what
     * an empty entry means.
     */
    static std::vector<std::string> get_list(const config_map& config, const std::string& key) {
        std::vector<std::string> items;
        auto it = config.find(key);
        if (it == config.end() || it->second.empty()) {
            return items;
        }

        std::string current;
        for (char c : it->second) {
            if (c == ',') {
                items.push_back(trim(current));
                current.clear();
            } else {
                current += c;
            }
        }
        items.push_back(trim(current));
        return items;
    }

   private:
    /**
     * @brief Parse a string value to target type as optional
     */
    template <typename T>
    static std::optional<T> parse_value_optional(const std::string& str) {
        try {
            if constexpr (std::is_same_v<T, std::string>) {
                return str;
            } else if constexpr (std::is_integral_v<T>) {
                return parse_integral<T>(str);
            } else {
                return std::nullopt;
            }
        } catch (const std::logic_error&) {
            // std::stoll and friends report invalid_argument / out_of_range
            return std::nullopt;
        }
    }

    template <typename T>
    static T parse_integral(const std::string& str) {
        static_assert(std::is_integral_v<T>, "parse_integral requires integral type");
        if constexpr (std::is_signed_v<T>) {
            long long value = std::stoll(str);
            return static_cast<T>(value);
        } else {
            unsigned long long value = std::stoull(str);
            return static_cast<T>(value);
        }
    }

    static std::string trim(const std::string& item) {
        size_t start = item.find_first_not_of(" \t");
        if (start == std::string::npos) {
            return std::string();
        }
        size_t end = item.find_last_not_of(" \t");
        return item.substr(start, end - start + 1);
    }
};

}  // namespace kcenon::munin
