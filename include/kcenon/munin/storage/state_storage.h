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
 * @file state_storage.h
 * @brief Persistence of plugin state between invocations
 *
 * Plugins run once per poll, so anything that must survive to the next run
 * (previous counter readings, boot markers, ...) is written to a state file.
 * state_storage moves an opaque byte payload to and from that file;
 * state_record is a small versioned key/value format plugins can use for the
 * payload.
 *
 * Usage:
 * @code
 * state_storage storage("/var/lib/munin-node/plugin-state/nobody/my_plugin");
 *
 * state_record record(1);
 * record.set("last_uptime", 1234.5);
 * auto saved = storage.save(record.serialize());
 *
 * auto loaded = storage.load();
 * if (loaded.is_ok() && loaded.value()) {
 *     auto parsed = state_record::parse(*loaded.value());
 * }
 * @endcode
 */

#include <filesystem>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>

#include "../core/result_types.h"

namespace kcenon {
namespace munin {

/**
 * @class state_storage
 * @brief Reads and writes a state payload at a fixed path
 *
 * Each operation opens the file, transfers the whole payload and closes it
 * before returning. Writes go to a sibling temporary file that is renamed
 * over the target, so a concurrent reader sees either the old or the new
 * payload.
 */
class state_storage {
public:
    explicit state_storage(std::filesystem::path path);

    const std::filesystem::path& path() const { return path_; }

    bool exists() const;

    /**
     * @brief Read the stored payload
     * @return Empty optional if no state was saved yet, state_read_failed on I/O errors
     */
    auto load() const -> result<std::optional<std::string>>;

    /**
     * @brief Replace the stored payload
     * @return state_write_failed if the payload could not be written
     */
    auto save(const std::string& payload) const -> result_void;

    /**
     * @brief Delete the state file if present
     */
    auto remove() const -> result_void;

private:
    std::filesystem::path temporary_path() const;

    std::filesystem::path path_;
};

/**
 * @class state_record
 * @brief Versioned key/value record serialized as text
 *
 * Format:
 * @code
 * version 1
 * last_uptime 1234.500000
 * reboots 3
 * @endcode
 * Keys are non-empty and contain no whitespace; values contain no newline.
 */
class state_record {
public:
    explicit state_record(unsigned version = 1) : version_(version) {}

    unsigned version() const { return version_; }

    /**
     * @brief Store a value
     * @return false if the key or value cannot be represented
     */
    bool set(const std::string& key, const std::string& value);

    template <typename T>
        requires std::is_arithmetic_v<T>
    bool set(const std::string& key, const T& value) {
        std::ostringstream out;
        out.precision(17);
        out << value;
        return set(key, out.str());
    }

    std::optional<std::string> get(const std::string& key) const;

    /**
     * @brief Read a numeric value
     * @return @p default_value if the key is absent or not a number
     */
    template <typename T>
    T get(const std::string& key, const T& default_value) const {
        static_assert(std::is_arithmetic_v<T>, "typed lookups require an arithmetic type");
        auto text = get(key);
        if (!text) {
            return default_value;
        }
        std::istringstream in(*text);
        T value{};
        if (!(in >> value)) {
            return default_value;
        }
        return value;
    }

    bool contains(const std::string& key) const { return values_.count(key) > 0; }

    size_t size() const { return values_.size(); }

    std::string serialize() const;

    /**
     * @brief Parse serialized text
     * @return state_corrupted if the version header or an entry is malformed
     */
    static auto parse(const std::string& text) -> result<state_record>;

private:
    unsigned version_;
    std::map<std::string, std::string> values_;
};

} // namespace munin
} // namespace kcenon
