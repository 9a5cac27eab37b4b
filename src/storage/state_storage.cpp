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

#include "kcenon/munin/storage/state_storage.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <system_error>

namespace kcenon {
namespace munin {

// ============================================================================
// state_storage implementation
// ============================================================================

state_storage::state_storage(std::filesystem::path path)
    : path_(std::move(path)) {}

bool state_storage::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

std::filesystem::path state_storage::temporary_path() const {
    auto temp = path_;
    temp += ".tmp";
    return temp;
}

auto state_storage::load() const -> result<std::optional<std::string>> {
    if (!exists()) {
        return make_success(std::optional<std::string>{});
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        return make_error<std::optional<std::string>>(
            munin_error_code::state_read_failed,
            "Failed to open state file for reading: " + path_.string());
    }

    std::string payload((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (file.bad()) {
        return make_error<std::optional<std::string>>(
            munin_error_code::state_read_failed,
            "Failed to read state file: " + path_.string());
    }

    return make_success(std::optional<std::string>(std::move(payload)));
}

auto state_storage::save(const std::string& payload) const -> result_void {
    auto temp = temporary_path();

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return make_void_error(munin_error_code::state_write_failed,
                                   "Failed to open state file for writing: " + temp.string());
        }
        file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        file.flush();
        if (!file) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(temp, ignored);
            return make_void_error(munin_error_code::state_write_failed,
                                   "Failed to write state file: " + temp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp, path_, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return make_void_error(munin_error_code::state_write_failed,
                               "Failed to replace state file " + path_.string() + ": " +
                                   ec.message());
    }

    return make_void_success();
}

auto state_storage::remove() const -> result_void {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        return make_void_error(munin_error_code::state_write_failed,
                               "Failed to remove state file " + path_.string() + ": " +
                                   ec.message());
    }
    return make_void_success();
}

// ============================================================================
// state_record implementation
// ============================================================================

namespace {

bool is_valid_key(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    return std::none_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

} // namespace

bool state_record::set(const std::string& key, const std::string& value) {
    if (!is_valid_key(key) || value.find('\n') != std::string::npos) {
        return false;
    }
    values_[key] = value;
    return true;
}

std::optional<std::string> state_record::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string state_record::serialize() const {
    std::ostringstream out;
    out << "version " << version_ << '\n';
    for (const auto& [key, value] : values_) {
        out << key << ' ' << value << '\n';
    }
    return out.str();
}

auto state_record::parse(const std::string& text) -> result<state_record> {
    std::istringstream in(text);
    std::string line;

    if (!std::getline(in, line)) {
        return make_error<state_record>(munin_error_code::state_corrupted,
                                        "State is empty");
    }

    std::istringstream header(line);
    std::string keyword;
    unsigned version = 0;
    if (!(header >> keyword >> version) || keyword != "version") {
        return make_error<state_record>(munin_error_code::state_corrupted,
                                        "Missing state version header");
    }

    state_record record(version);
    size_t line_number = 1;
    while (std::getline(in, line)) {
        ++line_number;
        if (line.empty()) {
            continue;
        }
        auto separator = line.find(' ');
        if (separator == std::string::npos) {
            return make_error<state_record>(
                munin_error_code::state_corrupted,
                "Malformed state entry on line " + std::to_string(line_number));
        }
        if (!record.set(line.substr(0, separator), line.substr(separator + 1))) {
            return make_error<state_record>(
                munin_error_code::state_corrupted,
                "Invalid state key on line " + std::to_string(line_number));
        }
    }

    return make_success(std::move(record));
}

} // namespace munin
} // namespace kcenon
