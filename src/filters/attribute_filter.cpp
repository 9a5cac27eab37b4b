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

#include "kcenon/munin/filters/attribute_filter.h"

namespace kcenon {
namespace munin {

attribute_filter::attribute_filter(const std::vector<std::string>& include,
                                   const std::vector<std::string>& exclude) {
    apply_lists(include, exclude);
}

attribute_filter::attribute_filter(const std::vector<std::string>& include,
                                   const std::vector<std::string>& exclude,
                                   std::regex validation)
    : validation_(std::move(validation)) {
    apply_lists(include, exclude);
}

auto attribute_filter::create(const std::vector<std::string>& include,
                              const std::vector<std::string>& exclude,
                              const std::optional<std::string>& validation_pattern)
    -> result<attribute_filter> {
    if (!validation_pattern) {
        return make_success(attribute_filter(include, exclude));
    }

    std::regex validation;
    try {
        validation = std::regex(*validation_pattern);
    } catch (const std::regex_error& e) {
        return make_error<attribute_filter>(
            munin_error_code::invalid_filter_pattern,
            "Invalid filter pattern '" + *validation_pattern + "': " + e.what());
    }

    return make_success(attribute_filter(include, exclude, std::move(validation)));
}

bool attribute_filter::is_enabled(const std::string& name) const {
    auto it = overrides_.find(name);
    if (it != overrides_.end()) {
        return it->second;
    }
    return default_enabled_;
}

void attribute_filter::apply_lists(const std::vector<std::string>& include,
                                   const std::vector<std::string>& exclude) {
    if (!include.empty()) {
        default_enabled_ = false;
    }

    for (const auto& name : include) {
        if (is_valid_name(name)) {
            overrides_[name] = true;
        }
    }

    // Applied after the include list so that exclusion wins
    for (const auto& name : exclude) {
        if (is_valid_name(name)) {
            overrides_[name] = false;
        }
    }
}

bool attribute_filter::is_valid_name(const std::string& name) const {
    if (!validation_) {
        return true;
    }
    return std::regex_search(name, *validation_, std::regex_constants::match_continuous);
}

} // namespace munin
} // namespace kcenon
