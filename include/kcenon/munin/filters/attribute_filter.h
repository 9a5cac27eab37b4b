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
 * @file attribute_filter.h
 * @brief Include/exclude list filter for graph and attribute names
 *
 * Attributes are filtered using an include list and an exclude list:
 * - If the include list is empty, all attributes are enabled by default.
 * - If the include list is not empty, only the listed attributes are enabled.
 * - Any attribute in the exclude list is disabled, even if it is also included.
 *
 * When a validation pattern is given, list entries that do not match it from
 * the start of the name are ignored.
 */

#include <optional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

#include "../core/result_types.h"

namespace kcenon {
namespace munin {

/**
 * @class attribute_filter
 * @brief Immutable enablement gate built from include/exclude lists
 */
class attribute_filter {
public:
    /**
     * @brief Build a filter without name validation
     * @param include Names that are enabled (disables everything else when non-empty)
     * @param exclude Names that are disabled
     */
    attribute_filter(const std::vector<std::string>& include,
                     const std::vector<std::string>& exclude);

    /**
     * @brief Build a filter whose list entries are validated by a compiled pattern
     * @param include Names that are enabled
     * @param exclude Names that are disabled
     * @param validation Entries that do not match it from the start are ignored
     */
    attribute_filter(const std::vector<std::string>& include,
                     const std::vector<std::string>& exclude,
                     std::regex validation);

    /**
     * @brief Build a filter from a pattern given as text
     * @param include Names that are enabled
     * @param exclude Names that are disabled
     * @param validation_pattern ECMAScript regex entries must match from the start
     * @return The filter, or invalid_filter_pattern if the pattern does not compile
     */
    static auto create(const std::vector<std::string>& include,
                       const std::vector<std::string>& exclude,
                       const std::optional<std::string>& validation_pattern)
        -> result<attribute_filter>;

    /**
     * @brief Check whether an attribute is enabled
     * @param name Attribute name
     * @return The explicit override for @p name, or the default state
     */
    bool is_enabled(const std::string& name) const;

    /**
     * @brief Default state for names without an override
     */
    bool default_enabled() const { return default_enabled_; }

    /**
     * @brief Number of names with an explicit include/exclude override
     */
    size_t override_count() const { return overrides_.size(); }

private:
    void apply_lists(const std::vector<std::string>& include,
                     const std::vector<std::string>& exclude);

    bool is_valid_name(const std::string& name) const;

    bool default_enabled_{true};
    std::unordered_map<std::string, bool> overrides_;
    std::optional<std::regex> validation_;
};

} // namespace munin
} // namespace kcenon
