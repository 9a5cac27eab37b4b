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
 * @file munin_graph.h
 * @brief One graph definition with its fields and current values
 *
 * A graph is constructed with its display attributes, fields are registered
 * right after construction, and values are set during value retrieval.
 * Fields render in registration order.
 *
 * Usage:
 * @code
 * graph_attributes attrs;
 * attrs.title = "Load average";
 * attrs.category = "system";
 *
 * munin_graph graph(attrs);
 * field_attributes load;
 * load.label = "load";
 * load.type = stat_type::gauge;
 * graph.add_field("load", load);
 *
 * graph.set_value("load", 0.42);
 * std::cout << graph.render_config() << "\n" << graph.render_values() << "\n";
 * @endcode
 */

#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../core/result_types.h"
#include "graph_types.h"

namespace kcenon {
namespace munin {

/**
 * @class munin_graph
 * @brief Ordered collection of fields rendered to config and value text
 */
class munin_graph {
public:
    explicit munin_graph(graph_attributes attributes);
    explicit munin_graph(const std::string& title);

    /**
     * @brief Register a field
     * @param name Field name, unique within this graph
     * @param attributes Display attributes of the field
     * @return duplicate_field if @p name is already registered
     */
    auto add_field(const std::string& name, field_attributes attributes) -> result_void;

    /**
     * @brief Register a field with only a label
     */
    auto add_field(const std::string& name, const std::string& label) -> result_void;

    bool has_field(const std::string& name) const;

    /**
     * @brief Field names in registration order
     */
    const std::vector<std::string>& field_names() const { return field_names_; }

    size_t field_count() const { return field_names_.size(); }

    /**
     * @brief Attributes of a registered field
     * @return nullptr if the field does not exist
     */
    const field_attributes* field(const std::string& name) const;

    const graph_attributes& attributes() const { return attributes_; }

    /**
     * @brief Set the current value of a field
     * @param name Registered field name
     * @param value Integral, floating point or string value
     * @return unknown_field if @p name was never added
     */
    template <typename T>
    auto set_value(const std::string& name, T&& value) -> result_void {
        using value_type = std::decay_t<T>;
        if constexpr (std::is_same_v<value_type, bool>) {
            return store_value(name, field_value(static_cast<std::int64_t>(value ? 1 : 0)));
        } else if constexpr (std::is_floating_point_v<value_type>) {
            return store_value(name, field_value(static_cast<double>(value)));
        } else if constexpr (std::is_integral_v<value_type> && std::is_signed_v<value_type>) {
            return store_value(name, field_value(static_cast<std::int64_t>(value)));
        } else if constexpr (std::is_integral_v<value_type>) {
            return store_value(name, field_value(static_cast<std::uint64_t>(value)));
        } else if constexpr (std::is_same_v<value_type, field_value>) {
            return store_value(name, std::forward<T>(value));
        } else {
            static_assert(std::is_convertible_v<T, std::string>,
                          "field values must be numeric or convertible to std::string");
            return store_value(name, field_value(std::string(std::forward<T>(value))));
        }
    }

    bool has_value(const std::string& name) const;

    /**
     * @brief Forget all values set so far
     */
    void clear_values() { values_.clear(); }

    /**
     * @brief Render graph_* and <field>.* configuration lines
     * @return Lines joined by '\n', without a trailing newline
     */
    std::string render_config() const;

    /**
     * @brief Render <field>.value lines for fields that have a value
     * @return Lines joined by '\n', without a trailing newline
     */
    std::string render_values() const;

private:
    auto store_value(const std::string& name, field_value value) -> result_void;

    graph_attributes attributes_;
    std::vector<std::string> field_names_;
    std::unordered_map<std::string, field_attributes> fields_;
    std::unordered_map<std::string, field_value> values_;
};

/**
 * @brief Render a field value the way it appears on a <field>.value line
 */
std::string format_field_value(const field_value& value);

/**
 * @brief Wire names of graph attributes in emission order
 */
std::vector<std::string_view> graph_attribute_names();

/**
 * @brief Wire names of field attributes in emission order
 */
std::vector<std::string_view> field_attribute_names();

} // namespace munin
} // namespace kcenon
