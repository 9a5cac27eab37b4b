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

#include "kcenon/munin/graph/munin_graph.h"

#include <cstdio>
#include <sstream>

namespace kcenon {
namespace munin {

namespace {

void append_line(std::ostringstream& out, bool& first, const std::string& line) {
    if (!first) {
        out << '\n';
    }
    out << line;
    first = false;
}

} // namespace

munin_graph::munin_graph(graph_attributes attributes)
    : attributes_(std::move(attributes)) {}

munin_graph::munin_graph(const std::string& title) {
    attributes_.title = title;
}

auto munin_graph::add_field(const std::string& name, field_attributes attributes)
    -> result_void {
    if (fields_.find(name) != fields_.end()) {
        return make_void_error(munin_error_code::duplicate_field,
                               "Field '" + name + "' is already registered on graph '" +
                                   attributes_.title + "'");
    }

    field_names_.push_back(name);
    fields_.emplace(name, std::move(attributes));
    return make_void_success();
}

auto munin_graph::add_field(const std::string& name, const std::string& label)
    -> result_void {
    field_attributes attributes;
    attributes.label = label;
    return add_field(name, std::move(attributes));
}

bool munin_graph::has_field(const std::string& name) const {
    return fields_.find(name) != fields_.end();
}

const field_attributes* munin_graph::field(const std::string& name) const {
    auto it = fields_.find(name);
    return it != fields_.end() ? &it->second : nullptr;
}

bool munin_graph::has_value(const std::string& name) const {
    return values_.find(name) != values_.end();
}

auto munin_graph::store_value(const std::string& name, field_value value) -> result_void {
    if (!has_field(name)) {
        return make_void_error(munin_error_code::unknown_field,
                               "Field '" + name + "' is not registered on graph '" +
                                   attributes_.title + "'");
    }

    values_[name] = std::move(value);
    return make_void_success();
}

std::string munin_graph::render_config() const {
    std::ostringstream out;
    bool first = true;

    for (const auto& descriptor : graph_attribute_order) {
        if (auto value = descriptor.render(attributes_)) {
            append_line(out, first, "graph_" + std::string(descriptor.name) + " " + *value);
        }
    }

    for (const auto& field_name : field_names_) {
        const auto& attributes = fields_.at(field_name);
        for (const auto& descriptor : field_attribute_order) {
            if (auto value = descriptor.render(attributes)) {
                append_line(out, first,
                            field_name + "." + std::string(descriptor.name) + " " + *value);
            }
        }
    }

    return out.str();
}

std::string munin_graph::render_values() const {
    std::ostringstream out;
    bool first = true;

    for (const auto& field_name : field_names_) {
        auto it = values_.find(field_name);
        if (it == values_.end()) {
            continue;
        }
        append_line(out, first, field_name + ".value " + format_field_value(it->second));
    }

    return out.str();
}

std::string format_field_value(const field_value& value) {
    return std::visit(
        [](const auto& v) -> std::string {
            using value_type = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<value_type, double>) {
                int length = std::snprintf(nullptr, 0, "%f", v);
                std::string text(static_cast<size_t>(length > 0 ? length : 0), '\0');
                std::snprintf(text.data(), text.size() + 1, "%f", v);
                return text;
            } else if constexpr (std::is_same_v<value_type, std::string>) {
                return v;
            } else {
                return std::to_string(v);
            }
        },
        value);
}

std::vector<std::string_view> graph_attribute_names() {
    std::vector<std::string_view> names;
    names.reserve(graph_attribute_order.size());
    for (const auto& descriptor : graph_attribute_order) {
        names.push_back(descriptor.name);
    }
    return names;
}

std::vector<std::string_view> field_attribute_names() {
    std::vector<std::string_view> names;
    names.reserve(field_attribute_order.size());
    for (const auto& descriptor : field_attribute_order) {
        names.push_back(descriptor.name);
    }
    return names;
}

} // namespace munin
} // namespace kcenon
