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
 * @file graph_types.h
 * @brief Graph and field attribute records
 *
 * Graph and field display attributes are explicit records with optional
 * members. Rendering is driven by the ordered descriptor tables at the end of
 * this file, which fix both the attribute names used on the wire and the
 * order in which they are emitted.
 */

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace kcenon {
namespace munin {

/**
 * @enum stat_type
 * @brief How the daemon interprets successive field values
 */
enum class stat_type {
    counter,   ///< Ever-increasing counter, wraps are detected
    absolute,  ///< Counter reset on every read
    derive,    ///< Counter without wrap detection
    gauge      ///< Value used as-is
};

/**
 * @enum draw_style
 * @brief How a field is drawn on its graph
 */
enum class draw_style {
    area,
    line1,
    line2,
    line3,
    stack,
    linestack1,
    linestack2,
    linestack3,
    areastack
};

inline std::string to_string(stat_type type) {
    switch (type) {
        case stat_type::counter:
            return "COUNTER";
        case stat_type::absolute:
            return "ABSOLUTE";
        case stat_type::derive:
            return "DERIVE";
        case stat_type::gauge:
        default:
            return "GAUGE";
    }
}

inline std::string to_string(draw_style style) {
    switch (style) {
        case draw_style::area:
            return "AREA";
        case draw_style::line1:
            return "LINE1";
        case draw_style::line2:
            return "LINE2";
        case draw_style::line3:
            return "LINE3";
        case draw_style::stack:
            return "STACK";
        case draw_style::linestack1:
            return "LINESTACK1";
        case draw_style::linestack2:
            return "LINESTACK2";
        case draw_style::linestack3:
            return "LINESTACK3";
        case draw_style::areastack:
        default:
            return "AREASTACK";
    }
}

/**
 * @struct graph_attributes
 * @brief Display attributes of a graph (graph_* config lines)
 */
struct graph_attributes {
    std::string title;                        ///< Graph title (always emitted)
    std::optional<std::string> category;      ///< Category the graph is listed under
    std::optional<std::string> vlabel;        ///< Vertical axis label
    std::optional<std::string> info;          ///< Graph description
    std::optional<std::string> args;          ///< Extra arguments for the graph renderer
    std::optional<std::string> period;        ///< Rate unit: "second" or "minute"
    std::optional<bool> scale;                ///< Apply SI unit scaling
    std::optional<std::string> total;         ///< Label of a synthetic sum-of-fields line
    std::optional<std::string> order;         ///< Space separated field drawing order
    std::optional<std::string> printfformat;  ///< Number format on the graph legend
    std::optional<int> width;                 ///< Graph width in pixels
    std::optional<int> height;                ///< Graph height in pixels
};

/**
 * @struct field_attributes
 * @brief Display attributes of a field (<field>.* config lines)
 *
 * Thresholds and bounds are kept as text since the protocol accepts values
 * such as "U" or "min:max" ranges.
 */
struct field_attributes {
    std::string label;                     ///< Legend label (always emitted)
    std::optional<stat_type> type;         ///< Statistic type
    std::optional<draw_style> draw;        ///< Drawing style
    std::optional<std::string> info;       ///< Field description
    std::optional<std::string> extinfo;    ///< Extended information
    std::optional<std::string> colour;     ///< RRGGBB hex colour
    std::optional<std::string> negative;   ///< Field drawn mirrored below the axis
    std::optional<bool> graph;             ///< Draw this field on the graph
    std::optional<std::string> min;        ///< Minimum valid value
    std::optional<std::string> max;        ///< Maximum valid value
    std::optional<std::string> cdef;       ///< RPN expression deriving the drawn value
    std::optional<std::string> line;       ///< Horizontal reference line
    std::optional<std::string> warning;    ///< Warning threshold
    std::optional<std::string> critical;   ///< Critical threshold
};

/**
 * @brief Current value of a field
 *
 * Floating point values are rendered with six decimals, everything else in
 * its natural text form.
 */
using field_value = std::variant<std::int64_t, std::uint64_t, double, std::string>;

namespace detail {

inline std::optional<std::string> render(const std::optional<std::string>& value) {
    return value;
}

inline std::optional<std::string> render(const std::optional<bool>& value) {
    if (!value) {
        return std::nullopt;
    }
    return std::string(*value ? "yes" : "no");
}

inline std::optional<std::string> render(const std::optional<int>& value) {
    if (!value) {
        return std::nullopt;
    }
    return std::to_string(*value);
}

template <typename Enum>
std::optional<std::string> render_enum(const std::optional<Enum>& value) {
    if (!value) {
        return std::nullopt;
    }
    return to_string(*value);
}

} // namespace detail

/**
 * @brief Wire name and accessor of one rendered attribute
 */
template <typename Record>
struct attribute_descriptor {
    std::string_view name;
    std::optional<std::string> (*render)(const Record&);
};

using graph_attribute_descriptor = attribute_descriptor<graph_attributes>;
using field_attribute_descriptor = attribute_descriptor<field_attributes>;

/**
 * @brief Emission order of graph_* lines
 */
inline constexpr std::array<graph_attribute_descriptor, 12> graph_attribute_order{{
    {"title", [](const graph_attributes& a) -> std::optional<std::string> { return a.title; }},
    {"category", [](const graph_attributes& a) { return detail::render(a.category); }},
    {"vlabel", [](const graph_attributes& a) { return detail::render(a.vlabel); }},
    {"info", [](const graph_attributes& a) { return detail::render(a.info); }},
    {"args", [](const graph_attributes& a) { return detail::render(a.args); }},
    {"period", [](const graph_attributes& a) { return detail::render(a.period); }},
    {"scale", [](const graph_attributes& a) { return detail::render(a.scale); }},
    {"total", [](const graph_attributes& a) { return detail::render(a.total); }},
    {"order", [](const graph_attributes& a) { return detail::render(a.order); }},
    {"printfformat", [](const graph_attributes& a) { return detail::render(a.printfformat); }},
    {"width", [](const graph_attributes& a) { return detail::render(a.width); }},
    {"height", [](const graph_attributes& a) { return detail::render(a.height); }},
}};

/**
 * @brief Emission order of <field>.* lines
 */
inline constexpr std::array<field_attribute_descriptor, 14> field_attribute_order{{
    {"label", [](const field_attributes& a) -> std::optional<std::string> { return a.label; }},
    {"type", [](const field_attributes& a) { return detail::render_enum(a.type); }},
    {"draw", [](const field_attributes& a) { return detail::render_enum(a.draw); }},
    {"info", [](const field_attributes& a) { return detail::render(a.info); }},
    {"extinfo", [](const field_attributes& a) { return detail::render(a.extinfo); }},
    {"colour", [](const field_attributes& a) { return detail::render(a.colour); }},
    {"negative", [](const field_attributes& a) { return detail::render(a.negative); }},
    {"graph", [](const field_attributes& a) { return detail::render(a.graph); }},
    {"min", [](const field_attributes& a) { return detail::render(a.min); }},
    {"max", [](const field_attributes& a) { return detail::render(a.max); }},
    {"cdef", [](const field_attributes& a) { return detail::render(a.cdef); }},
    {"line", [](const field_attributes& a) { return detail::render(a.line); }},
    {"warning", [](const field_attributes& a) { return detail::render(a.warning); }},
    {"critical", [](const field_attributes& a) { return detail::render(a.critical); }},
}};

} // namespace munin
} // namespace kcenon
