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
 * @file error_codes.h
 * @brief Munin plugin framework error codes
 *
 * This file defines error codes used throughout the plugin framework.
 * Codes are grouped in numbered ranges by the component that reports them.
 */

#include <cstdint>
#include <string>

namespace kcenon { namespace munin {

/**
 * @enum munin_error_code
 * @brief Error codes for graph, filter, plugin and state operations
 */
enum class munin_error_code : std::uint32_t {
    // Success
    success = 0,

    // Graph errors (1000-1999)
    duplicate_field = 1000,
    unknown_field = 1001,

    // Filter errors (2000-2999)
    unknown_filter = 2000,
    invalid_filter_pattern = 2001,

    // Plugin errors (3000-3999)
    multiple_graphs_not_allowed = 3000,
    unknown_parent_graph = 3001,
    unknown_graph = 3002,
    duplicate_graph = 3003,
    unknown_command = 3004,
    value_retrieval_failed = 3005,
    null_graph = 3006,

    // State errors (4000-4999)
    state_read_failed = 4000,
    state_write_failed = 4001,
    state_corrupted = 4002,

    // Unknown error
    unknown_error = 9999
};

/**
 * @brief Convert error code to string representation
 * @param code The error code to convert
 * @return String representation of the error code
 */
inline std::string error_code_to_string(munin_error_code code) {
    switch (code) {
        case munin_error_code::success:
            return "Success";

        // Graph errors
        case munin_error_code::duplicate_field:
            return "Duplicate field";
        case munin_error_code::unknown_field:
            return "Unknown field";

        // Filter errors
        case munin_error_code::unknown_filter:
            return "Unknown filter";
        case munin_error_code::invalid_filter_pattern:
            return "Invalid filter pattern";

        // Plugin errors
        case munin_error_code::multiple_graphs_not_allowed:
            return "Multiple graphs not allowed";
        case munin_error_code::unknown_parent_graph:
            return "Unknown parent graph";
        case munin_error_code::unknown_graph:
            return "Unknown graph";
        case munin_error_code::duplicate_graph:
            return "Duplicate graph";
        case munin_error_code::unknown_command:
            return "Unknown command";
        case munin_error_code::value_retrieval_failed:
            return "Value retrieval failed";
        case munin_error_code::null_graph:
            return "Null graph";

        // State errors
        case munin_error_code::state_read_failed:
            return "State read failed";
        case munin_error_code::state_write_failed:
            return "State write failed";
        case munin_error_code::state_corrupted:
            return "State is corrupted";

        case munin_error_code::unknown_error:
        default:
            return "Unknown error";
    }
}

/**
 * @brief Get detailed error message
 * @param code The error code
 * @return Detailed error message with suggestions
 */
inline std::string get_error_details(munin_error_code code) {
    switch (code) {
        case munin_error_code::duplicate_field:
            return "A field with the same name is already registered on the graph. Field names must be unique per graph.";
        case munin_error_code::unknown_field:
            return "The field was never added to the graph. Register fields before setting values.";
        case munin_error_code::unknown_filter:
            return "The filter was never registered. Call register_filter() during plugin initialization.";
        case munin_error_code::multiple_graphs_not_allowed:
            return "Simple plugins own a single graph. Declare the plugin as multigraph to add more graphs.";
        case munin_error_code::unknown_parent_graph:
            return "Subgraphs must be attached to a registered root graph.";
        case munin_error_code::null_graph:
            return "add_graph() and add_subgraph() need a constructed munin_graph.";
        case munin_error_code::unknown_command:
            return "Supported commands are fetch, config, autoconf and suggest.";
        case munin_error_code::state_write_failed:
            return "The plugin state file could not be written. Check MUNIN_STATEFILE and directory permissions.";
        case munin_error_code::state_corrupted:
            return "The plugin state file is malformed. Remove it to start from an empty state.";
        default:
            return error_code_to_string(code);
    }
}

} } // namespace kcenon::munin
