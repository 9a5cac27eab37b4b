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
 * @file munin_plugin.h
 * @brief Base class for Munin plugins
 *
 * A plugin owns one graph (simple plugins) or several graphs with optional
 * nested subgraphs (multigraph plugins), plus a set of include/exclude
 * filters read from the environment. It implements the fetch, config,
 * autoconf and suggest commands by rendering its graphs.
 *
 * Usage:
 * @code
 * class load_plugin : public munin_plugin {
 * public:
 *     load_plugin(std::vector<std::string> argv, config_map env)
 *         : munin_plugin("load", plugin_type::simple, std::move(argv), std::move(env)) {}
 *
 * protected:
 *     auto register_graphs() -> result_void override {
 *         auto graph = std::make_unique<munin_graph>("Load average");
 *         auto added = graph->add_field("load", "load");
 *         if (added.is_err()) {
 *             return added;
 *         }
 *         return add_graph("load", std::move(graph));
 *     }
 *
 *     auto retrieve_vals() -> result_void override {
 *         return set_graph_value("load", "load", read_load_average());
 *     }
 * };
 * @endcode
 *
 * Lifecycle:
 * 1. Construction: environment parsing, built-in "graphs" filter
 * 2. initialize(): graphs, subgraphs and filters are registered
 * 3. run(): exactly one command is executed and its output rendered
 */

#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <kcenon/common/interfaces/logger_interface.h>

#include "../core/result_types.h"
#include "../filters/attribute_filter.h"
#include "../graph/munin_graph.h"
#include "../storage/state_storage.h"
#include "../utils/config_parser.h"

namespace kcenon {
namespace munin {

/**
 * @enum plugin_type
 * @brief Whether a plugin emits one graph or several
 */
enum class plugin_type {
    simple,     ///< Exactly one graph, no multigraph markers
    multigraph  ///< Several root graphs and nested subgraphs
};

/// Name of the filter applied to root graph names
inline constexpr const char* graphs_filter_name = "graphs";

/// Validation pattern used by register_filter() when none is given
inline constexpr const char* default_filter_pattern = R"(\w+$)";

/// Validation pattern of the built-in graphs filter
inline constexpr const char* graph_name_pattern = R"([\w\-]+$)";

/**
 * @class munin_plugin
 * @brief Graph registry and command dispatcher shared by all plugins
 *
 * Thread Safety:
 * - Not thread-safe. One instance serves one process invocation.
 */
class munin_plugin {
public:
    /**
     * @brief Construct a plugin
     * @param name Fixed plugin name. A trailing '_' marks a wildcard plugin
     *             whose executable name carries an argument (see arg0()).
     * @param type Simple or multigraph plugin
     * @param argv Process arguments, argv[0] being the executable path
     * @param env Process environment
     *
     * Recognized environment entries:
     * - MUNIN_STATEFILE: state file path (default /tmp/munin-state-<name>)
     * - nested_graphs: "no" or "off" disables subgraph output
     * - include_graphs / exclude_graphs: root graph filter lists
     */
    munin_plugin(std::string name,
                 plugin_type type,
                 std::vector<std::string> argv = {},
                 config_map env = {});

    virtual ~munin_plugin() = default;

    // Non-copyable, non-moveable
    munin_plugin(const munin_plugin&) = delete;
    munin_plugin& operator=(const munin_plugin&) = delete;
    munin_plugin(munin_plugin&&) = delete;
    munin_plugin& operator=(munin_plugin&&) = delete;

    const std::string& name() const { return name_; }

    bool is_multigraph() const { return type_ == plugin_type::multigraph; }

    /**
     * @brief Argument embedded in a wildcard plugin's executable name
     *
     * For a plugin named "if_" installed as "if_eth0", arg0() is "eth0".
     */
    const std::optional<std::string>& arg0() const { return arg0_; }

    bool nested_graphs_enabled() const { return nested_graphs_; }

    const std::filesystem::path& state_file() const { return state_.path(); }

    const config_map& environment() const { return env_; }

    const std::vector<std::string>& arguments() const { return argv_; }

    /**
     * @brief Set or replace the logger used for diagnostics
     * @param logger Any ILogger implementation, or nullptr to disable logging
     */
    void set_logger(std::shared_ptr<common::interfaces::ILogger> logger) {
        logger_ = std::move(logger);
    }

    std::shared_ptr<common::interfaces::ILogger> get_logger() const { return logger_; }

    // ------------------------------------------------------------------
    // Filters
    // ------------------------------------------------------------------

    /**
     * @brief Register a filter fed by include_<name> / exclude_<name>
     * @param filter_name Filter name, also the environment variable suffix
     * @param validation_pattern Pattern list entries must match, or nullopt
     * @return invalid_filter_pattern if the pattern does not compile
     *
     * Registering an existing name replaces the previous filter.
     */
    auto register_filter(const std::string& filter_name,
                         const std::optional<std::string>& validation_pattern =
                             std::string(default_filter_pattern)) -> result_void;

    bool has_filter(const std::string& filter_name) const;

    /**
     * @brief Check an attribute against a registered filter
     * @return unknown_filter if @p filter_name was never registered
     */
    auto check_filter(const std::string& filter_name, const std::string& attribute) const
        -> result<bool>;

    /**
     * @brief Check a root graph name against the built-in graphs filter
     */
    bool is_graph_enabled(const std::string& name) const;

    // ------------------------------------------------------------------
    // Graph registry
    // ------------------------------------------------------------------

    /**
     * @brief Register a root graph
     * @return null_graph if @p graph is empty, multiple_graphs_not_allowed for
     *         a second graph on a simple plugin, duplicate_graph for a name
     *         already in use
     */
    auto add_graph(const std::string& name, std::unique_ptr<munin_graph> graph) -> result_void;

    /**
     * @brief Attach a subgraph to a registered root graph
     * @return null_graph if @p graph is empty,
     *         multiple_graphs_not_allowed on simple plugins,
     *         unknown_parent_graph if @p parent is not a root graph,
     *         duplicate_graph if @p parent already has a subgraph @p name
     */
    auto add_subgraph(const std::string& parent,
                      const std::string& name,
                      std::unique_ptr<munin_graph> graph) -> result_void;

    bool has_graph(const std::string& name) const;

    /**
     * @brief Root graph names in registration order
     */
    const std::vector<std::string>& graph_names() const { return graph_names_; }

    /**
     * @brief Subgraph names of a root graph in registration order
     */
    std::vector<std::string> subgraph_names(const std::string& parent) const;

    munin_graph* get_graph(const std::string& name);
    const munin_graph* get_graph(const std::string& name) const;

    munin_graph* get_subgraph(const std::string& parent, const std::string& name);

    auto graph_has_field(const std::string& graph, const std::string& field) const
        -> result<bool>;

    auto graph_field_names(const std::string& graph) const
        -> result<std::vector<std::string>>;

    /**
     * @brief Set a field value on a root graph
     * @return unknown_graph or unknown_field
     */
    template <typename T>
    auto set_graph_value(const std::string& graph, const std::string& field, T&& value)
        -> result_void {
        auto* target = get_graph(graph);
        if (target == nullptr) {
            return make_void_error(munin_error_code::unknown_graph,
                                   "Invalid graph name '" + graph + "' used for setting value");
        }
        return target->set_value(field, std::forward<T>(value));
    }

    /**
     * @brief Set a field value on a subgraph
     * @return unknown_parent_graph, unknown_graph or unknown_field
     */
    template <typename T>
    auto set_subgraph_value(const std::string& parent,
                            const std::string& subgraph,
                            const std::string& field,
                            T&& value) -> result_void {
        if (!has_graph(parent)) {
            return make_void_error(munin_error_code::unknown_parent_graph,
                                   "Invalid parent graph name '" + parent +
                                       "' used for setting value on subgraph '" + subgraph + "'");
        }
        auto* target = get_subgraph(parent, subgraph);
        if (target == nullptr) {
            return make_void_error(munin_error_code::unknown_graph,
                                   "Invalid subgraph name '" + parent + "." + subgraph +
                                       "' used for setting value");
        }
        return target->set_value(field, std::forward<T>(value));
    }

    // ------------------------------------------------------------------
    // Commands
    // ------------------------------------------------------------------

    /**
     * @brief Register graphs, subgraphs and filters
     *
     * Calls register_graphs() once; later calls return success without
     * registering again.
     */
    auto initialize() -> result_void;

    bool is_initialized() const { return initialized_; }

    /**
     * @brief Render the configuration of all enabled graphs
     */
    auto config() -> result<std::string>;

    /**
     * @brief Retrieve values and render them for all enabled graphs
     */
    auto fetch() -> result<std::string>;

    /**
     * @brief Report whether the plugin can run on this host
     *
     * Auto-configuration is unsupported by default.
     */
    virtual auto autoconf() -> result<bool>;

    /**
     * @brief Suggest wildcard links for this plugin
     *
     * No suggestions by default.
     */
    virtual auto suggest() -> result<std::vector<std::string>>;

    /**
     * @brief Execute a command and write its output
     * @param command One of fetch, config, autoconf, suggest; empty means fetch
     * @param out Stream receiving the protocol output
     * @return The command's truth value, or unknown_command
     *
     * Output is rendered completely before anything is written to @p out.
     */
    auto run(std::string_view command, std::ostream& out) -> result<bool>;

    /**
     * @brief Execute the command given as argv[1] (fetch when absent)
     */
    auto run(std::ostream& out) -> result<bool>;

    // ------------------------------------------------------------------
    // State
    // ------------------------------------------------------------------

    auto save_state(const std::string& payload) -> result_void;

    auto restore_state() const -> result<std::optional<std::string>>;

protected:
    /**
     * @brief Register graphs, subgraphs and custom filters
     */
    virtual auto register_graphs() -> result_void { return make_void_success(); }

    /**
     * @brief Populate field values for the current invocation
     */
    virtual auto retrieve_vals() -> result_void { return make_void_success(); }

    void log(common::interfaces::log_level level, const std::string& message) const;

private:
    using subgraph_list = std::vector<std::pair<std::string, std::unique_ptr<munin_graph>>>;

    void parse_environment();

    /// Renders every enabled graph block with @p render_graph
    template <typename Render>
    std::string render_blocks(Render&& render_graph) const;

    std::string name_;
    plugin_type type_;
    std::vector<std::string> argv_;
    config_map env_;

    std::optional<std::string> arg0_;
    bool nested_graphs_{true};
    state_storage state_;

    std::vector<std::string> graph_names_;
    std::unordered_map<std::string, std::unique_ptr<munin_graph>> graphs_;
    std::unordered_map<std::string, subgraph_list> subgraphs_;
    std::unordered_map<std::string, attribute_filter> filters_;

    std::shared_ptr<common::interfaces::ILogger> logger_;
    bool initialized_{false};
};

} // namespace munin
} // namespace kcenon
