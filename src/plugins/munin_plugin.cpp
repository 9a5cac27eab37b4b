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

#include "kcenon/munin/plugins/munin_plugin.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace kcenon {
namespace munin {

using common::interfaces::log_level;

namespace {

std::filesystem::path default_state_file(const std::string& plugin_name) {
    return std::filesystem::path("/tmp") / ("munin-state-" + plugin_name);
}

bool has_whitespace(const std::string& text) {
    return std::any_of(text.begin(), text.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

std::string join(const std::vector<std::string>& items) {
    std::string joined;
    for (const auto& item : items) {
        if (!joined.empty()) {
            joined += ",";
        }
        joined += item;
    }
    return joined;
}

} // namespace

munin_plugin::munin_plugin(std::string name,
                           plugin_type type,
                           std::vector<std::string> argv,
                           config_map env)
    : name_(std::move(name))
    , type_(type)
    , argv_(std::move(argv))
    , env_(std::move(env))
    , state_(default_state_file(name_)) {
    parse_environment();

    if (!name_.empty() && name_.back() == '_' && !argv_.empty()) {
        auto executable = std::filesystem::path(argv_.front()).filename().string();
        if (executable.size() > name_.size() &&
            executable.compare(0, name_.size(), name_) == 0) {
            auto suffix = executable.substr(name_.size());
            if (!has_whitespace(suffix)) {
                arg0_ = std::move(suffix);
            }
        }
    }

    static const std::regex graph_name_validation(graph_name_pattern);
    filters_.insert_or_assign(
        graphs_filter_name,
        attribute_filter(
            config_parser::get_list(env_, std::string("include_") + graphs_filter_name),
            config_parser::get_list(env_, std::string("exclude_") + graphs_filter_name),
            graph_name_validation));
}

void munin_plugin::parse_environment() {
    auto state_path = config_parser::get<std::string>(
        env_, "MUNIN_STATEFILE", default_state_file(name_).string());
    state_ = state_storage(state_path);

    if (config_parser::value_matches(env_, "nested_graphs", R"(\s*(no|off)\s*)", true)) {
        nested_graphs_ = false;
    }
}

void munin_plugin::log(log_level level, const std::string& message) const {
    if (logger_ && logger_->is_enabled(level)) {
        static_cast<void>(logger_->log(level, message));
    }
}

// ============================================================================
// Filters
// ============================================================================

auto munin_plugin::register_filter(const std::string& filter_name,
                                   const std::optional<std::string>& validation_pattern)
    -> result_void {
    // Empty entries are kept: "include_x=," still disables everything not listed
    auto include = config_parser::get_list(env_, "include_" + filter_name);
    auto exclude = config_parser::get_list(env_, "exclude_" + filter_name);

    auto filter = attribute_filter::create(include, exclude, validation_pattern);
    if (filter.is_err()) {
        return result_void::err(filter.error());
    }

    filters_.insert_or_assign(filter_name, filter.value());
    log(log_level::debug, "Registered filter '" + filter_name + "' include=[" +
                              join(include) + "] exclude=[" + join(exclude) + "]");
    return make_void_success();
}

bool munin_plugin::has_filter(const std::string& filter_name) const {
    return filters_.find(filter_name) != filters_.end();
}

auto munin_plugin::check_filter(const std::string& filter_name,
                                const std::string& attribute) const -> result<bool> {
    auto it = filters_.find(filter_name);
    if (it == filters_.end()) {
        return make_error<bool>(munin_error_code::unknown_filter,
                                "Undefined filter: " + filter_name);
    }
    return make_success(it->second.is_enabled(attribute));
}

bool munin_plugin::is_graph_enabled(const std::string& name) const {
    auto enabled = check_filter(graphs_filter_name, name);
    return enabled.is_ok() && enabled.value();
}

// ============================================================================
// Graph registry
// ============================================================================

auto munin_plugin::add_graph(const std::string& name, std::unique_ptr<munin_graph> graph)
    -> result_void {
    if (!graph) {
        return make_void_error(munin_error_code::null_graph,
                               "Graph '" + name + "' has no graph object");
    }
    if (!is_multigraph() && !graph_names_.empty()) {
        return make_void_error(munin_error_code::multiple_graphs_not_allowed,
                               "Simple plugin '" + name_ + "' cannot have more than one graph");
    }
    if (has_graph(name)) {
        return make_void_error(munin_error_code::duplicate_graph,
                               "Graph '" + name + "' is already registered");
    }

    graph_names_.push_back(name);
    graphs_.emplace(name, std::move(graph));
    log(log_level::debug, "Registered graph '" + name + "'");
    return make_void_success();
}

auto munin_plugin::add_subgraph(const std::string& parent,
                                const std::string& name,
                                std::unique_ptr<munin_graph> graph) -> result_void {
    if (!graph) {
        return make_void_error(munin_error_code::null_graph,
                               "Subgraph '" + parent + "." + name + "' has no graph object");
    }
    if (!is_multigraph()) {
        return make_void_error(munin_error_code::multiple_graphs_not_allowed,
                               "Simple plugin '" + name_ + "' cannot have subgraphs");
    }
    if (!has_graph(parent)) {
        return make_void_error(munin_error_code::unknown_parent_graph,
                               "Invalid parent graph name '" + parent +
                                   "' used for subgraph '" + name + "'");
    }

    auto& children = subgraphs_[parent];
    auto existing = std::find_if(children.begin(), children.end(),
                                 [&name](const auto& child) { return child.first == name; });
    if (existing != children.end()) {
        return make_void_error(munin_error_code::duplicate_graph,
                               "Subgraph '" + parent + "." + name + "' is already registered");
    }

    children.emplace_back(name, std::move(graph));
    log(log_level::debug, "Registered subgraph '" + parent + "." + name + "'");
    return make_void_success();
}

bool munin_plugin::has_graph(const std::string& name) const {
    return graphs_.find(name) != graphs_.end();
}

std::vector<std::string> munin_plugin::subgraph_names(const std::string& parent) const {
    std::vector<std::string> names;
    auto it = subgraphs_.find(parent);
    if (it == subgraphs_.end()) {
        return names;
    }
    names.reserve(it->second.size());
    for (const auto& [name, graph] : it->second) {
        names.push_back(name);
    }
    return names;
}

munin_graph* munin_plugin::get_graph(const std::string& name) {
    auto it = graphs_.find(name);
    return it != graphs_.end() ? it->second.get() : nullptr;
}

const munin_graph* munin_plugin::get_graph(const std::string& name) const {
    auto it = graphs_.find(name);
    return it != graphs_.end() ? it->second.get() : nullptr;
}

munin_graph* munin_plugin::get_subgraph(const std::string& parent, const std::string& name) {
    auto it = subgraphs_.find(parent);
    if (it == subgraphs_.end()) {
        return nullptr;
    }
    for (auto& [child_name, graph] : it->second) {
        if (child_name == name) {
            return graph.get();
        }
    }
    return nullptr;
}

auto munin_plugin::graph_has_field(const std::string& graph, const std::string& field) const
    -> result<bool> {
    const auto* target = get_graph(graph);
    if (target == nullptr) {
        return make_error<bool>(munin_error_code::unknown_graph,
                                "Unknown graph '" + graph + "'");
    }
    return make_success(target->has_field(field));
}

auto munin_plugin::graph_field_names(const std::string& graph) const
    -> result<std::vector<std::string>> {
    const auto* target = get_graph(graph);
    if (target == nullptr) {
        return make_error<std::vector<std::string>>(munin_error_code::unknown_graph,
                                                    "Unknown graph '" + graph + "'");
    }
    return make_success(target->field_names());
}

// ============================================================================
// Commands
// ============================================================================

auto munin_plugin::initialize() -> result_void {
    if (initialized_) {
        return make_void_success();
    }

    auto registered = register_graphs();
    if (registered.is_err()) {
        return registered;
    }

    initialized_ = true;
    return make_void_success();
}

template <typename Render>
std::string munin_plugin::render_blocks(Render&& render_graph) const {
    std::ostringstream out;

    for (const auto& name : graph_names_) {
        if (!is_graph_enabled(name)) {
            log(log_level::debug, "Graph '" + name + "' disabled by filter");
            continue;
        }
        if (is_multigraph()) {
            out << "multigraph " << name << '\n';
        }
        out << render_graph(*graphs_.at(name)) << "\n\n";
    }

    if (!nested_graphs_) {
        return out.str();
    }

    for (const auto& parent : graph_names_) {
        auto it = subgraphs_.find(parent);
        // Subgraphs follow their root: a filtered-out root hides its children too
        if (it == subgraphs_.end() || !is_graph_enabled(parent)) {
            continue;
        }
        for (const auto& [child_name, graph] : it->second) {
            out << "multigraph " << parent << '.' << child_name << '\n';
            out << render_graph(*graph) << "\n\n";
        }
    }

    return out.str();
}

auto munin_plugin::config() -> result<std::string> {
    return make_success(render_blocks(
        [](const munin_graph& graph) { return graph.render_config(); }));
}

auto munin_plugin::fetch() -> result<std::string> {
    auto retrieved = retrieve_vals();
    if (retrieved.is_err()) {
        return result<std::string>::err(retrieved.error());
    }

    return make_success(render_blocks(
        [](const munin_graph& graph) { return graph.render_values(); }));
}

auto munin_plugin::autoconf() -> result<bool> {
    return make_success(false);
}

auto munin_plugin::suggest() -> result<std::vector<std::string>> {
    return make_success(std::vector<std::string>{});
}

auto munin_plugin::run(std::string_view command, std::ostream& out) -> result<bool> {
    if (command.empty() || command == "fetch") {
        auto text = fetch();
        if (text.is_err()) {
            return result<bool>::err(text.error());
        }
        out << text.value();
        return make_success(true);
    }

    if (command == "config") {
        auto text = config();
        if (text.is_err()) {
            return result<bool>::err(text.error());
        }
        out << text.value();
        return make_success(true);
    }

    if (command == "autoconf") {
        auto supported = autoconf();
        if (supported.is_err()) {
            return result<bool>::err(supported.error());
        }
        out << (supported.value() ? "yes" : "no") << '\n';
        return make_success(true);
    }

    if (command == "suggest") {
        auto suggestions = suggest();
        if (suggestions.is_err()) {
            return result<bool>::err(suggestions.error());
        }
        for (const auto& suggestion : suggestions.value()) {
            out << suggestion << '\n';
        }
        return make_success(true);
    }

    return make_error<bool>(munin_error_code::unknown_command,
                            "Invalid command argument: " + std::string(command));
}

auto munin_plugin::run(std::ostream& out) -> result<bool> {
    std::string_view command;
    if (argv_.size() > 1) {
        command = argv_[1];
    }
    return run(command, out);
}

// ============================================================================
// State
// ============================================================================

auto munin_plugin::save_state(const std::string& payload) -> result_void {
    auto saved = state_.save(payload);
    if (saved.is_ok()) {
        log(log_level::debug, "Saved plugin state to " + state_.path().string());
    }
    return saved;
}

auto munin_plugin::restore_state() const -> result<std::optional<std::string>> {
    return state_.load();
}

} // namespace munin
} // namespace kcenon
