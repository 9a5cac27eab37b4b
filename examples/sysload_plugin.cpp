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

/**
 * @file sysload_plugin.cpp
 * @brief Multigraph plugin reporting load average, process counts and uptime
 *
 * Graphs:
 * - load: 1, 5 and 15 minute load averages from /proc/loadavg
 * - load.processes: runnable and total scheduling entities (subgraph)
 * - uptime: uptime in days and the number of reboots seen so far
 *
 * The reboot counter is kept in the plugin state file between runs.
 *
 * Environment:
 * - include_loadavg / exclude_loadavg: select load1, load5, load15
 * - include_graphs / exclude_graphs: select load, uptime
 */

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include <kcenon/munin/core/plugin_main.h>

using namespace kcenon::munin;

namespace {

struct loadavg_data {
    double load1{0.0};
    double load5{0.0};
    double load15{0.0};
    std::int64_t runnable{0};
    std::int64_t total{0};
};

/**
 * Format: load1 load5 load15 runnable/total last_pid
 * Example: 0.20 0.18 0.12 1/80 11206
 */
auto read_proc_loadavg() -> result<loadavg_data> {
    std::ifstream file("/proc/loadavg");
    if (!file.is_open()) {
        return make_error<loadavg_data>(munin_error_code::value_retrieval_failed,
                                        "Cannot open /proc/loadavg");
    }

    loadavg_data data;
    char separator = 0;
    if (!(file >> data.load1 >> data.load5 >> data.load15 >> data.runnable >> separator >>
          data.total) ||
        separator != '/') {
        return make_error<loadavg_data>(munin_error_code::value_retrieval_failed,
                                        "Malformed /proc/loadavg");
    }
    return make_success(data);
}

auto read_proc_uptime() -> result<double> {
    std::ifstream file("/proc/uptime");
    if (!file.is_open()) {
        return make_error<double>(munin_error_code::value_retrieval_failed,
                                  "Cannot open /proc/uptime");
    }

    double uptime_seconds = 0.0;
    if (!(file >> uptime_seconds)) {
        return make_error<double>(munin_error_code::value_retrieval_failed,
                                  "Malformed /proc/uptime");
    }
    return make_success(uptime_seconds);
}

field_attributes gauge_field(const std::string& label, const std::string& info) {
    field_attributes field;
    field.label = label;
    field.type = stat_type::gauge;
    field.draw = draw_style::line2;
    field.info = info;
    field.min = "0";
    return field;
}

class sysload_plugin : public munin_plugin {
public:
    sysload_plugin(std::vector<std::string> argv, config_map env)
        : munin_plugin("sysload", plugin_type::multigraph, std::move(argv), std::move(env)) {}

    auto autoconf() -> result<bool> override {
        std::ifstream file("/proc/loadavg");
        return make_success(file.is_open());
    }

protected:
    auto register_graphs() -> result_void override {
        auto filter = register_filter("loadavg");
        if (filter.is_err()) {
            return filter;
        }

        auto registered = register_load_graph();
        if (registered.is_err()) {
            return registered;
        }
        registered = register_process_graph();
        if (registered.is_err()) {
            return registered;
        }
        return register_uptime_graph();
    }

    auto retrieve_vals() -> result_void override {
        auto loadavg = read_proc_loadavg();
        if (loadavg.is_err()) {
            return result_void::err(loadavg.error());
        }
        const auto& data = loadavg.value();

        const std::pair<const char*, double> averages[] = {
            {"load1", data.load1}, {"load5", data.load5}, {"load15", data.load15}};
        for (const auto& [field, value] : averages) {
            if (!get_graph("load")->has_field(field)) {
                continue;
            }
            auto stored = set_graph_value("load", field, value);
            if (stored.is_err()) {
                return stored;
            }
        }

        auto stored = set_subgraph_value("load", "processes", "runnable", data.runnable);
        if (stored.is_err()) {
            return stored;
        }
        stored = set_subgraph_value("load", "processes", "total", data.total);
        if (stored.is_err()) {
            return stored;
        }

        return retrieve_uptime();
    }

private:
    auto register_load_graph() -> result_void {
        graph_attributes attributes;
        attributes.title = "Load average";
        attributes.category = "system";
        attributes.vlabel = "load";
        attributes.args = "--base 1000 -l 0";
        attributes.scale = false;

        auto graph = std::make_unique<munin_graph>(attributes);
        const std::pair<const char*, const char*> fields[] = {
            {"load1", "1 minute"}, {"load5", "5 minutes"}, {"load15", "15 minutes"}};
        for (const auto& [name, label] : fields) {
            auto enabled = check_filter("loadavg", name);
            if (enabled.is_err()) {
                return result_void::err(enabled.error());
            }
            if (!enabled.value()) {
                continue;
            }
            auto added = graph->add_field(
                name, gauge_field(label, std::string("Load average over ") + label));
            if (added.is_err()) {
                return added;
            }
        }
        return add_graph("load", std::move(graph));
    }

    auto register_process_graph() -> result_void {
        graph_attributes attributes;
        attributes.title = "Scheduling entities";
        attributes.category = "system";
        attributes.vlabel = "entities";

        auto graph = std::make_unique<munin_graph>(attributes);
        auto added = graph->add_field(
            "runnable", gauge_field("runnable", "Currently runnable entities"));
        if (added.is_err()) {
            return added;
        }
        added = graph->add_field("total", gauge_field("total", "Existing entities"));
        if (added.is_err()) {
            return added;
        }
        return add_subgraph("load", "processes", std::move(graph));
    }

    auto register_uptime_graph() -> result_void {
        graph_attributes attributes;
        attributes.title = "Uptime";
        attributes.category = "system";
        attributes.vlabel = "days";
        attributes.args = "--base 1000 -l 0";

        auto graph = std::make_unique<munin_graph>(attributes);
        auto uptime = gauge_field("uptime", "System uptime in days");
        uptime.draw = draw_style::area;
        auto added = graph->add_field("uptime", uptime);
        if (added.is_err()) {
            return added;
        }

        field_attributes reboots;
        reboots.label = "reboots";
        reboots.type = stat_type::gauge;
        reboots.graph = false;
        reboots.info = "Reboots observed by this plugin";
        added = graph->add_field("reboots", reboots);
        if (added.is_err()) {
            return added;
        }
        return add_graph("uptime", std::move(graph));
    }

    auto retrieve_uptime() -> result_void {
        auto uptime = read_proc_uptime();
        if (uptime.is_err()) {
            return result_void::err(uptime.error());
        }

        auto previous = load_record();
        if (previous.is_err()) {
            return result_void::err(previous.error());
        }

        auto last_uptime = previous.value().get<double>("uptime", 0.0);
        auto reboots = previous.value().get<std::int64_t>("reboots", 0);
        if (uptime.value() < last_uptime) {
            ++reboots;
            log(stderr_logger::log_level::info,
                "Reboot detected, " + std::to_string(reboots) + " so far");
        }

        state_record next;
        if (!next.set("uptime", uptime.value()) || !next.set("reboots", reboots)) {
            return make_void_error(munin_error_code::state_write_failed,
                                   "Cannot encode plugin state");
        }
        auto saved = save_state(next.serialize());
        if (saved.is_err()) {
            return saved;
        }

        auto stored = set_graph_value("uptime", "uptime", uptime.value() / 86400.0);
        if (stored.is_err()) {
            return stored;
        }
        return set_graph_value("uptime", "reboots", reboots);
    }

    auto load_record() const -> result<state_record> {
        auto payload = restore_state();
        if (payload.is_err()) {
            return result<state_record>::err(payload.error());
        }
        if (!payload.value()) {
            return make_success(state_record{});
        }
        return state_record::parse(*payload.value());
    }
};

} // namespace

int main(int argc, char** argv) {
    return munin_main<sysload_plugin>(argc, argv);
}
