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
 * @file plugin_main.h
 * @brief Process entry point shared by plugin executables
 *
 * Usage:
 * @code
 * int main(int argc, char** argv) {
 *     return kcenon::munin::munin_main<load_plugin>(argc, argv);
 * }
 * @endcode
 *
 * The plugin type must be constructible from (std::vector<std::string>, config_map).
 */

#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "../adapters/stderr_logger.h"
#include "../plugins/munin_plugin.h"
#include "../utils/config_parser.h"

namespace kcenon {
namespace munin {

/**
 * @brief Capture a NULL-terminated "KEY=value" array as a config_map
 * @param envp Environment block, usually the process environment
 *
 * Entries without '=' are ignored. The first occurrence of a key wins.
 */
config_map environment_to_config(char** envp);

/**
 * @brief Capture the current process environment
 */
config_map process_environment();

/**
 * @brief Initialize a plugin, run its command and map the outcome to an exit status
 * @param plugin Plugin to run; argv[1] selects the command
 * @param out Stream receiving the protocol output
 * @return 0 when the command reported true, 1 when it reported false or failed
 *
 * Failures are logged through the plugin's logger.
 */
int run_plugin(munin_plugin& plugin, std::ostream& out);

/**
 * @brief Build a logger for a plugin process
 *
 * The level is debug when MUNIN_DEBUG is 1, warning otherwise.
 */
std::shared_ptr<stderr_logger> make_process_logger(const std::string& plugin_name,
                                                   const config_map& env);

/**
 * @brief Complete main() for a plugin executable
 */
template <typename Plugin>
int munin_main(int argc, char** argv) {
    std::vector<std::string> args(argv, argv + argc);

    Plugin plugin(std::move(args), process_environment());
    plugin.set_logger(make_process_logger(plugin.name(), plugin.environment()));
    return run_plugin(plugin, std::cout);
}

} // namespace munin
} // namespace kcenon
