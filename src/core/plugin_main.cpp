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

#include "kcenon/munin/core/plugin_main.h"


extern char** environ;

namespace kcenon {
namespace munin {

using common::interfaces::log_level;

config_map environment_to_config(char** envp) {
    config_map env;
    if (envp == nullptr) {
        return env;
    }

    for (char** entry = envp; *entry != nullptr; ++entry) {
        std::string text(*entry);
        auto separator = text.find('=');
        if (separator == std::string::npos || separator == 0) {
            continue;
        }
        env.emplace(text.substr(0, separator), text.substr(separator + 1));
    }
    return env;
}

config_map process_environment() {
    return environment_to_config(environ);
}

std::shared_ptr<stderr_logger> make_process_logger(const std::string& plugin_name,
                                                   const config_map& env) {
    auto level = config_parser::get<int>(env, "MUNIN_DEBUG", 0) == 1 ? log_level::debug
                                                                       : log_level::warning;
    return std::make_shared<stderr_logger>(plugin_name, level);
}

int run_plugin(munin_plugin& plugin, std::ostream& out) {
    auto logger = plugin.get_logger();
    auto report = [&logger](const common::error_info& err) {
        if (!logger) {
            return;
        }
        auto info = error_info::from_common_error(err);
        static_cast<void>(logger->log(log_level::error, info.to_string()));
        if (logger->is_enabled(log_level::debug)) {
            static_cast<void>(logger->log(log_level::debug, get_error_details(info.code)));
        }
    };

    auto initialized = plugin.initialize();
    if (initialized.is_err()) {
        report(initialized.error());
        return 1;
    }

    auto status = plugin.run(out);
    out.flush();
    if (status.is_err()) {
        report(status.error());
        return 1;
    }

    return status.value() ? 0 : 1;
}

} // namespace munin
} // namespace kcenon
