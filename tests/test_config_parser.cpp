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

#include <gtest/gtest.h>
#include <kcenon/munin/utils/config_parser.h>

#include <cstddef>
#include <string>
#include <vector>

namespace kcenon {
namespace munin {
namespace {

// Test fixture for config_parser tests
class ConfigParserTest : public ::testing::Test {
   protected:
    config_map env_{
        {"MUNIN_STATEFILE", "/var/lib/munin-node/state"},
        {"MUNIN_DEBUG", "1"},
        {"enabled", "Yes"},
        {"port", "not-a-number"},
        {"include_graphs", " cpu, memory ,,disk "},
        {"exclude_graphs", " , "},
        {"include_disks", ""},
        {"nested_graphs", " OFF "},
    };
};

// Test typed lookups
TEST_F(ConfigParserTest, ParsesTypedValues) {
    EXPECT_EQ(config_parser::get<std::string>(env_, "MUNIN_STATEFILE", "/tmp/x"),
              "/var/lib/munin-node/state");
    EXPECT_EQ(config_parser::get<int>(env_, "MUNIN_DEBUG", 0), 1);
    EXPECT_EQ(config_parser::get<std::size_t>(env_, "MUNIN_DEBUG", 0), 1u);
}

TEST_F(ConfigParserTest, FallsBackToDefault) {
    EXPECT_EQ(config_parser::get<int>(env_, "missing", 7), 7);
    EXPECT_EQ(config_parser::get<int>(env_, "port", 4949), 4949);
    EXPECT_EQ(config_parser::get<std::string>(env_, "missing", "fallback"), "fallback");
}

// Test comma separated lists
TEST_F(ConfigParserTest, SplitsAndTrimsLists) {
    auto graphs = config_parser::get_list(env_, "include_graphs");

    ASSERT_EQ(graphs.size(), 4u);
    EXPECT_EQ(graphs[0], "cpu");
    EXPECT_EQ(graphs[1], "memory");
    EXPECT_EQ(graphs[2], "");
    EXPECT_EQ(graphs[3], "disk");
}

TEST_F(ConfigParserTest, KeepsEmptyEntries) {
    auto blanks = config_parser::get_list(env_, "exclude_graphs");

    ASSERT_EQ(blanks.size(), 2u);
    EXPECT_EQ(blanks[0], "");
    EXPECT_EQ(blanks[1], "");
}

TEST_F(ConfigParserTest, AbsentOrEmptyValueHasNoEntries) {
    EXPECT_TRUE(config_parser::get_list(env_, "missing").empty());
    EXPECT_TRUE(config_parser::get_list(env_, "include_disks").empty());
}

// Test keyword matching
TEST_F(ConfigParserTest, MatchesKeywordsCaseInsensitively) {
    EXPECT_TRUE(config_parser::value_matches(env_, "nested_graphs", R"(\s*(no|off)\s*)", true));
    EXPECT_FALSE(config_parser::value_matches(env_, "nested_graphs", R"(\s*(no|off)\s*)"));
    EXPECT_FALSE(config_parser::value_matches(env_, "enabled", R"(\s*(no|off)\s*)", true));
    EXPECT_FALSE(config_parser::value_matches(env_, "missing", ".*", true));
}

} // namespace
} // namespace munin
} // namespace kcenon
