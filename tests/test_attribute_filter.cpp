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
#include <kcenon/munin/filters/attribute_filter.h>

#include <regex>

namespace kcenon {
namespace munin {
namespace {

// Test fixture for attribute_filter tests
class AttributeFilterTest : public ::testing::Test {
   protected:
    static attribute_filter make_validated(const std::vector<std::string>& include,
                                           const std::vector<std::string>& exclude) {
        auto filter = attribute_filter::create(include, exclude, std::string(R"(\w+$)"));
        EXPECT_TRUE(filter.is_ok());
        return filter.value();
    }
};

// Test that empty lists enable everything
TEST_F(AttributeFilterTest, EmptyListsEnableEveryName) {
    attribute_filter filter({}, {});

    EXPECT_TRUE(filter.default_enabled());
    EXPECT_EQ(filter.override_count(), 0u);
    for (const auto* name : {"cpu", "memory", "disk-io", "", "anything at all"}) {
        EXPECT_TRUE(filter.is_enabled(name)) << "name: " << name;
    }
}

// Test that a non-empty include list disables unlisted names
TEST_F(AttributeFilterTest, IncludeListDisablesUnlistedNames) {
    attribute_filter filter({"cpu", "memory"}, {});

    EXPECT_FALSE(filter.default_enabled());
    EXPECT_TRUE(filter.is_enabled("cpu"));
    EXPECT_TRUE(filter.is_enabled("memory"));
    EXPECT_FALSE(filter.is_enabled("disk"));
    EXPECT_FALSE(filter.is_enabled("network"));
}

// Test exclude list only
TEST_F(AttributeFilterTest, ExcludeListDisablesListedNames) {
    attribute_filter filter({}, {"swap"});

    EXPECT_TRUE(filter.default_enabled());
    EXPECT_FALSE(filter.is_enabled("swap"));
    EXPECT_TRUE(filter.is_enabled("cpu"));
}

// Test that exclusion wins over inclusion
TEST_F(AttributeFilterTest, ExcludeWinsOverInclude) {
    attribute_filter filter({"cpu", "memory"}, {"memory"});

    EXPECT_TRUE(filter.is_enabled("cpu"));
    EXPECT_FALSE(filter.is_enabled("memory"));
    EXPECT_FALSE(filter.is_enabled("disk"));
}

// Test that entries failing validation are ignored
TEST_F(AttributeFilterTest, InvalidIncludeEntryFallsBackToDefault) {
    auto filter = make_validated({"bad name!"}, {});

    // The include list is non-empty, so the default is still disabled
    EXPECT_FALSE(filter.default_enabled());
    EXPECT_FALSE(filter.is_enabled("bad name!"));
    EXPECT_EQ(filter.override_count(), 0u);
}

TEST_F(AttributeFilterTest, InvalidExcludeEntryHasNoEffect) {
    auto filter = make_validated({}, {"-dash"});

    EXPECT_TRUE(filter.is_enabled("-dash"));
    EXPECT_EQ(filter.override_count(), 0u);
}

// Test that validation anchors at the start of the name only
TEST_F(AttributeFilterTest, ValidationMatchesFromStartOfName) {
    attribute_filter filter({}, {"eth0", "x eth1"}, std::regex(R"([\w\-]+)"));

    EXPECT_FALSE(filter.is_enabled("eth0"));
    // "x eth1" matches "x" from the start, so it is accepted as an entry
    EXPECT_FALSE(filter.is_enabled("x eth1"));
    EXPECT_TRUE(filter.is_enabled("eth1"));
}

TEST_F(AttributeFilterTest, ValidPatternAppliesToBothLists) {
    auto filter = make_validated({"cpu", "not valid"}, {"memory", "also not"});

    EXPECT_TRUE(filter.is_enabled("cpu"));
    EXPECT_FALSE(filter.is_enabled("memory"));
    EXPECT_FALSE(filter.is_enabled("not valid"));
    EXPECT_FALSE(filter.is_enabled("also not"));
    EXPECT_EQ(filter.override_count(), 2u);
}

// Test create without a pattern
TEST_F(AttributeFilterTest, CreateWithoutPatternAcceptsEverything) {
    auto filter = attribute_filter::create({"weird name"}, {}, std::nullopt);

    ASSERT_TRUE(filter.is_ok());
    EXPECT_TRUE(filter.value().is_enabled("weird name"));
}

// Test create with a pattern that does not compile
TEST_F(AttributeFilterTest, CreateRejectsInvalidPattern) {
    auto filter = attribute_filter::create({}, {}, std::string("([unclosed"));

    ASSERT_TRUE(filter.is_err());
    EXPECT_EQ(error_code_of(filter.error()), munin_error_code::invalid_filter_pattern);
}

} // namespace
} // namespace munin
} // namespace kcenon
