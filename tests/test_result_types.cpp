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
#include "kcenon/munin/core/result_types.h"
#include "kcenon/munin/core/error_codes.h"

#include <string>

using namespace kcenon::munin;

/**
 * @brief Test basic Result pattern functionality
 */
class ResultTypesTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ResultTypesTest, SuccessResultContainsValue) {
    auto result = make_success<int>(42);

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_EQ(result.value(), 42);
}

TEST_F(ResultTypesTest, ErrorResultContainsError) {
    auto result = make_error<int>(munin_error_code::unknown_filter, "Undefined filter: disks");

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(static_cast<munin_error_code>(result.error().code), munin_error_code::unknown_filter);
    EXPECT_EQ(result.error().message, "Undefined filter: disks");
}

TEST_F(ResultTypesTest, ErrorWithoutMessageUsesCodeText) {
    auto result = make_error<std::string>(munin_error_code::unknown_command);

    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().message, "Unknown command");
}

TEST_F(ResultTypesTest, ValueOrReturnsDefaultOnError) {
    auto error_result = make_error<int>(munin_error_code::unknown_error);
    EXPECT_EQ(error_result.value_or(100), 100);

    auto success_result = make_success<int>(42);
    EXPECT_EQ(success_result.value_or(100), 42);
}

TEST_F(ResultTypesTest, ResultVoidSuccess) {
    auto result = make_void_success();

    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
}

TEST_F(ResultTypesTest, ResultVoidError) {
    auto result = make_void_error(munin_error_code::state_write_failed, "Disk is read-only");

    EXPECT_FALSE(result.is_ok());
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(error_code_of(result.error()), munin_error_code::state_write_failed);
}

TEST_F(ResultTypesTest, ErrorCodeToString) {
    EXPECT_EQ(error_code_to_string(munin_error_code::success), "Success");
    EXPECT_EQ(error_code_to_string(munin_error_code::duplicate_field), "Duplicate field");
    EXPECT_EQ(error_code_to_string(munin_error_code::multiple_graphs_not_allowed),
              "Multiple graphs not allowed");
    EXPECT_EQ(error_code_to_string(munin_error_code::state_corrupted), "State is corrupted");
}

TEST_F(ResultTypesTest, ErrorCodesAreGroupedByComponent) {
    EXPECT_EQ(static_cast<int>(munin_error_code::duplicate_field), 1000);
    EXPECT_EQ(static_cast<int>(munin_error_code::unknown_filter), 2000);
    EXPECT_EQ(static_cast<int>(munin_error_code::multiple_graphs_not_allowed), 3000);
    EXPECT_EQ(static_cast<int>(munin_error_code::state_read_failed), 4000);
}

TEST_F(ResultTypesTest, ErrorInfoRoundTripsThroughCommonError) {
    error_info info(munin_error_code::unknown_parent_graph, "No graph 'disk'", "add_subgraph");

    auto common_error = info.to_common_error();
    EXPECT_EQ(common_error.message, "No graph 'disk'");

    auto restored = error_info::from_common_error(common_error);
    EXPECT_EQ(restored.code, munin_error_code::unknown_parent_graph);
    ASSERT_TRUE(restored.context.has_value());
    EXPECT_EQ(restored.context.value(), "add_subgraph");
    EXPECT_EQ(restored.to_string(),
              "[Unknown parent graph] No graph 'disk' Context: add_subgraph");
}
