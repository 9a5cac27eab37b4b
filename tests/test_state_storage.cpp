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
#include <kcenon/munin/storage/state_storage.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace kcenon {
namespace munin {
namespace {

// Test fixture for state persistence tests
class StateStorageTest : public ::testing::Test {
   protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("munin_state_test_") + info->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path dir_;
};

// Test loading a state file that does not exist yet
TEST_F(StateStorageTest, AbsentFileLoadsAsEmpty) {
    state_storage storage(dir_ / "plugin");

    EXPECT_FALSE(storage.exists());
    auto loaded = storage.load();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_FALSE(loaded.value().has_value());
}

// Test save and load
TEST_F(StateStorageTest, SaveThenLoadReturnsPayload) {
    state_storage storage(dir_ / "plugin");
    const std::string payload = "counter 42\nbinary \x01\x02 data";

    ASSERT_TRUE(storage.save(payload).is_ok());
    EXPECT_TRUE(storage.exists());
    EXPECT_FALSE(std::filesystem::exists(dir_ / "plugin.tmp"));

    auto loaded = storage.load();
    ASSERT_TRUE(loaded.is_ok());
    ASSERT_TRUE(loaded.value().has_value());
    EXPECT_EQ(*loaded.value(), payload);
}

TEST_F(StateStorageTest, SaveReplacesPreviousPayload) {
    state_storage storage(dir_ / "plugin");

    ASSERT_TRUE(storage.save("first payload that is longer").is_ok());
    ASSERT_TRUE(storage.save("second").is_ok());

    auto loaded = storage.load();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value().value_or(""), "second");
}

TEST_F(StateStorageTest, SaveIntoMissingDirectoryFails) {
    state_storage storage(dir_ / "no" / "such" / "dir" / "plugin");

    auto saved = storage.save("payload");
    ASSERT_TRUE(saved.is_err());
    EXPECT_EQ(error_code_of(saved.error()), munin_error_code::state_write_failed);
}

TEST_F(StateStorageTest, RemoveDeletesStateFile) {
    state_storage storage(dir_ / "plugin");
    ASSERT_TRUE(storage.save("payload").is_ok());

    ASSERT_TRUE(storage.remove().is_ok());
    EXPECT_FALSE(storage.exists());
    // Removing again is not an error
    EXPECT_TRUE(storage.remove().is_ok());
}

// Test the versioned key/value record
TEST_F(StateStorageTest, RecordSerializesSortedByKey) {
    state_record record(2);
    EXPECT_TRUE(record.set("reboots", 3));
    EXPECT_TRUE(record.set("host", std::string("db01")));

    EXPECT_EQ(record.serialize(), "version 2\nhost db01\nreboots 3\n");
}

TEST_F(StateStorageTest, RecordRejectsUnrepresentableEntries) {
    state_record record;

    EXPECT_FALSE(record.set("", std::string("value")));
    EXPECT_FALSE(record.set("two words", std::string("value")));
    EXPECT_FALSE(record.set("key", std::string("multi\nline")));
    EXPECT_EQ(record.size(), 0u);
}

TEST_F(StateStorageTest, RecordParsesSerializedText) {
    state_record record;
    ASSERT_TRUE(record.set("uptime", 1234.5));
    ASSERT_TRUE(record.set("label", std::string("with spaces inside")));

    auto parsed = state_record::parse(record.serialize());
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().version(), 1u);
    EXPECT_DOUBLE_EQ(parsed.value().get<double>("uptime", 0.0), 1234.5);
    EXPECT_EQ(parsed.value().get("label").value_or(""), "with spaces inside");
    EXPECT_EQ(parsed.value().get<int>("missing", -1), -1);
    EXPECT_EQ(parsed.value().get<int>("label", -1), -1);
}

TEST_F(StateStorageTest, RecordParseRejectsMissingHeader) {
    auto parsed = state_record::parse("uptime 12\n");

    ASSERT_TRUE(parsed.is_err());
    EXPECT_EQ(error_code_of(parsed.error()), munin_error_code::state_corrupted);
    EXPECT_TRUE(state_record::parse("").is_err());
}

TEST_F(StateStorageTest, RecordParseRejectsMalformedLine) {
    auto parsed = state_record::parse("version 1\nonlykey\n");

    ASSERT_TRUE(parsed.is_err());
    EXPECT_EQ(error_code_of(parsed.error()), munin_error_code::state_corrupted);
}

} // namespace
} // namespace munin
} // namespace kcenon
