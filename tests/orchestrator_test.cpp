// SPDX-License-Identifier: MIT

// tests/orchestrator_test.cpp
#include <gtest/gtest.h>

#include "dataport/orchestrator.hpp"
#include "dataport/registry.hpp"
#include "fake_format.hpp"

using namespace dataport;
using dataport::test::Calls;
using dataport::test::FakeLoad;
using dataport::test::FakeSave;

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Calls() = {};
        ASSERT_TRUE(registry_.Register(MakeLoaderKind<FakeLoad>("FakeReader")).has_value());
        ASSERT_TRUE(registry_.Register(MakeSaverKind<FakeSave>("FakeWriter")).has_value());
    }

    AdapterRegistry registry_;
};

TEST_F(OrchestratorTest, LoadResolvesBuildsAndInvokesOnce) {
    auto loaded = LoadData(registry_, "fake", TypeId::RecordList,
                           {{"source", std::string("mem://a")}});
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());
    EXPECT_EQ(Calls().decodes, 1);
    EXPECT_EQ(TypeOf(loaded->data), TypeId::RecordList);
    EXPECT_EQ(loaded->metadata.dataframe_metadata.rows, 2);
}

TEST_F(OrchestratorTest, SaveResolvesByDatasetType) {
    auto frame = DataFrame::FromValues({{"foo", {std::string("bar")}}});
    ASSERT_TRUE(frame.has_value());
    auto md = SaveData(registry_, "fake", Dataset{*frame},
                       {{"target", std::string("mem://b")}});
    ASSERT_TRUE(md.has_value()) << ToString(md.error());
    EXPECT_EQ(Calls().encodes, 1);
    EXPECT_EQ(md->dataframe_metadata.column_names, (std::vector<std::string>{"foo"}));
}

TEST_F(OrchestratorTest, SaveUnregisteredTypeFailsBeforeConstruction) {
    auto md = SaveData(registry_, "fake", Dataset{RecordList{}},
                       {{"target", std::string("mem://b")}});
    ASSERT_FALSE(md.has_value());
    EXPECT_EQ(md.error().code, ErrorCode::NoAdapterFound);
    EXPECT_EQ(Calls().encodes, 0);
}

TEST_F(OrchestratorTest, ConfigurationErrorPropagatesUnchanged) {
    auto loaded = LoadData(registry_, "fake", TypeId::RecordList, {});
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::ConfigurationError);
    EXPECT_EQ(loaded.error().message, "missing required option 'source'");
    EXPECT_EQ(loaded.error().format, "fake");
    EXPECT_EQ(loaded.error().type, "RecordList");
    EXPECT_EQ(loaded.error().operation, Operation::Load);
    EXPECT_EQ(Calls().decodes, 0);
}

TEST_F(OrchestratorTest, SaveConfigurationErrorNamesSourceType) {
    auto frame = DataFrame::FromValues({{"foo", {std::string("bar")}}});
    ASSERT_TRUE(frame.has_value());
    auto md = SaveData(registry_, "fake", Dataset{*frame}, {});
    ASSERT_FALSE(md.has_value());
    EXPECT_EQ(md.error().code, ErrorCode::ConfigurationError);
    EXPECT_EQ(md.error().format, "fake");
    EXPECT_EQ(md.error().type, "DataFrame");
    EXPECT_EQ(md.error().operation, Operation::Save);
    EXPECT_EQ(Calls().encodes, 0);
}

TEST_F(OrchestratorTest, CodecErrorIsNotRetried) {
    auto loaded = LoadData(registry_, "fake", TypeId::DataFrame,
                           {{"source", std::string("mem://a")}, {"fail", true}});
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::CodecError);
    EXPECT_EQ(Calls().decodes, 1);
}

TEST_F(OrchestratorTest, InvokesPrebuiltAdapter) {
    Reader<FakeLoad> reader(FakeLoad{.source = "mem://a"});
    auto loaded = LoadData(reader, TypeId::DataFrame);
    ASSERT_TRUE(loaded.has_value());

    Writer<FakeSave> writer(FakeSave{.target = "mem://b"});
    auto md = SaveData(writer, loaded->data);
    ASSERT_TRUE(md.has_value());
    EXPECT_EQ(Calls().last_frame, std::get<DataFrame>(loaded->data));
}

TEST_F(OrchestratorTest, UnknownFormat) {
    auto loaded = LoadData(registry_, "orc", TypeId::DataFrame, {});
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::NoAdapterFound);
}
