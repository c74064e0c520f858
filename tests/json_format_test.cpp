// SPDX-License-Identifier: MIT

// tests/json_format_test.cpp
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "dataport/formats/json.hpp"
#include "temp_dir.hpp"

using namespace dataport;
using dataport::test::TempDir;

namespace {

DataFrame SampleFrame() {
    return *DataFrame::FromValues({
        {"col1", {int64_t{1}, int64_t{2}}},
        {"col2", {std::string("a"), std::string("b")}},
        {"col3", {0.5, std::monostate{}}},
    });
}

std::string ReadText(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

void WriteText(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

}  // namespace

class JsonFormatTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(JsonFormatTest, ApplicableTypes) {
    ASSERT_EQ(JsonReader::ApplicableTypes().size(), 2);
    EXPECT_EQ(JsonReader::ApplicableTypes()[0], TypeId::DataFrame);
    EXPECT_EQ(JsonReader::ApplicableTypes()[1], TypeId::RecordList);
    EXPECT_EQ(JsonWriter::ApplicableTypes().size(), 2);
}

TEST_F(JsonFormatTest, IndentInSavingOptions) {
    JsonWriter writer(JsonSave{.path = dir_.File("x.json"), .indent = 4});
    auto options = writer.SavingOptions();
    EXPECT_EQ(std::get<int64_t>(options.at("indent")), 4);
    EXPECT_FALSE(options.contains("path"));
}

TEST_F(JsonFormatTest, EncodingInLoadingOptions) {
    JsonReader reader(JsonLoad{.path = dir_.File("x.json")});
    OptionMap expected{{"orient", std::string("columns")},
                       {"lines", false},
                       {"encoding", std::string("utf-8")}};
    EXPECT_EQ(reader.LoadingOptions(), expected);
}

TEST_F(JsonFormatTest, ColumnsOrientRoundTrip) {
    JsonWriter writer(JsonSave{.path = dir_.File("cols.json")});
    auto saved = writer.Save(Dataset{SampleFrame()});
    ASSERT_TRUE(saved.has_value()) << ToString(saved.error());
    EXPECT_EQ(ReadText(dir_.File("cols.json")),
              R"({"col1":{"0":1,"1":2},"col2":{"0":"a","1":"b"},"col3":{"0":0.5,"1":null}})");

    JsonReader reader(JsonLoad{.path = dir_.File("cols.json")});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());
    EXPECT_EQ(std::get<DataFrame>(loaded->data), SampleFrame());
}

TEST_F(JsonFormatTest, RecordsOrientToRecordList) {
    WriteText(dir_.File("records.json"), R"([{"a": 1, "b": "x"}, {"a": 2, "b": "y"}])");
    JsonReader reader(JsonLoad{.path = dir_.File("records.json"), .orient = "records"});
    auto loaded = reader.Load(TypeId::RecordList);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());

    const auto& records = std::get<RecordList>(loaded->data);
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[1][0].first, "a");
    EXPECT_EQ(records[1][0].second, Value{int64_t{2}});
    EXPECT_EQ(records[1][1].second, Value{std::string("y")});
}

TEST_F(JsonFormatTest, SplitOrientRoundTrip) {
    JsonWriter writer(JsonSave{.path = dir_.File("split.json"), .orient = "split", .indent = 2});
    ASSERT_TRUE(writer.Save(Dataset{SampleFrame()}).has_value());
    EXPECT_NE(ReadText(dir_.File("split.json")).find("\n  \"columns\""), std::string::npos);

    JsonReader reader(JsonLoad{.path = dir_.File("split.json"), .orient = "split"});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());
    EXPECT_EQ(std::get<DataFrame>(loaded->data), SampleFrame());
}

TEST_F(JsonFormatTest, LinesRoundTripFromRecords) {
    RecordList records = {
        {{"k", std::string("a")}, {"v", int64_t{1}}},
        {{"k", std::string("b")}, {"v", int64_t{2}}},
    };
    JsonWriter writer(JsonSave{.path = dir_.File("rows.jsonl"), .orient = "records",
                               .lines = true});
    auto saved = writer.Save(Dataset{records});
    ASSERT_TRUE(saved.has_value()) << ToString(saved.error());
    EXPECT_EQ(ReadText(dir_.File("rows.jsonl")), "{\"k\":\"a\",\"v\":1}\n{\"k\":\"b\",\"v\":2}\n");

    JsonReader reader(JsonLoad{.path = dir_.File("rows.jsonl"), .orient = "records",
                               .lines = true});
    auto loaded = reader.Load(TypeId::RecordList);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());
    EXPECT_EQ(std::get<RecordList>(loaded->data), records);
}

TEST_F(JsonFormatTest, LinesRequireRecordsOrient) {
    auto reader = JsonReader::Create(JsonLoad{.path = dir_.File("x.json"), .lines = true});
    ASSERT_FALSE(reader.has_value());
    EXPECT_EQ(reader.error().code, ErrorCode::ConfigurationError);
}

TEST_F(JsonFormatTest, RejectsUnknownOrientAndEncoding) {
    EXPECT_FALSE(JsonWriter::Create(JsonSave{.path = dir_.File("x.json"), .orient = "table"})
                     .has_value());
    EXPECT_FALSE(JsonReader::Create(JsonLoad{.path = dir_.File("x.json"), .encoding = "latin-1"})
                     .has_value());
}

TEST_F(JsonFormatTest, AcceptsUtf8SpellingsInAnyCase) {
    for (const char* encoding : {"utf-8", "UTF-8", "utf8", "UTF8", "Utf-8"}) {
        auto reader =
            JsonReader::Create(JsonLoad{.path = dir_.File("x.json"), .encoding = encoding});
        EXPECT_TRUE(reader.has_value()) << encoding;
    }
}

TEST_F(JsonFormatTest, ReadsWithUppercaseEncoding) {
    WriteText(dir_.File("upper.json"), R"({"a":{"0":1}})");
    JsonReader reader(JsonLoad{.path = dir_.File("upper.json"), .encoding = "UTF8"});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());
    EXPECT_EQ(loaded->metadata.dataframe_metadata.rows, 1);
}

TEST_F(JsonFormatTest, NestedValueIsCodecError) {
    WriteText(dir_.File("nested.json"), R"([{"a": {"b": 1}}])");
    JsonReader reader(JsonLoad{.path = dir_.File("nested.json"), .orient = "records"});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::CodecError);
    EXPECT_EQ(loaded.error().format, "json");
}

TEST_F(JsonFormatTest, MalformedJsonIsCodecError) {
    WriteText(dir_.File("bad.json"), "{\"a\": ");
    JsonReader reader(JsonLoad{.path = dir_.File("bad.json")});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::CodecError);
}
