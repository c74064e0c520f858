// SPDX-License-Identifier: MIT

// tests/parquet_format_test.cpp
#include <filesystem>

#include <gtest/gtest.h>

#include "dataport/formats/parquet.hpp"
#include "temp_dir.hpp"

using namespace dataport;
using dataport::test::TempDir;

class ParquetFormatTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(ParquetFormatTest, SingleCellRoundTrip) {
    auto frame = DataFrame::FromValues({{"foo", {std::string("bar")}}});
    ASSERT_TRUE(frame.has_value());

    ParquetWriter writer(ParquetSave{.path = dir_.File("data.parquet")});
    auto saved = writer.Save(Dataset{*frame});
    ASSERT_TRUE(saved.has_value()) << ToString(saved.error());
    EXPECT_EQ(dir_.EntryCount(), 1);

    ParquetReader reader(ParquetLoad{.path = dir_.File("data.parquet")});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());

    const auto& result = std::get<DataFrame>(loaded->data);
    EXPECT_EQ(result.RowCount(), 1);
    EXPECT_EQ(result.ColumnCount(), 1);
    EXPECT_EQ(result, *frame);
}

TEST_F(ParquetFormatTest, PreservesDTypesAndNulls) {
    auto frame = DataFrame::FromValues({
        {"id", {int64_t{1}, int64_t{2}, std::monostate{}}},
        {"price", {1.5, std::monostate{}, -3.25}},
        {"active", {true, false, true}},
        {"name", {std::string("x"), std::monostate{}, std::string("z")}},
    });
    ASSERT_TRUE(frame.has_value());

    ParquetWriter writer(ParquetSave{.path = dir_.File("typed.parquet"),
                                     .compression = "zstd"});
    ASSERT_TRUE(writer.Save(Dataset{*frame}).has_value());

    ParquetReader reader(ParquetLoad{.path = dir_.File("typed.parquet")});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());
    EXPECT_EQ(std::get<DataFrame>(loaded->data), *frame);
    EXPECT_EQ(loaded->metadata.dataframe_metadata.datatypes,
              (std::vector<std::string>{"int64", "float64", "bool", "object"}));
}

TEST_F(ParquetFormatTest, ColumnSubset) {
    auto frame = DataFrame::FromValues({
        {"a", {int64_t{1}}},
        {"b", {int64_t{2}}},
        {"c", {int64_t{3}}},
    });
    ParquetWriter writer(ParquetSave{.path = dir_.File("abc.parquet")});
    ASSERT_TRUE(writer.Save(Dataset{*frame}).has_value());

    ParquetReader reader(ParquetLoad{.path = dir_.File("abc.parquet"),
                                     .columns = std::vector<std::string>{"c", "a"}});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());
    EXPECT_EQ(std::get<DataFrame>(loaded->data).ColumnNames(),
              (std::vector<std::string>{"c", "a"}));
}

TEST_F(ParquetFormatTest, SavingOptions) {
    ParquetWriter writer(ParquetSave{.path = dir_.File("x.parquet")});
    EXPECT_EQ(writer.SavingOptions(), (OptionMap{{"compression", std::string("snappy")}}));

    ParquetWriter grouped(ParquetSave{.path = dir_.File("x.parquet"), .row_group_size = 1000});
    EXPECT_EQ(std::get<int64_t>(grouped.SavingOptions().at("row_group_size")), 1000);
}

TEST_F(ParquetFormatTest, RejectsUnknownCompression) {
    auto writer = ParquetWriter::Create(
        ParquetSave{.path = dir_.File("x.parquet"), .compression = "lz77"});
    ASSERT_FALSE(writer.has_value());
    EXPECT_EQ(writer.error().code, ErrorCode::ConfigurationError);
    EXPECT_EQ(writer.error().format, "parquet");
}

TEST_F(ParquetFormatTest, EmptyFrameIsCodecError) {
    ParquetWriter writer(ParquetSave{.path = dir_.File("empty.parquet")});
    auto saved = writer.Save(Dataset{DataFrame{}});
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().code, ErrorCode::CodecError);
}
