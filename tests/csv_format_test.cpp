// SPDX-License-Identifier: MIT

// tests/csv_format_test.cpp
#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "dataport/formats/csv.hpp"
#include "temp_dir.hpp"

using namespace dataport;
using dataport::test::TempDir;

namespace {

DataFrame SampleFrame() {
    return *DataFrame::FromValues({
        {"col1", {int64_t{1}, int64_t{2}}},
        {"col2", {std::string("a"), std::string("b")}},
    });
}

void WriteText(const std::string& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

}  // namespace

class CsvFormatTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(CsvFormatTest, WriterReportsFileAndFrameMetadata) {
    CsvWriter writer(CsvSave{.path = dir_.File("out.csv")});
    auto md = writer.Save(Dataset{SampleFrame()});
    ASSERT_TRUE(md.has_value()) << ToString(md.error());

    EXPECT_TRUE(std::filesystem::exists(dir_.File("out.csv")));
    ASSERT_TRUE(md->file_metadata.has_value());
    EXPECT_EQ(md->file_metadata->path, dir_.File("out.csv"));
    EXPECT_EQ(md->file_metadata->size,
              std::filesystem::file_size(dir_.File("out.csv")));
    EXPECT_FALSE(md->sql_metadata.has_value());
    EXPECT_EQ(md->dataframe_metadata.rows, 2);
    EXPECT_EQ(md->dataframe_metadata.column_names, (std::vector<std::string>{"col1", "col2"}));
    EXPECT_EQ(md->dataframe_metadata.datatypes, (std::vector<std::string>{"int64", "object"}));
}

TEST_F(CsvFormatTest, RoundTrip) {
    CsvWriter writer(CsvSave{.path = dir_.File("rt.csv")});
    ASSERT_TRUE(writer.Save(Dataset{SampleFrame()}).has_value());

    CsvReader reader(CsvLoad{.path = dir_.File("rt.csv")});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());
    EXPECT_TRUE(EquivalentIgnoringDTypes(std::get<DataFrame>(loaded->data), SampleFrame()));
    EXPECT_EQ(loaded->metadata.dataframe_metadata.rows, 2);
    ASSERT_TRUE(loaded->metadata.file_metadata.has_value());
}

TEST_F(CsvFormatTest, LoadingOptionsCarryDialectOnly) {
    CsvReader reader(CsvLoad{.path = dir_.File("x.csv"), .sep = ";"});
    OptionMap expected{{"sep", std::string(";")},
                       {"header", true},
                       {"quotechar", std::string("\"")}};
    EXPECT_EQ(reader.LoadingOptions(), expected);

    CsvReader limited(CsvLoad{.path = dir_.File("x.csv"), .nrows = 5});
    auto options = limited.LoadingOptions();
    EXPECT_EQ(std::get<int64_t>(options.at("nrows")), 5);
    EXPECT_FALSE(options.contains("path"));
}

TEST_F(CsvFormatTest, ReadsCustomDelimiterAndColumnSubset) {
    WriteText(dir_.File("semi.csv"), "a;b;c\n1;x;2.5\n3;y;4.5\n");
    CsvReader reader(CsvLoad{.path = dir_.File("semi.csv"),
                             .sep = ";",
                             .usecols = std::vector<std::string>{"c", "a"}});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());
    const auto& frame = std::get<DataFrame>(loaded->data);
    EXPECT_EQ(frame.ColumnNames(), (std::vector<std::string>{"c", "a"}));
    EXPECT_EQ(frame.at(1, "c"), Value{4.5});
}

TEST_F(CsvFormatTest, NrowsLimitsRead) {
    WriteText(dir_.File("many.csv"), "n\n1\n2\n3\n4\n");
    CsvReader reader(CsvLoad{.path = dir_.File("many.csv"), .nrows = 2});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());
    EXPECT_EQ(std::get<DataFrame>(loaded->data).RowCount(), 2);
}

TEST_F(CsvFormatTest, RecordListIsNotApplicable) {
    CsvReader reader(CsvLoad{.path = dir_.File("x.csv")});
    auto loaded = reader.Load(TypeId::RecordList);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::TypeMismatch);
    EXPECT_FALSE(std::filesystem::exists(dir_.File("x.csv")));
}

TEST_F(CsvFormatTest, RejectedSaveWritesNoFile) {
    CsvWriter writer(CsvSave{.path = dir_.File("out.csv")});
    RecordList records = {{{"a", int64_t{1}}}};
    auto md = writer.Save(Dataset{records});
    ASSERT_FALSE(md.has_value());
    EXPECT_EQ(md.error().code, ErrorCode::TypeMismatch);
    EXPECT_EQ(md.error().type, "RecordList");
    EXPECT_FALSE(std::filesystem::exists(dir_.File("out.csv")));
    EXPECT_EQ(dir_.EntryCount(), 0);
}

TEST_F(CsvFormatTest, MissingFileIsCodecError) {
    CsvReader reader(CsvLoad{.path = dir_.File("missing.csv")});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::CodecError);
    EXPECT_EQ(loaded.error().format, "csv");
}

TEST_F(CsvFormatTest, RejectsBadDialect) {
    EXPECT_THROW((void)CsvWriter(CsvSave{.path = dir_.File("x.csv"), .sep = ""}),
                 AdapterException);
    EXPECT_THROW((void)CsvReader(CsvLoad{.path = dir_.File("x.csv"), .quotechar = "''"}),
                 AdapterException);
    EXPECT_THROW((void)CsvReader(CsvLoad{}), AdapterException);
}

TEST_F(CsvFormatTest, FromOptionsRejectsUnknownKey) {
    auto cfg = CsvLoad::FromOptions(
        {{"path", dir_.File("x.csv")}, {"engine", std::string("pyarrow")}}, {});
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("engine"), std::string::npos);
}
