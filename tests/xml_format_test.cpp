// SPDX-License-Identifier: MIT

// tests/xml_format_test.cpp
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "dataport/formats/xml.hpp"
#include "temp_dir.hpp"

using namespace dataport;
using dataport::test::TempDir;

namespace {

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

class XmlFormatTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(XmlFormatTest, RoundTripWithNulls) {
    auto frame = DataFrame::FromValues({
        {"id", {int64_t{1}, int64_t{2}}},
        {"price", {1.5, -0.25}},
        {"label", {std::string("a<b"), std::monostate{}}},
        {"ok", {true, false}},
    });
    ASSERT_TRUE(frame.has_value());

    XmlWriter writer(XmlSave{.path = dir_.File("rows.xml")});
    auto saved = writer.Save(Dataset{*frame});
    ASSERT_TRUE(saved.has_value()) << ToString(saved.error());

    auto text = ReadText(dir_.File("rows.xml"));
    EXPECT_EQ(text.rfind("<?xml", 0), 0);
    EXPECT_NE(text.find("<label>a&lt;b</label>"), std::string::npos);

    XmlReader reader(XmlLoad{.path = dir_.File("rows.xml")});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());
    EXPECT_EQ(std::get<DataFrame>(loaded->data), *frame);
}

TEST_F(XmlFormatTest, CustomNamesWithoutDeclaration) {
    RecordList records = {{{"name", std::string("x")}}};
    XmlWriter writer(XmlSave{.path = dir_.File("custom.xml"),
                             .root_name = "items",
                             .row_name = "item",
                             .xml_declaration = false,
                             .pretty_print = false});
    ASSERT_TRUE(writer.Save(Dataset{records}).has_value());
    auto text = ReadText(dir_.File("custom.xml"));
    EXPECT_EQ(text.find("<?xml"), std::string::npos);
    EXPECT_NE(text.find("<items><item><name>x</name></item></items>"), std::string::npos);
}

TEST_F(XmlFormatTest, AttributesBecomeFields) {
    WriteText(dir_.File("attrs.xml"),
              R"(<root><r id="1" kind="a"><v>2.5</v></r><r id="2" kind="b"><v>3</v></r></root>)");
    XmlReader reader(XmlLoad{.path = dir_.File("attrs.xml")});
    auto loaded = reader.Load(TypeId::RecordList);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());
    const auto& records = std::get<RecordList>(loaded->data);
    ASSERT_EQ(records.size(), 2);
    ASSERT_EQ(records[0].size(), 3);
    EXPECT_EQ(records[0][0].first, "id");
    EXPECT_EQ(records[0][1].second, Value{std::string("a")});
    EXPECT_EQ(records[0][2].first, "v");
}

TEST_F(XmlFormatTest, XPathSelectsRows) {
    WriteText(dir_.File("nested.xml"),
              "<doc><meta><n>0</n></meta><rows><row><n>1</n></row><row><n>2</n></row></rows>"
              "</doc>");
    XmlReader reader(XmlLoad{.path = dir_.File("nested.xml"), .xpath = "//rows/row"});
    EXPECT_EQ(reader.LoadingOptions(), (OptionMap{{"xpath", std::string("//rows/row")}}));
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_TRUE(loaded.has_value()) << ToString(loaded.error());
    EXPECT_EQ(loaded->metadata.dataframe_metadata.rows, 2);
}

TEST_F(XmlFormatTest, NoMatchIsCodecError) {
    WriteText(dir_.File("empty.xml"), "<root/>");
    XmlReader reader(XmlLoad{.path = dir_.File("empty.xml")});
    auto loaded = reader.Load(TypeId::DataFrame);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::CodecError);
    EXPECT_EQ(loaded.error().format, "xml");
}

TEST_F(XmlFormatTest, InvalidColumnNameIsCodecError) {
    auto frame = DataFrame::FromValues({{"not valid", {int64_t{1}}}});
    XmlWriter writer(XmlSave{.path = dir_.File("bad.xml")});
    auto saved = writer.Save(Dataset{*frame});
    ASSERT_FALSE(saved.has_value());
    EXPECT_EQ(saved.error().code, ErrorCode::CodecError);
}

TEST_F(XmlFormatTest, RejectsInvalidRootName) {
    auto writer = XmlWriter::Create(XmlSave{.path = dir_.File("x.xml"), .root_name = "1abc"});
    ASSERT_FALSE(writer.has_value());
    EXPECT_EQ(writer.error().code, ErrorCode::ConfigurationError);
}
