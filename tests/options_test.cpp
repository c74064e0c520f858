// SPDX-License-Identifier: MIT

// tests/options_test.cpp
#include <gtest/gtest.h>

#include "dataport/options.hpp"

using namespace dataport;

TEST(OptionReaderTest, ReadsTypedValues) {
    OptionMap options{{"sep", std::string(";")}, {"header", false}, {"nrows", int64_t{5}}};
    OptionReader opts(options);
    EXPECT_EQ(opts.GetOr<std::string>("sep", ","), ";");
    EXPECT_FALSE(opts.GetOr<bool>("header", true));
    EXPECT_EQ(opts.Get<int64_t>("nrows"), 5);
    EXPECT_FALSE(opts.Get<int64_t>("skiprows").has_value());
    EXPECT_TRUE(opts.Finish().has_value());
}

TEST(OptionReaderTest, IntegerAcceptedAsDouble) {
    OptionMap options{{"ratio", int64_t{2}}};
    OptionReader opts(options);
    EXPECT_EQ(opts.Get<double>("ratio"), 2.0);
    EXPECT_TRUE(opts.Finish().has_value());
}

TEST(OptionReaderTest, UnknownKeyFails) {
    OptionMap options{{"sep", std::string(",")}, {"engine", std::string("pyarrow")}};
    OptionReader opts(options);
    opts.GetOr<std::string>("sep", ",");
    auto ok = opts.Finish();
    ASSERT_FALSE(ok.has_value());
    EXPECT_NE(ok.error().find("engine"), std::string::npos);
}

TEST(OptionReaderTest, WrongTypeFails) {
    OptionMap options{{"header", std::string("yes")}};
    OptionReader opts(options);
    EXPECT_TRUE(opts.GetOr<bool>("header", true));
    auto ok = opts.Finish();
    ASSERT_FALSE(ok.has_value());
    EXPECT_NE(ok.error().find("'header'"), std::string::npos);
    EXPECT_NE(ok.error().find("bool"), std::string::npos);
}

TEST(OptionReaderTest, MissingRequiredFails) {
    OptionMap options;
    OptionReader opts(options);
    EXPECT_EQ(opts.Require<std::string>("path"), "");
    auto ok = opts.Finish();
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error(), "missing required option 'path'");
}

TEST(OptionReaderTest, FirstErrorWins) {
    OptionMap options{{"a", true}};
    OptionReader opts(options);
    opts.Require<std::string>("missing");
    opts.Get<int64_t>("a");
    auto ok = opts.Finish();
    ASSERT_FALSE(ok.has_value());
    EXPECT_NE(ok.error().find("missing"), std::string::npos);
}

TEST(OptionsTest, PutIfSetSkipsEmptyOptional) {
    OptionMap options;
    PutIfSet(options, "nrows", std::optional<int64_t>{});
    PutIfSet(options, "skiprows", std::optional<int64_t>{3});
    EXPECT_FALSE(options.contains("nrows"));
    EXPECT_EQ(std::get<int64_t>(options.at("skiprows")), 3);
}

TEST(OptionsTest, FromJsonParsesFlatObject) {
    auto options = OptionsFromJson(
        R"({"path": "/tmp/x.csv", "header": true, "nrows": 10, "ratio": 0.5,
            "usecols": ["a", "b"]})");
    ASSERT_TRUE(options.has_value()) << options.error();
    EXPECT_EQ(std::get<std::string>(options->at("path")), "/tmp/x.csv");
    EXPECT_TRUE(std::get<bool>(options->at("header")));
    EXPECT_EQ(std::get<int64_t>(options->at("nrows")), 10);
    EXPECT_DOUBLE_EQ(std::get<double>(options->at("ratio")), 0.5);
    EXPECT_EQ(std::get<std::vector<std::string>>(options->at("usecols")),
              (std::vector<std::string>{"a", "b"}));
}

TEST(OptionsTest, FromJsonRejectsNestedAndMalformed) {
    EXPECT_FALSE(OptionsFromJson(R"({"a": {"b": 1}})").has_value());
    EXPECT_FALSE(OptionsFromJson(R"({"a": null})").has_value());
    EXPECT_FALSE(OptionsFromJson(R"({"a": [1, 2]})").has_value());
    EXPECT_FALSE(OptionsFromJson("[1, 2]").has_value());
    EXPECT_FALSE(OptionsFromJson("{").has_value());
}

TEST(OptionsTest, FromJsonRejectsDuplicateKey) {
    auto options = OptionsFromJson(R"({"sep": ",", "sep": ";"})");
    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(options.error(), "duplicate option 'sep'");
}
