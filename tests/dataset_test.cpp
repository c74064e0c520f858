// SPDX-License-Identifier: MIT

// tests/dataset_test.cpp
#include <gtest/gtest.h>

#include "dataport/dataset.hpp"

using namespace dataport;

TEST(DatasetTest, TypeIdNames) {
    EXPECT_EQ(TypeIdToString(TypeId::DataFrame), "DataFrame");
    EXPECT_EQ(TypeIdToString(TypeId::RecordList), "RecordList");
    EXPECT_EQ(TypeIdFromString("RecordList"), TypeId::RecordList);
    EXPECT_FALSE(TypeIdFromString("Series").has_value());
}

TEST(DatasetTest, TypeOfFollowsAlternative) {
    EXPECT_EQ(TypeOf(Dataset{DataFrame{}}), TypeId::DataFrame);
    EXPECT_EQ(TypeOf(Dataset{RecordList{}}), TypeId::RecordList);
}

TEST(DatasetTest, FromRecordsOrdersByFirstAppearance) {
    RecordList records = {
        {{"a", int64_t{1}}, {"b", std::string("x")}},
        {{"c", true}, {"a", int64_t{2}}},
    };
    auto frame = FromRecords(records);
    ASSERT_TRUE(frame.has_value()) << frame.error();
    EXPECT_EQ(frame->ColumnNames(), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(frame->RowCount(), 2);
    EXPECT_TRUE(IsNull(frame->at(1, "b")));
    EXPECT_TRUE(IsNull(frame->at(0, "c")));
    EXPECT_EQ(frame->at(1, "a"), Value{int64_t{2}});
    EXPECT_EQ(frame->Find("c")->dtype, DType::Bool);
}

TEST(DatasetTest, FromRecordsRejectsIncompatibleValues) {
    RecordList records = {{{"a", int64_t{1}}}, {{"a", std::string("x")}}};
    EXPECT_FALSE(FromRecords(records).has_value());
}

TEST(DatasetTest, RecordsRoundTripThroughFrame) {
    auto frame = DataFrame::FromValues({
        {"col1", {int64_t{1}, int64_t{2}}},
        {"col2", {std::string("x"), Value{}}},
    });
    ASSERT_TRUE(frame.has_value());
    auto records = ToRecords(*frame);
    ASSERT_EQ(records.size(), 2);
    EXPECT_EQ(records[1][1].first, "col2");
    EXPECT_TRUE(IsNull(records[1][1].second));

    auto back = FromRecords(records);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, *frame);
}

TEST(DatasetTest, MaterializeAsRecords) {
    auto frame = DataFrame::FromValues({{"foo", {std::string("bar")}}});
    ASSERT_TRUE(frame.has_value());
    Dataset data = Materialize(*frame, TypeId::RecordList);
    ASSERT_EQ(TypeOf(data), TypeId::RecordList);
    const auto& records = std::get<RecordList>(data);
    ASSERT_EQ(records.size(), 1);
    EXPECT_EQ(records[0][0].second, Value{std::string("bar")});
}

TEST(DatasetTest, ToDataFrameAcceptsEitherForm) {
    auto frame = DataFrame::FromValues({{"foo", {std::string("bar")}}});
    ASSERT_TRUE(frame.has_value());
    auto from_frame = ToDataFrame(Dataset{*frame});
    auto from_records = ToDataFrame(Dataset{ToRecords(*frame)});
    ASSERT_TRUE(from_frame && from_records);
    EXPECT_EQ(*from_frame, *from_records);
}
