// SPDX-License-Identifier: MIT

#include "dataport/dataset.hpp"

#include <unordered_map>

namespace dataport {

std::optional<TypeId> TypeIdFromString(std::string_view name) {
    if (name == "DataFrame") return TypeId::DataFrame;
    if (name == "RecordList") return TypeId::RecordList;
    return std::nullopt;
}

RecordList ToRecords(const DataFrame& frame) {
    RecordList records;
    records.reserve(frame.RowCount());
    for (size_t row = 0; row < frame.RowCount(); ++row) {
        Record record;
        record.reserve(frame.ColumnCount());
        for (const auto& col : frame.columns()) {
            record.emplace_back(col.name, col.values[row]);
        }
        records.push_back(std::move(record));
    }
    return records;
}

std::expected<DataFrame, std::string> FromRecords(const RecordList& records) {
    std::vector<std::pair<std::string, std::vector<Value>>> columns;
    std::unordered_map<std::string, size_t> index;

    for (size_t row = 0; row < records.size(); ++row) {
        for (const auto& [field, value] : records[row]) {
            auto it = index.find(field);
            if (it == index.end()) {
                // Backfill earlier rows that lacked this field
                it = index.emplace(field, columns.size()).first;
                columns.emplace_back(field, std::vector<Value>(row));
            }
            auto& values = columns[it->second].second;
            // A repeated field within one record overwrites the earlier value
            if (values.size() == row + 1) {
                values.back() = value;
            } else {
                values.push_back(value);
            }
        }
        for (auto& [name, values] : columns) {
            if (values.size() < row + 1) values.emplace_back();
        }
    }
    return DataFrame::FromValues(std::move(columns));
}

std::expected<DataFrame, std::string> ToDataFrame(const Dataset& data) {
    if (const auto* frame = std::get_if<DataFrame>(&data)) {
        return *frame;
    }
    return FromRecords(std::get<RecordList>(data));
}

Dataset Materialize(DataFrame frame, TypeId target) {
    switch (target) {
        case TypeId::DataFrame:
            return Dataset{std::move(frame)};
        case TypeId::RecordList:
            return Dataset{ToRecords(frame)};
    }
    return Dataset{std::move(frame)};  // Unreachable
}

}  // namespace dataport
