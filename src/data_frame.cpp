// SPDX-License-Identifier: MIT

#include "dataport/data_frame.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include <fmt/format.h>

namespace dataport {

std::expected<DataFrame, std::string> DataFrame::FromColumns(std::vector<Column> columns) {
    std::unordered_set<std::string> seen;
    for (const auto& col : columns) {
        if (!seen.insert(col.name).second) {
            return std::unexpected(fmt::format("duplicate column name '{}'", col.name));
        }
        if (col.values.size() != columns.front().values.size()) {
            return std::unexpected(fmt::format(
                "column '{}' has {} rows, expected {}", col.name,
                col.values.size(), columns.front().values.size()));
        }
        for (size_t row = 0; row < col.values.size(); ++row) {
            if (!Matches(col.values[row], col.dtype)) {
                return std::unexpected(fmt::format(
                    "column '{}' row {}: value does not match dtype {}", col.name, row,
                    DTypeLabel(col.dtype)));
            }
        }
    }
    return DataFrame(std::move(columns));
}

std::expected<DataFrame, std::string> DataFrame::FromValues(
        std::vector<std::pair<std::string, std::vector<Value>>> columns) {
    std::vector<Column> typed;
    typed.reserve(columns.size());
    for (auto& [name, values] : columns) {
        auto dtype = InferDType(values);
        if (!dtype) {
            return std::unexpected(fmt::format("column '{}': {}", name, dtype.error()));
        }
        typed.push_back(Column{std::move(name), *dtype, CoerceValues(std::move(values), *dtype)});
    }
    return FromColumns(std::move(typed));
}

const Column* DataFrame::Find(std::string_view name) const {
    auto it = std::find_if(columns_.begin(), columns_.end(),
                           [name](const Column& c) { return c.name == name; });
    return it == columns_.end() ? nullptr : &*it;
}

const Value& DataFrame::at(size_t row, std::string_view name) const {
    const Column* col = Find(name);
    if (!col) {
        throw std::out_of_range(fmt::format("no column named '{}'", name));
    }
    return col->values.at(row);
}

std::vector<std::string> DataFrame::ColumnNames() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& col : columns_) names.push_back(col.name);
    return names;
}

std::vector<DType> DataFrame::DTypes() const {
    std::vector<DType> dtypes;
    dtypes.reserve(columns_.size());
    for (const auto& col : columns_) dtypes.push_back(col.dtype);
    return dtypes;
}

std::expected<DType, std::string> InferDType(const std::vector<Value>& values) {
    std::optional<DType> inferred;
    for (const auto& value : values) {
        auto dtype = DTypeOf(value);
        if (!dtype) continue;
        if (!inferred || *inferred == *dtype) {
            inferred = dtype;
            continue;
        }
        bool numeric_mix =
            (*inferred == DType::Int64 && *dtype == DType::Float64) ||
            (*inferred == DType::Float64 && *dtype == DType::Int64);
        if (numeric_mix) {
            inferred = DType::Float64;
            continue;
        }
        return std::unexpected(fmt::format("cannot mix {} and {} values",
                                           DTypeLabel(*inferred), DTypeLabel(*dtype)));
    }
    return inferred.value_or(DType::String);
}

std::vector<Value> CoerceValues(std::vector<Value> values, DType dtype) {
    if (dtype != DType::Float64) return values;
    for (auto& value : values) {
        if (const auto* i = std::get_if<int64_t>(&value)) {
            value = static_cast<double>(*i);
        }
    }
    return values;
}

bool EquivalentIgnoringDTypes(const DataFrame& a, const DataFrame& b) {
    if (a.ColumnNames() != b.ColumnNames() || a.RowCount() != b.RowCount()) {
        return false;
    }
    for (size_t c = 0; c < a.ColumnCount(); ++c) {
        const auto& lhs = a.column(c).values;
        const auto& rhs = b.column(c).values;
        for (size_t r = 0; r < lhs.size(); ++r) {
            if (IsNull(lhs[r]) != IsNull(rhs[r])) return false;
            if (ValueToString(lhs[r]) != ValueToString(rhs[r])) return false;
        }
    }
    return true;
}

}  // namespace dataport
