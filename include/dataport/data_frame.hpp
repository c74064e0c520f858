// SPDX-License-Identifier: MIT

// include/dataport/data_frame.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "dataport/column_type.hpp"

namespace dataport {

/// A named, typed column.  Null cells are allowed in any dtype.
struct Column {
    std::string name;
    DType dtype = DType::String;
    std::vector<Value> values;

    bool operator==(const Column&) const = default;
};

/// Columnar in-memory table: ordered, uniquely named columns of equal length.
///
/// Instances are only created through the validating factories, so every
/// DataFrame satisfies its invariants.  Value type, safe to copy.
class DataFrame {
public:
    DataFrame() = default;

    /// Build from explicitly typed columns.
    /// @return An error string if lengths differ, names repeat, or a value
    ///         does not match its column's dtype.
    static std::expected<DataFrame, std::string> FromColumns(std::vector<Column> columns);

    /// Build from (name, values) pairs, inferring each column's dtype.
    ///
    /// Integer and double values in one column promote to Float64.  An
    /// all-null column is String.
    static std::expected<DataFrame, std::string> FromValues(
        std::vector<std::pair<std::string, std::vector<Value>>> columns);

    size_t RowCount() const { return columns_.empty() ? 0 : columns_.front().values.size(); }
    size_t ColumnCount() const { return columns_.size(); }
    bool empty() const { return columns_.empty(); }

    const std::vector<Column>& columns() const { return columns_; }
    const Column& column(size_t index) const { return columns_.at(index); }

    /// @return The named column, or nullptr if absent.
    const Column* Find(std::string_view name) const;

    /// @throws std::out_of_range if the row or column does not exist.
    const Value& at(size_t row, std::string_view name) const;

    std::vector<std::string> ColumnNames() const;
    std::vector<DType> DTypes() const;

    bool operator==(const DataFrame&) const = default;

private:
    explicit DataFrame(std::vector<Column> columns) : columns_(std::move(columns)) {}

    std::vector<Column> columns_;
};

/// Infer a column dtype from its values (see DataFrame::FromValues).
/// @return An error string naming the first incompatible value.
std::expected<DType, std::string> InferDType(const std::vector<Value>& values);

/// Convert values to @p dtype, promoting Int64 to Float64 where needed.
std::vector<Value> CoerceValues(std::vector<Value> values, DType dtype);

/// Compare two frames by shape, column names and the text rendering of every
/// cell.  Used for formats that do not preserve dtypes.
bool EquivalentIgnoringDTypes(const DataFrame& a, const DataFrame& b);

}  // namespace dataport
