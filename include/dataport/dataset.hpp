// SPDX-License-Identifier: MIT

// include/dataport/dataset.hpp
#pragma once

#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "dataport/column_type.hpp"
#include "dataport/data_frame.hpp"

namespace dataport {

/// Identifier of an in-memory data representation an adapter can produce or
/// consume.  The enumerator order is the Dataset alternative order.
enum class TypeId {
    DataFrame,   ///< Columnar dataport::DataFrame
    RecordList,  ///< Row-oriented dataport::RecordList
};

/// One row as ordered (field, value) pairs.
using Record = std::vector<std::pair<std::string, Value>>;
using RecordList = std::vector<Record>;

/// A fully materialized dataset in any supported representation.
using Dataset = std::variant<DataFrame, RecordList>;

constexpr std::string_view TypeIdToString(TypeId type) {
    switch (type) {
        case TypeId::DataFrame: return "DataFrame";
        case TypeId::RecordList: return "RecordList";
    }
    return "";  // Unreachable
}

/// Parse a TypeId from its name (e.g. "DataFrame").
std::optional<TypeId> TypeIdFromString(std::string_view name);

inline TypeId TypeOf(const Dataset& data) {
    return static_cast<TypeId>(data.index());
}

inline bool Contains(std::span<const TypeId> types, TypeId type) {
    for (TypeId t : types) {
        if (t == type) return true;
    }
    return false;
}

/// Split a frame into one record per row, fields in column order.  Null
/// cells are kept as null fields.
RecordList ToRecords(const DataFrame& frame);

/// Assemble records into a frame.
///
/// Columns are ordered by first appearance; fields missing from a record are
/// null; dtypes are inferred per column.
/// @return An error string if a column mixes incompatible value types.
std::expected<DataFrame, std::string> FromRecords(const RecordList& records);

/// Convert any dataset to the columnar form consumed by codecs.
std::expected<DataFrame, std::string> ToDataFrame(const Dataset& data);

/// Convert a decoded frame to the requested representation.
Dataset Materialize(DataFrame frame, TypeId target);

}  // namespace dataport
