// SPDX-License-Identifier: MIT

// include/dataport/column_type.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace dataport {

/// A nullable scalar cell.  std::monostate is null.
using Value = std::variant<std::monostate, int64_t, double, bool, std::string>;

/// @name Column data types
/// Format-agnostic column types.  Codecs map these to their own type system
/// (DuckDB SQL types, JSON numbers, XML text).
/// @{
enum class DType {
    Int64,    ///< 64-bit signed integer.
    Float64,  ///< 64-bit IEEE 754 floating point.
    Bool,     ///< Boolean value.
    String,   ///< Variable-length UTF-8 text; also the type of all-null columns.
};
/// @}

/// Label reported in dataframe metadata (e.g. "int64", "object").
constexpr std::string_view DTypeLabel(DType dtype) {
    switch (dtype) {
        case DType::Int64: return "int64";
        case DType::Float64: return "float64";
        case DType::Bool: return "bool";
        case DType::String: return "object";
    }
    return "";  // Unreachable
}

/// SQL column type used when a frame is materialized as a table.
constexpr std::string_view DTypeSqlName(DType dtype) {
    switch (dtype) {
        case DType::Int64: return "BIGINT";
        case DType::Float64: return "DOUBLE";
        case DType::Bool: return "BOOLEAN";
        case DType::String: return "VARCHAR";
    }
    return "";  // Unreachable
}

inline bool IsNull(const Value& value) {
    return std::holds_alternative<std::monostate>(value);
}

/// @return The dtype a single non-null value belongs to, or std::nullopt for null.
std::optional<DType> DTypeOf(const Value& value);

/// Check that @p value may be stored in a column of @p dtype.
bool Matches(const Value& value, DType dtype);

/// Render a value as text.  Null renders as an empty string, doubles use the
/// shortest representation that round-trips.
std::string ValueToString(const Value& value);

/// Parse a text cell from a markup or text format.
///
/// Empty text is null.  Integers and decimals (leading digit, sign or dot)
/// become Int64/Float64, "true"/"false" (any case) become Bool; anything
/// else stays a string.
Value ParseScalar(std::string_view text);

}  // namespace dataport
