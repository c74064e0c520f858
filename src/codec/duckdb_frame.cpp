// SPDX-License-Identifier: MIT

#include "dataport/codec/duckdb_frame.hpp"

#include <exception>
#include <vector>

#include <fmt/format.h>

namespace dataport::codec {

namespace {

duckdb::Value ToDuckValue(const Value& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return duckdb::Value::BIGINT(*i);
    if (const auto* d = std::get_if<double>(&value)) return duckdb::Value::DOUBLE(*d);
    if (const auto* b = std::get_if<bool>(&value)) return duckdb::Value::BOOLEAN(*b);
    if (const auto* s = std::get_if<std::string>(&value)) return duckdb::Value(*s);
    return duckdb::Value();  // NULL
}

// Map a DuckDB column type to a frame dtype
DType DTypeFor(const duckdb::LogicalType& type, bool coerce_float) {
    switch (type.id()) {
        case duckdb::LogicalTypeId::BOOLEAN:
            return DType::Bool;
        case duckdb::LogicalTypeId::TINYINT:
        case duckdb::LogicalTypeId::SMALLINT:
        case duckdb::LogicalTypeId::INTEGER:
        case duckdb::LogicalTypeId::BIGINT:
        case duckdb::LogicalTypeId::UTINYINT:
        case duckdb::LogicalTypeId::USMALLINT:
        case duckdb::LogicalTypeId::UINTEGER:
        case duckdb::LogicalTypeId::UBIGINT:
        case duckdb::LogicalTypeId::HUGEINT:
            return DType::Int64;
        case duckdb::LogicalTypeId::FLOAT:
        case duckdb::LogicalTypeId::DOUBLE:
            return DType::Float64;
        case duckdb::LogicalTypeId::DECIMAL:
            return coerce_float ? DType::Float64 : DType::String;
        default:
            return DType::String;
    }
}

Value FromDuckValue(const duckdb::Value& value, DType dtype) {
    if (value.IsNull()) return std::monostate{};
    switch (dtype) {
        case DType::Int64: return value.GetValue<int64_t>();
        case DType::Float64: return value.GetValue<double>();
        case DType::Bool: return value.GetValue<bool>();
        case DType::String: return value.ToString();
    }
    return std::monostate{};  // Unreachable
}

}  // namespace

std::string EscapeString(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        if (c == '\'') {
            result += "''";
        } else {
            result += c;
        }
    }
    return result;
}

std::string QuoteIdentifier(std::string_view ident) {
    std::string result;
    result.reserve(ident.size() + 2);
    result += '"';
    for (char c : ident) {
        if (c == '"') {
            result += '"';
        }
        result += c;
    }
    result += '"';
    return result;
}

std::expected<std::string, std::string> CreateTableSql(std::string_view table,
                                                       const DataFrame& frame) {
    if (frame.empty()) {
        return std::unexpected(std::string("cannot create a table from a frame with no columns"));
    }
    std::string sql = fmt::format("CREATE TABLE {} (", QuoteIdentifier(table));
    for (size_t i = 0; i < frame.ColumnCount(); ++i) {
        if (i > 0) sql += ", ";
        const auto& col = frame.column(i);
        sql += fmt::format("{} {}", QuoteIdentifier(col.name), DTypeSqlName(col.dtype));
    }
    sql += ")";
    return sql;
}

std::expected<std::unique_ptr<duckdb::MaterializedQueryResult>, std::string> RunQuery(
        duckdb::Connection& conn, const std::string& sql) {
    auto result = conn.Query(sql);
    if (result->HasError()) {
        return std::unexpected(result->GetError());
    }
    return result;
}

std::expected<void, std::string> AppendFrame(duckdb::Connection& conn,
                                             const std::string& table,
                                             const DataFrame& frame,
                                             int64_t chunksize) {
    try {
        duckdb::Appender appender(conn, table);
        for (size_t row = 0; row < frame.RowCount(); ++row) {
            appender.BeginRow();
            for (const auto& col : frame.columns()) {
                appender.Append<duckdb::Value>(ToDuckValue(col.values[row]));
            }
            appender.EndRow();
            if (chunksize > 0 && (row + 1) % static_cast<size_t>(chunksize) == 0) {
                appender.Flush();
            }
        }
        appender.Close();
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("append to '{}' failed: {}", table, e.what()));
    }
    return {};
}

std::expected<DataFrame, std::string> FrameFromResult(duckdb::MaterializedQueryResult& result,
                                                      bool coerce_float) {
    std::vector<Column> columns;
    columns.reserve(result.ColumnCount());
    const auto rows = result.RowCount();

    try {
        for (duckdb::idx_t c = 0; c < result.ColumnCount(); ++c) {
            Column col{result.names[c], DTypeFor(result.types[c], coerce_float), {}};
            col.values.reserve(rows);
            for (duckdb::idx_t r = 0; r < rows; ++r) {
                col.values.push_back(FromDuckValue(result.GetValue(c, r), col.dtype));
            }
            columns.push_back(std::move(col));
        }
    } catch (const std::exception& e) {
        return std::unexpected(fmt::format("cannot convert query result: {}", e.what()));
    }
    return DataFrame::FromColumns(std::move(columns));
}

}  // namespace dataport::codec
