// SPDX-License-Identifier: MIT

// include/dataport/codec/duckdb_frame.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

#include <duckdb.hpp>

#include "dataport/data_frame.hpp"

namespace dataport::codec {

/// Escape single quotes for a SQL string literal.
std::string EscapeString(std::string_view str);

/// Quote an identifier (table/column name), doubling embedded quotes.
std::string QuoteIdentifier(std::string_view ident);

/// `CREATE TABLE "table" ("col" BIGINT, ...)` for the frame's columns.
/// @return An error string for a frame with no columns.
std::expected<std::string, std::string> CreateTableSql(std::string_view table,
                                                       const DataFrame& frame);

/// Run @p sql and return its materialized result.
/// @return The database error message on failure.
std::expected<std::unique_ptr<duckdb::MaterializedQueryResult>, std::string> RunQuery(
    duckdb::Connection& conn, const std::string& sql);

/// Append every row of @p frame to an existing table through a DuckDB
/// Appender.  The appender is flushed every @p chunksize rows (0 = once at
/// the end) and always closed before returning.
std::expected<void, std::string> AppendFrame(duckdb::Connection& conn,
                                             const std::string& table,
                                             const DataFrame& frame,
                                             int64_t chunksize = 0);

/// Convert a materialized query result into a frame.
///
/// Integer types become Int64, FLOAT/DOUBLE become Float64, BOOLEAN stays
/// Bool, DECIMAL becomes Float64 when @p coerce_float is set and exact text
/// otherwise; every other type is rendered as text.
std::expected<DataFrame, std::string> FrameFromResult(duckdb::MaterializedQueryResult& result,
                                                      bool coerce_float);

}  // namespace dataport::codec
