// SPDX-License-Identifier: MIT

// include/dataport/duckdb_connection.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include <duckdb.hpp>

#include "dataport/sql_connection.hpp"

namespace dataport {

/// ISqlConnection over a caller-owned DuckDB connection.
///
/// Reads accept a SELECT statement or a bare table name (read as
/// `SELECT * FROM "name"`).  Writes create, replace or append to the target
/// table according to `if_exists`; table (re)creation and the inserted rows
/// commit together, so a failed write leaves the database unchanged.
///
/// Not thread-safe: the wrapped connection must not be used concurrently.
class DuckDbConnection final : public ISqlConnection {
public:
    explicit DuckDbConnection(duckdb::Connection& conn) : conn_(conn) {}

    /// Options: `coerce_float` (default true; DECIMAL columns become
    /// Float64, otherwise their exact text).
    std::expected<DataFrame, std::string> ReadSql(std::string_view query_or_table,
                                                  const OptionMap& options) override;

    /// Options: `if_exists` ("fail", "replace" or "append"; default "fail"),
    /// `chunksize` (rows per appender flush).
    std::expected<int64_t, std::string> WriteFrame(const DataFrame& frame,
                                                   std::string_view table,
                                                   const OptionMap& options) override;

    /// @return True if @p table exists in the connection's catalog.
    std::expected<bool, std::string> TableExists(std::string_view table);

    /// @return True if @p text is a plain identifier rather than a query.
    static bool IsBareIdentifier(std::string_view text);

private:
    duckdb::Connection& conn_;
};

}  // namespace dataport
