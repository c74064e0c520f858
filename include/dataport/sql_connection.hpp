// SPDX-License-Identifier: MIT

// include/dataport/sql_connection.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "dataport/data_frame.hpp"
#include "dataport/options.hpp"

namespace dataport {

/// Narrow interface to a caller-owned database connection.
///
/// SQL adapters hold a non-owning pointer to an implementation.  Opening,
/// closing and synchronizing the underlying handle is the caller's concern.
/// See DuckDbConnection for a concrete backend.
class ISqlConnection {
public:
    virtual ~ISqlConnection() = default;

    /// Run a query, or read a whole table when @p query_or_table is a bare
    /// table name, and materialize the result.
    /// @param query_or_table  SQL SELECT text or a table name.
    /// @param options         Codec options (e.g. `coerce_float`).
    /// @return The result set, or an error string from the database.
    virtual std::expected<DataFrame, std::string> ReadSql(
        std::string_view query_or_table, const OptionMap& options) = 0;

    /// Write every row of @p frame into @p table.
    /// @param frame    Rows to insert.
    /// @param table    Target table name (unquoted).
    /// @param options  Codec options (e.g. `if_exists`, `chunksize`).
    /// @return Number of rows written, or an error string.
    virtual std::expected<int64_t, std::string> WriteFrame(
        const DataFrame& frame, std::string_view table, const OptionMap& options) = 0;
};

}  // namespace dataport
