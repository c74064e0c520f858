// SPDX-License-Identifier: MIT

#include "dataport/codec/duckdb_file_codec.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <optional>
#include <vector>

#include <duckdb.hpp>
#include <fmt/format.h>

#include "dataport/codec/duckdb_frame.hpp"

namespace dataport::codec {

namespace {

constexpr std::string_view kScratchTable = "frame";

// Comma-separated quoted identifiers, or "*" when no subset is requested
std::string SelectList(const std::optional<std::vector<std::string>>& columns) {
    if (!columns || columns->empty()) return "*";
    std::string list;
    for (const auto& name : *columns) {
        if (!list.empty()) list += ", ";
        list += QuoteIdentifier(name);
    }
    return list;
}

// Run a SELECT against a private in-memory database
std::expected<DataFrame, std::string> QueryFrame(const std::string& sql) {
    try {
        duckdb::DuckDB db(nullptr);
        duckdb::Connection conn(db);
        auto result = RunQuery(conn, sql);
        if (!result) return std::unexpected(result.error());
        return FrameFromResult(**result, /*coerce_float=*/true);
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
}

// Stage @p frame in a scratch table and COPY it to @p path
std::expected<void, std::string> CopyFrame(const DataFrame& frame, const std::string& path,
                                           const std::string& copy_options) {
    auto create = CreateTableSql(kScratchTable, frame);
    if (!create) return std::unexpected(create.error());

    try {
        duckdb::DuckDB db(nullptr);
        duckdb::Connection conn(db);
        if (auto r = RunQuery(conn, *create); !r) return std::unexpected(r.error());
        if (auto ok = AppendFrame(conn, std::string(kScratchTable), frame); !ok) {
            return std::unexpected(ok.error());
        }
        auto sql = fmt::format("COPY {} TO '{}' ({})", QuoteIdentifier(kScratchTable),
                               EscapeString(path), copy_options);
        if (auto r = RunQuery(conn, sql); !r) return std::unexpected(r.error());
    } catch (const std::exception& e) {
        return std::unexpected(std::string(e.what()));
    }
    return {};
}

}  // namespace

std::expected<DataFrame, std::string> ReadCsv(const std::string& path,
                                              const OptionMap& options) {
    OptionReader opts(options);
    auto sep = opts.GetOr<std::string>("sep", ",");
    auto header = opts.GetOr<bool>("header", true);
    auto quotechar = opts.GetOr<std::string>("quotechar", "\"");
    auto na_values = opts.Get<std::string>("na_values");
    auto skiprows = opts.Get<int64_t>("skiprows");
    auto nrows = opts.Get<int64_t>("nrows");
    auto usecols = opts.Get<std::vector<std::string>>("usecols");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    std::string args = fmt::format("'{}', delim='{}', header={}, quote='{}'", EscapeString(path),
                                   EscapeString(sep), header, EscapeString(quotechar));
    if (na_values) args += fmt::format(", nullstr='{}'", EscapeString(*na_values));
    if (skiprows) args += fmt::format(", skip={}", *skiprows);

    auto sql = fmt::format("SELECT {} FROM read_csv({})", SelectList(usecols), args);
    if (nrows) sql += fmt::format(" LIMIT {}", *nrows);
    return QueryFrame(sql);
}

std::expected<void, std::string> WriteCsv(const DataFrame& frame, const std::string& path,
                                          const OptionMap& options) {
    OptionReader opts(options);
    auto sep = opts.GetOr<std::string>("sep", ",");
    auto header = opts.GetOr<bool>("header", true);
    auto na_rep = opts.GetOr<std::string>("na_rep", "");
    auto quotechar = opts.GetOr<std::string>("quotechar", "\"");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    return CopyFrame(frame, path,
                     fmt::format("FORMAT CSV, DELIMITER '{}', HEADER {}, QUOTE '{}', NULLSTR '{}'",
                                 EscapeString(sep), header, EscapeString(quotechar),
                                 EscapeString(na_rep)));
}

std::expected<DataFrame, std::string> ReadParquet(const std::string& path,
                                                  const OptionMap& options) {
    OptionReader opts(options);
    auto columns = opts.Get<std::vector<std::string>>("columns");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    return QueryFrame(fmt::format("SELECT {} FROM read_parquet('{}')", SelectList(columns),
                                  EscapeString(path)));
}

std::expected<void, std::string> WriteParquet(const DataFrame& frame, const std::string& path,
                                              const OptionMap& options) {
    OptionReader opts(options);
    auto compression = opts.GetOr<std::string>("compression", "snappy");
    auto row_group_size = opts.Get<int64_t>("row_group_size");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    if (std::ranges::find(kParquetCompressions, compression) == std::end(kParquetCompressions)) {
        return std::unexpected(fmt::format("unknown parquet compression '{}'", compression));
    }

    std::string copy_options = fmt::format("FORMAT PARQUET, COMPRESSION '{}'", compression);
    if (row_group_size) copy_options += fmt::format(", ROW_GROUP_SIZE {}", *row_group_size);
    return CopyFrame(frame, path, copy_options);
}

}  // namespace dataport::codec
