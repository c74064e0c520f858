// SPDX-License-Identifier: MIT

// include/dataport/codec/duckdb_file_codec.hpp
#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "dataport/data_frame.hpp"
#include "dataport/options.hpp"

namespace dataport::codec {

/// Parquet compression codecs accepted by WriteParquet.
inline constexpr std::string_view kParquetCompressions[] = {
    "snappy", "gzip", "zstd", "uncompressed"};

/// Read a delimited text file through DuckDB's `read_csv`.
///
/// Options: `sep` (default ","), `header` (default true), `quotechar`
/// (default "\""), `na_values`, `skiprows`, `nrows`, `usecols`.
std::expected<DataFrame, std::string> ReadCsv(const std::string& path,
                                              const OptionMap& options);

/// Write @p frame as delimited text with `COPY ... (FORMAT CSV)`.
///
/// Options: `sep`, `header`, `na_rep` (default ""), `quotechar`.
std::expected<void, std::string> WriteCsv(const DataFrame& frame, const std::string& path,
                                          const OptionMap& options);

/// Read a parquet file.  Option: `columns` (subset, in the given order).
std::expected<DataFrame, std::string> ReadParquet(const std::string& path,
                                                  const OptionMap& options);

/// Write a parquet file.
///
/// Options: `compression` (see kParquetCompressions, default "snappy"),
/// `row_group_size`.
std::expected<void, std::string> WriteParquet(const DataFrame& frame, const std::string& path,
                                              const OptionMap& options);

}  // namespace dataport::codec
