// SPDX-License-Identifier: MIT

// include/dataport/metadata.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "dataport/data_frame.hpp"

namespace dataport {

/// Transport facts for file-based adapters.
struct FileMetadata {
    std::string path;
    uint64_t size = 0;  ///< Byte size of the file after the call

    bool operator==(const FileMetadata&) const = default;
};

/// Transport facts for database-backed adapters.
struct SqlMetadata {
    int64_t rows = 0;  ///< Rows written, or rows returned by a query

    bool operator==(const SqlMetadata&) const = default;
};

/// Shape facts of the dataset that was loaded or saved.
struct DataFrameMetadata {
    size_t rows = 0;
    std::vector<std::string> column_names;
    std::vector<std::string> datatypes;  ///< Aligned with column_names

    bool operator==(const DataFrameMetadata&) const = default;
};

/// Uniform envelope returned by every load and save.
///
/// Exactly one of file_metadata / sql_metadata is set, chosen by the
/// adapter's transport kind.
struct ResultMetadata {
    std::optional<FileMetadata> file_metadata;
    std::optional<SqlMetadata> sql_metadata;
    DataFrameMetadata dataframe_metadata;

    bool operator==(const ResultMetadata&) const = default;
};

struct FileTransport {
    std::string path;
    uint64_t byte_size = 0;
};

struct SqlTransport {
    int64_t rows_affected = 0;
};

/// Raw transport signal reported by an adapter.
using TransportInfo = std::variant<FileTransport, SqlTransport>;

/// Raw shape signal of a materialized frame.
struct DataShapeInfo {
    size_t row_count = 0;
    std::vector<std::string> column_names;
    std::vector<std::string> column_dtypes;
};

/// Read the shape of @p frame.  Computed on every call, never cached.
DataShapeInfo ShapeOf(const DataFrame& frame);

/// Build the metadata envelope.  Pure; performs no I/O.
/// @throws std::invalid_argument if column names and dtypes are not aligned.
ResultMetadata BuildMetadata(const TransportInfo& transport, const DataShapeInfo& shape);

/// Render metadata in its conceptual JSON shape:
/// `{"file_metadata": {...}, "dataframe_metadata": {...}}`.
std::string ToJson(const ResultMetadata& metadata);

}  // namespace dataport
