// SPDX-License-Identifier: MIT

#include "dataport/metadata.hpp"

#include <stdexcept>

#include <fmt/format.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace dataport {

DataShapeInfo ShapeOf(const DataFrame& frame) {
    DataShapeInfo shape;
    shape.row_count = frame.RowCount();
    shape.column_names = frame.ColumnNames();
    shape.column_dtypes.reserve(frame.ColumnCount());
    for (DType dtype : frame.DTypes()) {
        shape.column_dtypes.emplace_back(DTypeLabel(dtype));
    }
    return shape;
}

ResultMetadata BuildMetadata(const TransportInfo& transport, const DataShapeInfo& shape) {
    if (shape.column_names.size() != shape.column_dtypes.size()) {
        throw std::invalid_argument(fmt::format(
            "shape has {} column names but {} dtypes",
            shape.column_names.size(), shape.column_dtypes.size()));
    }

    ResultMetadata metadata;
    if (const auto* file = std::get_if<FileTransport>(&transport)) {
        metadata.file_metadata = FileMetadata{file->path, file->byte_size};
    } else {
        metadata.sql_metadata = SqlMetadata{std::get<SqlTransport>(transport).rows_affected};
    }
    metadata.dataframe_metadata = DataFrameMetadata{
        shape.row_count, shape.column_names, shape.column_dtypes};
    return metadata;
}

std::string ToJson(const ResultMetadata& metadata) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();
    if (metadata.file_metadata) {
        writer.Key("file_metadata");
        writer.StartObject();
        writer.Key("path");
        writer.String(metadata.file_metadata->path.c_str(),
                      static_cast<rapidjson::SizeType>(metadata.file_metadata->path.size()));
        writer.Key("size");
        writer.Uint64(metadata.file_metadata->size);
        writer.EndObject();
    }
    if (metadata.sql_metadata) {
        writer.Key("sql_metadata");
        writer.StartObject();
        writer.Key("rows");
        writer.Int64(metadata.sql_metadata->rows);
        writer.EndObject();
    }

    const auto& df = metadata.dataframe_metadata;
    writer.Key("dataframe_metadata");
    writer.StartObject();
    writer.Key("rows");
    writer.Uint64(df.rows);
    writer.Key("column_names");
    writer.StartArray();
    for (const auto& name : df.column_names) {
        writer.String(name.c_str(), static_cast<rapidjson::SizeType>(name.size()));
    }
    writer.EndArray();
    writer.Key("datatypes");
    writer.StartArray();
    for (const auto& dtype : df.datatypes) {
        writer.String(dtype.c_str(), static_cast<rapidjson::SizeType>(dtype.size()));
    }
    writer.EndArray();
    writer.EndObject();
    writer.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace dataport
