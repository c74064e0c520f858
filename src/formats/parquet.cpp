// SPDX-License-Identifier: MIT

#include "dataport/formats/parquet.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

#include "dataport/codec/duckdb_file_codec.hpp"
#include "file_format.hpp"

namespace dataport {

std::expected<ParquetLoad, std::string> ParquetLoad::FromOptions(const OptionMap& options,
                                                                 const ExternalHandles&) {
    OptionReader opts(options);
    ParquetLoad cfg;
    cfg.path = opts.Require<std::string>("path");
    cfg.columns = opts.Get<std::vector<std::string>>("columns");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> ParquetLoad::Validate() const {
    return formats::RequirePath(path);
}

OptionMap ParquetLoad::LoadingOptions() const {
    OptionMap options;
    PutIfSet(options, "columns", columns);
    return options;
}

std::expected<Decoded, std::string> ParquetLoad::Decode(const OptionMap& options) const {
    return formats::DecodeFile(path, options, codec::ReadParquet);
}

std::expected<ParquetSave, std::string> ParquetSave::FromOptions(const OptionMap& options,
                                                                 const ExternalHandles&) {
    OptionReader opts(options);
    ParquetSave cfg;
    cfg.path = opts.Require<std::string>("path");
    cfg.compression = opts.GetOr<std::string>("compression", cfg.compression);
    cfg.row_group_size = opts.Get<int64_t>("row_group_size");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> ParquetSave::Validate() const {
    if (auto ok = formats::RequirePath(path); !ok) return ok;
    if (std::ranges::find(codec::kParquetCompressions, compression) ==
        std::end(codec::kParquetCompressions)) {
        return std::unexpected(fmt::format("unknown parquet compression '{}'", compression));
    }
    if (row_group_size && *row_group_size <= 0) {
        return std::unexpected(
            fmt::format("row_group_size must be positive, got {}", *row_group_size));
    }
    return {};
}

OptionMap ParquetSave::SavingOptions() const {
    OptionMap options{{"compression", compression}};
    PutIfSet(options, "row_group_size", row_group_size);
    return options;
}

std::expected<TransportInfo, std::string> ParquetSave::Encode(const DataFrame& frame,
                                                              const OptionMap& options) const {
    return formats::EncodeFile(frame, path, options, codec::WriteParquet);
}

}  // namespace dataport
