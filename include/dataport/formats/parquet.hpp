// SPDX-License-Identifier: MIT

// include/dataport/formats/parquet.hpp
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dataport/adapter.hpp"

namespace dataport {

/// Parquet reader configuration.  `columns` selects a subset in order.
struct ParquetLoad {
    static constexpr std::string_view kFormat = "parquet";
    static constexpr std::array<TypeId, 1> kApplicableTypes = {TypeId::DataFrame};

    std::string path;
    std::optional<std::vector<std::string>> columns;

    static std::expected<ParquetLoad, std::string> FromOptions(const OptionMap& options,
                                                               const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap LoadingOptions() const;
    std::expected<Decoded, std::string> Decode(const OptionMap& options) const;
};

/// Parquet writer configuration.
struct ParquetSave {
    static constexpr std::string_view kFormat = "parquet";
    static constexpr std::array<TypeId, 1> kApplicableTypes = {TypeId::DataFrame};

    std::string path;
    std::string compression = "snappy";  ///< snappy, gzip, zstd or uncompressed
    std::optional<int64_t> row_group_size;

    static std::expected<ParquetSave, std::string> FromOptions(const OptionMap& options,
                                                               const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap SavingOptions() const;
    std::expected<TransportInfo, std::string> Encode(const DataFrame& frame,
                                                     const OptionMap& options) const;
};

using ParquetReader = Reader<ParquetLoad>;
using ParquetWriter = Writer<ParquetSave>;

}  // namespace dataport
