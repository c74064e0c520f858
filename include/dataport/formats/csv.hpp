// SPDX-License-Identifier: MIT

// include/dataport/formats/csv.hpp
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

/// Delimited text reader configuration.
///
/// @code
///   CsvReader reader(CsvLoad{.path = "people.csv", .sep = ";"});
///   auto loaded = reader.Load(TypeId::DataFrame);
/// @endcode
struct CsvLoad {
    static constexpr std::string_view kFormat = "csv";
    static constexpr std::array<TypeId, 1> kApplicableTypes = {TypeId::DataFrame};

    std::string path;
    std::string sep = ",";
    bool header = true;
    std::string quotechar = "\"";
    std::optional<std::string> na_values;
    std::optional<int64_t> skiprows;
    std::optional<int64_t> nrows;
    std::optional<std::vector<std::string>> usecols;

    static std::expected<CsvLoad, std::string> FromOptions(const OptionMap& options,
                                                           const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap LoadingOptions() const;
    std::expected<Decoded, std::string> Decode(const OptionMap& options) const;
};

/// Delimited text writer configuration.
struct CsvSave {
    static constexpr std::string_view kFormat = "csv";
    static constexpr std::array<TypeId, 1> kApplicableTypes = {TypeId::DataFrame};

    std::string path;
    std::string sep = ",";
    bool header = true;
    std::string na_rep;
    std::string quotechar = "\"";

    static std::expected<CsvSave, std::string> FromOptions(const OptionMap& options,
                                                           const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap SavingOptions() const;
    std::expected<TransportInfo, std::string> Encode(const DataFrame& frame,
                                                     const OptionMap& options) const;
};

using CsvReader = Reader<CsvLoad>;
using CsvWriter = Writer<CsvSave>;

}  // namespace dataport
