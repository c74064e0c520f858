// SPDX-License-Identifier: MIT

// include/dataport/formats/sql.hpp
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "dataport/adapter.hpp"
#include "dataport/sql_connection.hpp"

namespace dataport {

/// SQL reader configuration.
///
/// `connection` is borrowed from ExternalHandles::sql and must outlive the
/// reader.  Neither it nor `query_or_table` reaches the codec options.
struct SqlLoad {
    static constexpr std::string_view kFormat = "sql";
    static constexpr std::array<TypeId, 1> kApplicableTypes = {TypeId::DataFrame};

    std::string query_or_table;
    ISqlConnection* connection = nullptr;
    bool coerce_float = true;

    static std::expected<SqlLoad, std::string> FromOptions(const OptionMap& options,
                                                           const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap LoadingOptions() const;
    std::expected<Decoded, std::string> Decode(const OptionMap& options) const;
};

/// SQL writer configuration.  `if_exists` is one of fail, replace, append.
struct SqlSave {
    static constexpr std::string_view kFormat = "sql";
    static constexpr std::array<TypeId, 1> kApplicableTypes = {TypeId::DataFrame};

    std::string table_name;
    ISqlConnection* connection = nullptr;
    std::string if_exists = "fail";
    std::optional<int64_t> chunksize;

    static std::expected<SqlSave, std::string> FromOptions(const OptionMap& options,
                                                           const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap SavingOptions() const;
    std::expected<TransportInfo, std::string> Encode(const DataFrame& frame,
                                                     const OptionMap& options) const;
};

using SqlReader = Reader<SqlLoad>;
using SqlWriter = Writer<SqlSave>;

}  // namespace dataport
