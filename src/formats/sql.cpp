// SPDX-License-Identifier: MIT

#include "dataport/formats/sql.hpp"

#include <fmt/format.h>

namespace dataport {

std::expected<SqlLoad, std::string> SqlLoad::FromOptions(const OptionMap& options,
                                                         const ExternalHandles& handles) {
    OptionReader opts(options);
    SqlLoad cfg;
    cfg.query_or_table = opts.Require<std::string>("query_or_table");
    cfg.connection = handles.sql;
    cfg.coerce_float = opts.GetOr<bool>("coerce_float", cfg.coerce_float);
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> SqlLoad::Validate() const {
    if (query_or_table.empty()) {
        return std::unexpected(std::string("query_or_table must not be empty"));
    }
    if (connection == nullptr) {
        return std::unexpected(std::string("sql reader requires a connection"));
    }
    return {};
}

OptionMap SqlLoad::LoadingOptions() const {
    return OptionMap{{"coerce_float", coerce_float}};
}

std::expected<Decoded, std::string> SqlLoad::Decode(const OptionMap& options) const {
    auto frame = connection->ReadSql(query_or_table, options);
    if (!frame) return std::unexpected(std::move(frame.error()));
    auto rows = static_cast<int64_t>(frame->RowCount());
    return Decoded{std::move(*frame), SqlTransport{rows}};
}

std::expected<SqlSave, std::string> SqlSave::FromOptions(const OptionMap& options,
                                                         const ExternalHandles& handles) {
    OptionReader opts(options);
    SqlSave cfg;
    cfg.table_name = opts.Require<std::string>("table_name");
    cfg.connection = handles.sql;
    cfg.if_exists = opts.GetOr<std::string>("if_exists", cfg.if_exists);
    cfg.chunksize = opts.Get<int64_t>("chunksize");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> SqlSave::Validate() const {
    if (table_name.empty()) {
        return std::unexpected(std::string("table_name must not be empty"));
    }
    if (connection == nullptr) {
        return std::unexpected(std::string("sql writer requires a connection"));
    }
    if (if_exists != "fail" && if_exists != "replace" && if_exists != "append") {
        return std::unexpected(fmt::format(
            "if_exists must be one of fail, replace, append; got '{}'", if_exists));
    }
    if (chunksize && *chunksize <= 0) {
        return std::unexpected(fmt::format("chunksize must be positive, got {}", *chunksize));
    }
    return {};
}

OptionMap SqlSave::SavingOptions() const {
    OptionMap options{{"if_exists", if_exists}};
    PutIfSet(options, "chunksize", chunksize);
    return options;
}

std::expected<TransportInfo, std::string> SqlSave::Encode(const DataFrame& frame,
                                                          const OptionMap& options) const {
    auto rows = connection->WriteFrame(frame, table_name, options);
    if (!rows) return std::unexpected(std::move(rows.error()));
    return SqlTransport{*rows};
}

}  // namespace dataport
