// SPDX-License-Identifier: MIT

#include "dataport/formats/csv.hpp"

#include <fmt/format.h>

#include "dataport/codec/duckdb_file_codec.hpp"
#include "file_format.hpp"

namespace dataport {

namespace {

std::expected<void, std::string> CheckDialect(const std::string& sep,
                                              const std::string& quotechar) {
    if (sep.empty()) {
        return std::unexpected(std::string("sep must not be empty"));
    }
    if (quotechar.size() != 1) {
        return std::unexpected(
            fmt::format("quotechar must be a single character, got '{}'", quotechar));
    }
    return {};
}

}  // namespace

std::expected<CsvLoad, std::string> CsvLoad::FromOptions(const OptionMap& options,
                                                         const ExternalHandles&) {
    OptionReader opts(options);
    CsvLoad cfg;
    cfg.path = opts.Require<std::string>("path");
    cfg.sep = opts.GetOr<std::string>("sep", cfg.sep);
    cfg.header = opts.GetOr<bool>("header", cfg.header);
    cfg.quotechar = opts.GetOr<std::string>("quotechar", cfg.quotechar);
    cfg.na_values = opts.Get<std::string>("na_values");
    cfg.skiprows = opts.Get<int64_t>("skiprows");
    cfg.nrows = opts.Get<int64_t>("nrows");
    cfg.usecols = opts.Get<std::vector<std::string>>("usecols");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> CsvLoad::Validate() const {
    if (auto ok = formats::RequirePath(path); !ok) return ok;
    if (auto ok = CheckDialect(sep, quotechar); !ok) return ok;
    if (skiprows && *skiprows < 0) {
        return std::unexpected(fmt::format("skiprows must be non-negative, got {}", *skiprows));
    }
    if (nrows && *nrows < 0) {
        return std::unexpected(fmt::format("nrows must be non-negative, got {}", *nrows));
    }
    return {};
}

OptionMap CsvLoad::LoadingOptions() const {
    OptionMap options{{"sep", sep}, {"header", header}, {"quotechar", quotechar}};
    PutIfSet(options, "na_values", na_values);
    PutIfSet(options, "skiprows", skiprows);
    PutIfSet(options, "nrows", nrows);
    PutIfSet(options, "usecols", usecols);
    return options;
}

std::expected<Decoded, std::string> CsvLoad::Decode(const OptionMap& options) const {
    return formats::DecodeFile(path, options, codec::ReadCsv);
}

std::expected<CsvSave, std::string> CsvSave::FromOptions(const OptionMap& options,
                                                         const ExternalHandles&) {
    OptionReader opts(options);
    CsvSave cfg;
    cfg.path = opts.Require<std::string>("path");
    cfg.sep = opts.GetOr<std::string>("sep", cfg.sep);
    cfg.header = opts.GetOr<bool>("header", cfg.header);
    cfg.na_rep = opts.GetOr<std::string>("na_rep", cfg.na_rep);
    cfg.quotechar = opts.GetOr<std::string>("quotechar", cfg.quotechar);
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> CsvSave::Validate() const {
    if (auto ok = formats::RequirePath(path); !ok) return ok;
    return CheckDialect(sep, quotechar);
}

OptionMap CsvSave::SavingOptions() const {
    return OptionMap{
        {"sep", sep}, {"header", header}, {"na_rep", na_rep}, {"quotechar", quotechar}};
}

std::expected<TransportInfo, std::string> CsvSave::Encode(const DataFrame& frame,
                                                          const OptionMap& options) const {
    return formats::EncodeFile(frame, path, options, codec::WriteCsv);
}

}  // namespace dataport
