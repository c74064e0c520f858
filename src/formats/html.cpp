// SPDX-License-Identifier: MIT

#include "dataport/formats/html.hpp"

#include <fmt/format.h>

#include "file_format.hpp"

namespace dataport {

std::expected<HtmlLoad, std::string> HtmlLoad::FromOptions(const OptionMap& options,
                                                           const ExternalHandles&) {
    OptionReader opts(options);
    HtmlLoad cfg;
    cfg.path = opts.Require<std::string>("path");
    cfg.table_index = opts.GetOr<int64_t>("table_index", cfg.table_index);
    cfg.match = opts.Get<std::string>("match");
    cfg.na_values = opts.GetOr<std::vector<std::string>>("na_values", cfg.na_values);
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> HtmlLoad::Validate() const {
    if (auto ok = formats::RequirePath(path); !ok) return ok;
    if (table_index < 0) {
        return std::unexpected(
            fmt::format("table_index must be non-negative, got {}", table_index));
    }
    return {};
}

OptionMap HtmlLoad::LoadingOptions() const {
    OptionMap options{{"table_index", table_index}, {"na_values", na_values}};
    PutIfSet(options, "match", match);
    return options;
}

std::expected<Decoded, std::string> HtmlLoad::Decode(const OptionMap& options) const {
    return formats::DecodeFile(path, options, codec::ReadHtml);
}

std::expected<HtmlSave, std::string> HtmlSave::FromOptions(const OptionMap& options,
                                                           const ExternalHandles&) {
    OptionReader opts(options);
    HtmlSave cfg;
    cfg.path = opts.Require<std::string>("path");
    cfg.border = opts.GetOr<int64_t>("border", cfg.border);
    cfg.header = opts.GetOr<bool>("header", cfg.header);
    cfg.na_rep = opts.GetOr<std::string>("na_rep", cfg.na_rep);
    cfg.table_id = opts.Get<std::string>("table_id");
    cfg.classes = opts.Get<std::vector<std::string>>("classes");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> HtmlSave::Validate() const {
    if (auto ok = formats::RequirePath(path); !ok) return ok;
    if (border < 0) {
        return std::unexpected(fmt::format("border must be non-negative, got {}", border));
    }
    return {};
}

OptionMap HtmlSave::SavingOptions() const {
    OptionMap options{{"border", border}, {"header", header}, {"na_rep", na_rep}};
    PutIfSet(options, "table_id", table_id);
    PutIfSet(options, "classes", classes);
    return options;
}

std::expected<TransportInfo, std::string> HtmlSave::Encode(const DataFrame& frame,
                                                           const OptionMap& options) const {
    return formats::EncodeFile(frame, path, options, codec::WriteHtml);
}

}  // namespace dataport
