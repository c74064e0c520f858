// SPDX-License-Identifier: MIT

#include "dataport/formats/json.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

#include "dataport/codec/json_codec.hpp"
#include "file_format.hpp"

namespace dataport {

namespace {

std::expected<void, std::string> CheckLayout(const std::string& orient, bool lines) {
    if (std::ranges::find(codec::kJsonOrients, orient) == std::end(codec::kJsonOrients)) {
        return std::unexpected(fmt::format("unknown JSON orient '{}'", orient));
    }
    if (lines && orient != "records") {
        return std::unexpected(std::string("lines=true requires orient 'records'"));
    }
    return {};
}

}  // namespace

std::expected<JsonLoad, std::string> JsonLoad::FromOptions(const OptionMap& options,
                                                           const ExternalHandles&) {
    OptionReader opts(options);
    JsonLoad cfg;
    cfg.path = opts.Require<std::string>("path");
    cfg.orient = opts.GetOr<std::string>("orient", cfg.orient);
    cfg.lines = opts.GetOr<bool>("lines", cfg.lines);
    cfg.encoding = opts.GetOr<std::string>("encoding", cfg.encoding);
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> JsonLoad::Validate() const {
    if (auto ok = formats::RequirePath(path); !ok) return ok;
    if (auto ok = CheckLayout(orient, lines); !ok) return ok;
    if (!codec::IsUtf8Encoding(encoding)) {
        return std::unexpected(fmt::format("unsupported JSON encoding '{}'", encoding));
    }
    return {};
}

OptionMap JsonLoad::LoadingOptions() const {
    return OptionMap{{"orient", orient}, {"lines", lines}, {"encoding", encoding}};
}

std::expected<Decoded, std::string> JsonLoad::Decode(const OptionMap& options) const {
    return formats::DecodeFile(path, options, codec::ReadJson);
}

std::expected<JsonSave, std::string> JsonSave::FromOptions(const OptionMap& options,
                                                           const ExternalHandles&) {
    OptionReader opts(options);
    JsonSave cfg;
    cfg.path = opts.Require<std::string>("path");
    cfg.orient = opts.GetOr<std::string>("orient", cfg.orient);
    cfg.indent = opts.GetOr<int64_t>("indent", cfg.indent);
    cfg.lines = opts.GetOr<bool>("lines", cfg.lines);
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> JsonSave::Validate() const {
    if (auto ok = formats::RequirePath(path); !ok) return ok;
    if (auto ok = CheckLayout(orient, lines); !ok) return ok;
    if (indent < 0) {
        return std::unexpected(fmt::format("indent must be non-negative, got {}", indent));
    }
    return {};
}

OptionMap JsonSave::SavingOptions() const {
    return OptionMap{{"orient", orient}, {"indent", indent}, {"lines", lines}};
}

std::expected<TransportInfo, std::string> JsonSave::Encode(const DataFrame& frame,
                                                           const OptionMap& options) const {
    return formats::EncodeFile(frame, path, options, codec::WriteJson);
}

}  // namespace dataport
