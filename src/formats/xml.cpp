// SPDX-License-Identifier: MIT

#include "dataport/formats/xml.hpp"

#include <fmt/format.h>

#include "dataport/codec/xml_codec.hpp"
#include "file_format.hpp"

namespace dataport {

std::expected<XmlLoad, std::string> XmlLoad::FromOptions(const OptionMap& options,
                                                         const ExternalHandles&) {
    OptionReader opts(options);
    XmlLoad cfg;
    cfg.path = opts.Require<std::string>("path");
    cfg.xpath = opts.GetOr<std::string>("xpath", cfg.xpath);
    cfg.encoding = opts.Get<std::string>("encoding");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> XmlLoad::Validate() const {
    if (auto ok = formats::RequirePath(path); !ok) return ok;
    if (xpath.empty()) {
        return std::unexpected(std::string("xpath must not be empty"));
    }
    return {};
}

OptionMap XmlLoad::LoadingOptions() const {
    OptionMap options{{"xpath", xpath}};
    PutIfSet(options, "encoding", encoding);
    return options;
}

std::expected<Decoded, std::string> XmlLoad::Decode(const OptionMap& options) const {
    return formats::DecodeFile(path, options, codec::ReadXml);
}

std::expected<XmlSave, std::string> XmlSave::FromOptions(const OptionMap& options,
                                                         const ExternalHandles&) {
    OptionReader opts(options);
    XmlSave cfg;
    cfg.path = opts.Require<std::string>("path");
    cfg.root_name = opts.GetOr<std::string>("root_name", cfg.root_name);
    cfg.row_name = opts.GetOr<std::string>("row_name", cfg.row_name);
    cfg.xml_declaration = opts.GetOr<bool>("xml_declaration", cfg.xml_declaration);
    cfg.pretty_print = opts.GetOr<bool>("pretty_print", cfg.pretty_print);
    cfg.encoding = opts.GetOr<std::string>("encoding", cfg.encoding);
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> XmlSave::Validate() const {
    if (auto ok = formats::RequirePath(path); !ok) return ok;
    for (const auto* name : {&root_name, &row_name}) {
        if (!codec::IsValidXmlName(*name)) {
            return std::unexpected(fmt::format("'{}' is not a valid element name", *name));
        }
    }
    if (encoding.empty()) {
        return std::unexpected(std::string("encoding must not be empty"));
    }
    return {};
}

OptionMap XmlSave::SavingOptions() const {
    return OptionMap{{"root_name", root_name},
                     {"row_name", row_name},
                     {"xml_declaration", xml_declaration},
                     {"pretty_print", pretty_print},
                     {"encoding", encoding}};
}

std::expected<TransportInfo, std::string> XmlSave::Encode(const DataFrame& frame,
                                                          const OptionMap& options) const {
    return formats::EncodeFile(frame, path, options, codec::WriteXml);
}

}  // namespace dataport
