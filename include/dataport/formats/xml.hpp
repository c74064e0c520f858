// SPDX-License-Identifier: MIT

// include/dataport/formats/xml.hpp
#pragma once

#include <array>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "dataport/adapter.hpp"

namespace dataport {

/// XML reader configuration.  `xpath` selects the row elements.
struct XmlLoad {
    static constexpr std::string_view kFormat = "xml";
    static constexpr std::array<TypeId, 2> kApplicableTypes = {TypeId::DataFrame,
                                                               TypeId::RecordList};

    std::string path;
    std::string xpath = "/*/*";
    std::optional<std::string> encoding;

    static std::expected<XmlLoad, std::string> FromOptions(const OptionMap& options,
                                                           const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap LoadingOptions() const;
    std::expected<Decoded, std::string> Decode(const OptionMap& options) const;
};

/// XML writer configuration.  Element names are checked at construction.
struct XmlSave {
    static constexpr std::string_view kFormat = "xml";
    static constexpr std::array<TypeId, 2> kApplicableTypes = {TypeId::DataFrame,
                                                               TypeId::RecordList};

    std::string path;
    std::string root_name = "data";
    std::string row_name = "row";
    bool xml_declaration = true;
    bool pretty_print = true;
    std::string encoding = "utf-8";

    static std::expected<XmlSave, std::string> FromOptions(const OptionMap& options,
                                                           const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap SavingOptions() const;
    std::expected<TransportInfo, std::string> Encode(const DataFrame& frame,
                                                     const OptionMap& options) const;
};

using XmlReader = Reader<XmlLoad>;
using XmlWriter = Writer<XmlSave>;

}  // namespace dataport
