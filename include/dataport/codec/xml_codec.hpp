// SPDX-License-Identifier: MIT

// include/dataport/codec/xml_codec.hpp
#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "dataport/data_frame.hpp"
#include "dataport/options.hpp"

namespace dataport::codec {

/// Selects the row elements of a `<data><row>...</row></data>` document.
inline constexpr std::string_view kDefaultRowXPath = "/*/*";

/// @return True if @p name can be used as an element name.
bool IsValidXmlName(std::string_view name);

/// Parse an XML document into a frame.
///
/// Every element selected by `xpath` (default kDefaultRowXPath) is one row;
/// its attributes and child elements are the fields, in document order.
/// Text values are typed with ParseScalar.  Option `encoding` overrides the
/// document's declared encoding.
std::expected<DataFrame, std::string> ReadXml(const std::string& path,
                                              const OptionMap& options);

/// Serialize a frame as `<root_name><row_name><col>v</col>...</row_name>...`.
///
/// Options: `root_name` ("data"), `row_name` ("row"), `xml_declaration`
/// (true), `pretty_print` (true), `encoding` ("utf-8").  Null cells are
/// written as empty elements.
std::expected<void, std::string> WriteXml(const DataFrame& frame, const std::string& path,
                                          const OptionMap& options);

}  // namespace dataport::codec
