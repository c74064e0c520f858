// SPDX-License-Identifier: MIT

// include/dataport/codec/html_codec.hpp
#pragma once

#include <expected>
#include <string>
#include <vector>

#include "dataport/data_frame.hpp"
#include "dataport/options.hpp"

namespace dataport::codec {

/// Cell texts read back as null unless `na_values` says otherwise.
inline const std::vector<std::string> kDefaultHtmlNaValues = {"", "NaN", "nan", "NA", "N/A",
                                                              "NULL", "null"};

/// Read one `<table>` of an HTML document.
///
/// Options: `table_index` (default 0; counted among the tables that pass
/// `match`), `match` (keep only tables whose text contains it), `na_values`
/// (cell texts read as null, default kDefaultHtmlNaValues).  A first row made
/// only of `<th>` cells supplies the column names; otherwise columns are
/// named by position.
std::expected<DataFrame, std::string> ReadHtml(const std::string& path,
                                               const OptionMap& options);

/// Write a frame as a single HTML `<table class="dataframe">`.
///
/// Options: `border` (1), `header` (true), `na_rep` ("NaN"), `table_id`,
/// `classes` (added after "dataframe").
std::expected<void, std::string> WriteHtml(const DataFrame& frame, const std::string& path,
                                           const OptionMap& options);

}  // namespace dataport::codec
