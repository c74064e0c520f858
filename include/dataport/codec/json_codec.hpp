// SPDX-License-Identifier: MIT

// include/dataport/codec/json_codec.hpp
#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "dataport/data_frame.hpp"
#include "dataport/options.hpp"

namespace dataport::codec {

/// JSON layouts understood by ReadJson/WriteJson.
///
/// - `records`: `[{"a": 1, "b": "x"}, ...]`
/// - `columns`: `{"a": {"0": 1, "1": 2}, "b": {...}}`
/// - `split`:   `{"columns": ["a", "b"], "index": [0, 1], "data": [[1, "x"], ...]}`
inline constexpr std::string_view kJsonOrients[] = {"records", "columns", "split"};

/// True for the accepted spellings of UTF-8 ("utf-8" or "utf8", any case).
bool IsUtf8Encoding(std::string_view encoding);

/// Parse a JSON file into a frame.
///
/// Options: `orient` (default "columns"), `lines` (one record object per
/// line; requires records orient), `encoding` (only "utf-8").
std::expected<DataFrame, std::string> ReadJson(const std::string& path,
                                               const OptionMap& options);

/// Serialize a frame as JSON.
///
/// Options: `orient` (default "columns"), `indent` (0 = compact), `lines`.
/// Non-finite doubles are written as null.
std::expected<void, std::string> WriteJson(const DataFrame& frame, const std::string& path,
                                           const OptionMap& options);

}  // namespace dataport::codec
