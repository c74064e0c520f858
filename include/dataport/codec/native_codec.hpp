// SPDX-License-Identifier: MIT

// include/dataport/codec/native_codec.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <string>

#include "dataport/data_frame.hpp"
#include "dataport/options.hpp"

namespace dataport::codec {

/// Version byte written after the magic.  Increment on layout changes.
inline constexpr uint8_t kNativeVersion = 1;

/// Decode a native frame file.  Exact inverse of WriteNative: dtypes, nulls
/// and column order are preserved.
///
/// Accepts no options.
std::expected<DataFrame, std::string> ReadNative(const std::string& path,
                                                 const OptionMap& options);

/// Encode @p frame as a zstd-compressed columnar layout.
///
/// Options: `compression_level` (int, default 3), `checksum` (bool,
/// default false; adds a zstd content checksum).
std::expected<void, std::string> WriteNative(const DataFrame& frame, const std::string& path,
                                             const OptionMap& options);

}  // namespace dataport::codec
