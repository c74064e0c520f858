// SPDX-License-Identifier: MIT

// include/dataport/formats/native.hpp
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "dataport/adapter.hpp"

namespace dataport {

/// Reader for dataport's own zstd-compressed columnar files.  Round trips
/// are exact: dtypes, nulls and column order survive.
struct NativeLoad {
    static constexpr std::string_view kFormat = "native";
    static constexpr std::array<TypeId, 1> kApplicableTypes = {TypeId::DataFrame};

    std::string path;

    static std::expected<NativeLoad, std::string> FromOptions(const OptionMap& options,
                                                              const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap LoadingOptions() const;
    std::expected<Decoded, std::string> Decode(const OptionMap& options) const;
};

struct NativeSave {
    static constexpr std::string_view kFormat = "native";
    static constexpr std::array<TypeId, 1> kApplicableTypes = {TypeId::DataFrame};

    std::string path;
    int64_t compression_level = 3;  ///< zstd level, 1..19
    bool checksum = false;

    static std::expected<NativeSave, std::string> FromOptions(const OptionMap& options,
                                                              const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap SavingOptions() const;
    std::expected<TransportInfo, std::string> Encode(const DataFrame& frame,
                                                     const OptionMap& options) const;
};

using NativeReader = Reader<NativeLoad>;
using NativeWriter = Writer<NativeSave>;

}  // namespace dataport
