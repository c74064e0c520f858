// SPDX-License-Identifier: MIT

// include/dataport/formats/json.hpp
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "dataport/adapter.hpp"

namespace dataport {

/// JSON reader configuration.  See codec::ReadJson for the orients.
struct JsonLoad {
    static constexpr std::string_view kFormat = "json";
    static constexpr std::array<TypeId, 2> kApplicableTypes = {TypeId::DataFrame,
                                                               TypeId::RecordList};

    std::string path;
    std::string orient = "columns";
    bool lines = false;
    std::string encoding = "utf-8";

    static std::expected<JsonLoad, std::string> FromOptions(const OptionMap& options,
                                                            const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap LoadingOptions() const;
    std::expected<Decoded, std::string> Decode(const OptionMap& options) const;
};

/// JSON writer configuration.  `indent` 0 writes compact output.
struct JsonSave {
    static constexpr std::string_view kFormat = "json";
    static constexpr std::array<TypeId, 2> kApplicableTypes = {TypeId::DataFrame,
                                                               TypeId::RecordList};

    std::string path;
    std::string orient = "columns";
    int64_t indent = 0;
    bool lines = false;

    static std::expected<JsonSave, std::string> FromOptions(const OptionMap& options,
                                                            const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap SavingOptions() const;
    std::expected<TransportInfo, std::string> Encode(const DataFrame& frame,
                                                     const OptionMap& options) const;
};

using JsonReader = Reader<JsonLoad>;
using JsonWriter = Writer<JsonSave>;

}  // namespace dataport
