// SPDX-License-Identifier: MIT

// include/dataport/formats/html.hpp
#pragma once

#include <array>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dataport/adapter.hpp"
#include "dataport/codec/html_codec.hpp"

namespace dataport {

/// HTML table reader configuration.
struct HtmlLoad {
    static constexpr std::string_view kFormat = "html";
    static constexpr std::array<TypeId, 1> kApplicableTypes = {TypeId::DataFrame};

    std::string path;
    int64_t table_index = 0;
    std::optional<std::string> match;
    std::vector<std::string> na_values = codec::kDefaultHtmlNaValues;

    static std::expected<HtmlLoad, std::string> FromOptions(const OptionMap& options,
                                                            const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap LoadingOptions() const;
    std::expected<Decoded, std::string> Decode(const OptionMap& options) const;
};

/// HTML table writer configuration.
struct HtmlSave {
    static constexpr std::string_view kFormat = "html";
    static constexpr std::array<TypeId, 1> kApplicableTypes = {TypeId::DataFrame};

    std::string path;
    int64_t border = 1;
    bool header = true;
    std::string na_rep = "NaN";
    std::optional<std::string> table_id;
    std::optional<std::vector<std::string>> classes;

    static std::expected<HtmlSave, std::string> FromOptions(const OptionMap& options,
                                                            const ExternalHandles& handles);
    std::expected<void, std::string> Validate() const;
    OptionMap SavingOptions() const;
    std::expected<TransportInfo, std::string> Encode(const DataFrame& frame,
                                                     const OptionMap& options) const;
};

using HtmlReader = Reader<HtmlLoad>;
using HtmlWriter = Writer<HtmlSave>;

}  // namespace dataport
