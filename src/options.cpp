// SPDX-License-Identifier: MIT

#include "dataport/options.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace dataport {

std::string_view OptionTypeName(const OptionValue& value) {
    switch (value.index()) {
        case 0: return "bool";
        case 1: return "int";
        case 2: return "float";
        case 3: return "string";
        case 4: return "string list";
    }
    return "unknown";
}

std::expected<void, std::string> OptionReader::Finish() const {
    if (error_) {
        return std::unexpected(*error_);
    }
    std::string unknown;
    for (const auto& [key, value] : options_) {
        if (consumed_.contains(key)) continue;
        if (!unknown.empty()) unknown += ", ";
        unknown += key;
    }
    if (!unknown.empty()) {
        return std::unexpected(fmt::format("unknown option(s): {}", unknown));
    }
    return {};
}

std::expected<OptionMap, std::string> OptionsFromJson(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format("JSON parse error at offset {}: {}",
                                           doc.GetErrorOffset(),
                                           rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        return std::unexpected(std::string("options document must be a JSON object"));
    }

    OptionMap options;
    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        std::string key(it->name.GetString(), it->name.GetStringLength());
        if (options.contains(key)) {
            return std::unexpected(fmt::format("duplicate option '{}'", key));
        }
        const auto& v = it->value;
        if (v.IsBool()) {
            options.emplace(key, v.GetBool());
        } else if (v.IsInt64()) {
            options.emplace(key, v.GetInt64());
        } else if (v.IsNumber()) {
            options.emplace(key, v.GetDouble());
        } else if (v.IsString()) {
            options.emplace(key, std::string(v.GetString(), v.GetStringLength()));
        } else if (v.IsArray()) {
            std::vector<std::string> items;
            for (const auto& item : v.GetArray()) {
                if (!item.IsString()) {
                    return std::unexpected(
                        fmt::format("option '{}': arrays may only contain strings", key));
                }
                items.emplace_back(item.GetString(), item.GetStringLength());
            }
            options.emplace(key, std::move(items));
        } else {
            return std::unexpected(fmt::format("option '{}' has an unsupported JSON type", key));
        }
    }
    return options;
}

}  // namespace dataport
