// SPDX-License-Identifier: MIT

#include "dataport/column_type.hpp"

#include <cctype>
#include <charconv>

#include <fmt/format.h>

namespace dataport {

namespace {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::optional<DType> DTypeOf(const Value& value) {
    switch (value.index()) {
        case 1: return DType::Int64;
        case 2: return DType::Float64;
        case 3: return DType::Bool;
        case 4: return DType::String;
        default: return std::nullopt;
    }
}

bool Matches(const Value& value, DType dtype) {
    auto actual = DTypeOf(value);
    return !actual || *actual == dtype;
}

std::string ValueToString(const Value& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return fmt::format("{}", *i);
    if (const auto* d = std::get_if<double>(&value)) return fmt::format("{}", *d);
    if (const auto* b = std::get_if<bool>(&value)) return *b ? "true" : "false";
    if (const auto* s = std::get_if<std::string>(&value)) return *s;
    return "";
}

Value ParseScalar(std::string_view text) {
    if (text.empty()) return std::monostate{};

    if (EqualsIgnoreCase(text, "true")) return true;
    if (EqualsIgnoreCase(text, "false")) return false;

    // Only numeric-looking text is handed to from_chars so that "nan" and
    // "inf" stay strings.
    char first = text.front();
    bool numeric = std::isdigit(static_cast<unsigned char>(first)) ||
                   first == '-' || first == '+' || first == '.';
    if (!numeric) return std::string(text);

    const char* begin = text.data();
    const char* end = text.data() + text.size();
    if (first == '+') ++begin;

    int64_t i = 0;
    auto [iptr, iec] = std::from_chars(begin, end, i);
    if (iec == std::errc{} && iptr == end) return i;

    double d = 0.0;
    auto [dptr, dec] = std::from_chars(begin, end, d);
    if (dec == std::errc{} && dptr == end) return d;

    return std::string(text);
}

}  // namespace dataport
