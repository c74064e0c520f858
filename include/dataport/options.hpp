// SPDX-License-Identifier: MIT

// include/dataport/options.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace dataport {

/// A single named option forwarded to a codec call.
using OptionValue = std::variant<bool, int64_t, double, std::string, std::vector<std::string>>;

/// Options keyed by name, iterated in key order.
using OptionMap = std::map<std::string, OptionValue, std::less<>>;

/// Name of the type an OptionValue alternative holds (for diagnostics).
std::string_view OptionTypeName(const OptionValue& value);

/// Insert @p value under @p key only when it is set.
template <typename T>
void PutIfSet(OptionMap& options, std::string key, const std::optional<T>& value) {
    if (value) {
        options.insert_or_assign(std::move(key), OptionValue{*value});
    }
}

/// Typed, consuming view over an OptionMap.
///
/// Each getter marks its key as consumed.  The first failure (wrong type,
/// missing required key) is latched and reported by Finish(), which also
/// rejects any key no getter asked for.  This keeps call sites linear:
///
/// @code
///   OptionReader opts(options);
///   auto sep = opts.GetOr<std::string>("sep", ",");
///   auto header = opts.GetOr<bool>("header", true);
///   if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
/// @endcode
class OptionReader {
public:
    explicit OptionReader(const OptionMap& options) : options_(options) {}

    /// @return The value under @p key, std::nullopt if absent or mistyped.
    template <typename T>
    std::optional<T> Get(std::string_view key) {
        auto it = options_.find(key);
        if (it == options_.end()) return std::nullopt;
        consumed_.emplace(it->first);

        if constexpr (std::is_same_v<T, double>) {
            // Integers are accepted where a double is expected
            if (const auto* i = std::get_if<int64_t>(&it->second)) {
                return static_cast<double>(*i);
            }
        }
        if (const auto* v = std::get_if<T>(&it->second)) {
            return *v;
        }
        Fail(fmt::format("option '{}' has type {}, expected {}", key,
                         OptionTypeName(it->second), TypeName<T>()));
        return std::nullopt;
    }

    template <typename T>
    T GetOr(std::string_view key, T fallback) {
        auto value = Get<T>(key);
        return value ? std::move(*value) : std::move(fallback);
    }

    /// Like Get(), but records an error when the key is absent.
    template <typename T>
    T Require(std::string_view key) {
        auto value = Get<T>(key);
        if (!value) {
            if (!options_.contains(key)) {
                Fail(fmt::format("missing required option '{}'", key));
            }
            return T{};
        }
        return std::move(*value);
    }

    /// @return The first recorded error, or an error listing unknown keys.
    std::expected<void, std::string> Finish() const;

private:
    template <typename T>
    static constexpr std::string_view TypeName() {
        if constexpr (std::is_same_v<T, bool>) return "bool";
        else if constexpr (std::is_same_v<T, int64_t>) return "int";
        else if constexpr (std::is_same_v<T, double>) return "float";
        else if constexpr (std::is_same_v<T, std::string>) return "string";
        else return "string list";
    }

    void Fail(std::string message) {
        if (!error_) error_ = std::move(message);
    }

    const OptionMap& options_;
    std::set<std::string, std::less<>> consumed_;
    std::optional<std::string> error_;
};

/// Parse a flat JSON object into an OptionMap.
///
/// Strings, booleans, integers, doubles and arrays of strings are accepted;
/// nested objects and null are rejected.
std::expected<OptionMap, std::string> OptionsFromJson(std::string_view json);

}  // namespace dataport
