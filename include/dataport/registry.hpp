// SPDX-License-Identifier: MIT

// include/dataport/registry.hpp
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "dataport/adapter.hpp"
#include "dataport/dataset.hpp"
#include "dataport/error.hpp"
#include "dataport/options.hpp"

namespace dataport {

using LoaderFactory = std::function<Result<std::unique_ptr<DataLoader>>(
    const OptionMap&, const ExternalHandles&)>;
using SaverFactory = std::function<Result<std::unique_ptr<DataSaver>>(
    const OptionMap&, const ExternalHandles&)>;

/// Registration record for a reader: its format, the types it produces and
/// a factory building a configured instance from loose options.
struct LoaderKind {
    std::string format;
    std::string name;
    std::vector<TypeId> applicable_types;
    LoaderFactory create;
};

/// Registration record for a writer.  See LoaderKind.
struct SaverKind {
    std::string format;
    std::string name;
    std::vector<TypeId> applicable_types;
    SaverFactory create;
};

/// Build the registration record for Reader<F>.
template <LoadFormat F>
LoaderKind MakeLoaderKind(std::string name) {
    return LoaderKind{
        std::string(F::kFormat),
        std::move(name),
        std::vector<TypeId>(F::kApplicableTypes.begin(), F::kApplicableTypes.end()),
        [](const OptionMap& options,
           const ExternalHandles& handles) -> Result<std::unique_ptr<DataLoader>> {
            auto format = F::FromOptions(options, handles);
            if (!format) {
                return std::unexpected(Error{ErrorCode::ConfigurationError,
                                             std::move(format.error()),
                                             std::string(F::kFormat), {}, Operation::Load});
            }
            auto reader = Reader<F>::Create(std::move(*format));
            if (!reader) {
                return std::unexpected(std::move(reader.error()));
            }
            return std::unique_ptr<DataLoader>(std::move(*reader));
        }};
}

/// Build the registration record for Writer<F>.
template <SaveFormat F>
SaverKind MakeSaverKind(std::string name) {
    return SaverKind{
        std::string(F::kFormat),
        std::move(name),
        std::vector<TypeId>(F::kApplicableTypes.begin(), F::kApplicableTypes.end()),
        [](const OptionMap& options,
           const ExternalHandles& handles) -> Result<std::unique_ptr<DataSaver>> {
            auto format = F::FromOptions(options, handles);
            if (!format) {
                return std::unexpected(Error{ErrorCode::ConfigurationError,
                                             std::move(format.error()),
                                             std::string(F::kFormat), {}, Operation::Save});
            }
            auto writer = Writer<F>::Create(std::move(*format));
            if (!writer) {
                return std::unexpected(std::move(writer.error()));
            }
            return std::unique_ptr<DataSaver>(std::move(*writer));
        }};
}

/// Table of adapters keyed by (format, type), one per direction.
///
/// Every (format, type) pair maps to at most one reader and one writer;
/// a registration that would break this is rejected whole, before any of
/// its types are inserted.  Resolution is a single hash lookup.
///
/// **Thread safety:** Register() takes an exclusive lock and resolution a
/// shared lock, so registration completes before any concurrent resolve
/// observes it.  Intended use is populate-once, then read-only.
class AdapterRegistry {
public:
    AdapterRegistry() = default;
    AdapterRegistry(const AdapterRegistry&) = delete;
    AdapterRegistry& operator=(const AdapterRegistry&) = delete;

    /// Add a reader kind under each of its applicable types.
    /// @return ConfigurationError for an empty format, empty or repeated type
    ///         list, or missing factory; AmbiguousAdapter if any
    ///         (format, type) already has a reader.
    Result<void> Register(LoaderKind kind);

    /// Add a writer kind.  Same rules as the reader overload.
    Result<void> Register(SaverKind kind);

    /// @return The unique reader kind for (format, type), or NoAdapterFound.
    Result<std::shared_ptr<const LoaderKind>> ResolveLoader(std::string_view format,
                                                            TypeId type) const;

    /// @return The unique writer kind for (format, type), or NoAdapterFound.
    Result<std::shared_ptr<const SaverKind>> ResolveSaver(std::string_view format,
                                                          TypeId type) const;

    /// Sorted list of formats with at least one adapter for @p op
    /// (Operation::Load or Operation::Save).
    std::vector<std::string> Formats(Operation op) const;

    /// Process-wide registry with the built-in adapters, populated on first use.
    static AdapterRegistry& Default();

private:
    struct Key {
        std::string format;
        TypeId type;

        bool operator==(const Key&) const = default;
    };

    struct KeyHash {
        size_t operator()(const Key& key) const noexcept {
            return std::hash<std::string>{}(key.format) ^
                   (static_cast<size_t>(key.type) * 0x9e3779b97f4a7c15ULL);
        }
    };

    template <typename Kind>
    using Table = std::unordered_map<Key, std::shared_ptr<const Kind>, KeyHash>;

    template <typename Kind>
    static Result<void> Insert(Table<Kind>& table, Kind kind, Operation op);

    template <typename Kind>
    static Result<std::shared_ptr<const Kind>> Lookup(const Table<Kind>& table,
                                                      std::string_view format,
                                                      TypeId type, Operation op);

    mutable std::shared_mutex mutex_;
    Table<LoaderKind> loaders_;
    Table<SaverKind> savers_;
};

/// Register the built-in csv, parquet, json, xml, html, native and sql
/// adapters.
/// @throws AdapterException if any of them is rejected.
void RegisterBuiltinAdapters(AdapterRegistry& registry);

}  // namespace dataport
