// SPDX-License-Identifier: MIT

#include "dataport/registry.hpp"

#include <algorithm>
#include <mutex>
#include <set>

#include "dataport/logging.hpp"

namespace dataport {

namespace {

std::string_view DirectionName(Operation op) {
    return op == Operation::Load ? "reader" : "writer";
}

}  // namespace

template <typename Kind>
Result<void> AdapterRegistry::Insert(Table<Kind>& table, Kind kind, Operation op) {
    auto config_error = [&](std::string message) {
        return std::unexpected(Error{ErrorCode::ConfigurationError, std::move(message),
                                     kind.format, {}, Operation::Register});
    };

    if (kind.format.empty()) {
        return config_error(fmt::format("{} '{}' has no format identifier",
                                        DirectionName(op), kind.name));
    }
    if (kind.applicable_types.empty()) {
        return config_error(fmt::format("{} '{}' declares no applicable types",
                                        DirectionName(op), kind.name));
    }
    if (!kind.create) {
        return config_error(fmt::format("{} '{}' has no factory", DirectionName(op), kind.name));
    }

    std::set<TypeId> seen;
    for (TypeId type : kind.applicable_types) {
        if (!seen.insert(type).second) {
            return config_error(fmt::format("{} '{}' lists {} twice", DirectionName(op),
                                            kind.name, TypeIdToString(type)));
        }
        auto it = table.find(Key{kind.format, type});
        if (it != table.end()) {
            return std::unexpected(Error{
                ErrorCode::AmbiguousAdapter,
                fmt::format("{} '{}' and '{}' both handle {} for format '{}'",
                            DirectionName(op), it->second->name, kind.name,
                            TypeIdToString(type), kind.format),
                kind.format, std::string(TypeIdToString(type)), Operation::Register});
        }
    }

    auto shared = std::make_shared<const Kind>(std::move(kind));
    for (TypeId type : shared->applicable_types) {
        table.emplace(Key{shared->format, type}, shared);
    }
    Logger()->debug("registered {} '{}' for format '{}' ({})", DirectionName(op),
                    shared->name, shared->format, JoinTypes(shared->applicable_types));
    return {};
}

template <typename Kind>
Result<std::shared_ptr<const Kind>> AdapterRegistry::Lookup(const Table<Kind>& table,
                                                            std::string_view format,
                                                            TypeId type, Operation op) {
    auto it = table.find(Key{std::string(format), type});
    if (it != table.end()) {
        return it->second;
    }

    // Only the failure path scans, to tell "wrong type" from "unknown format"
    std::vector<TypeId> available;
    for (const auto& [key, kind] : table) {
        if (key.format == format) available.push_back(key.type);
    }
    std::sort(available.begin(), available.end());

    std::string message =
        available.empty()
            ? fmt::format("no {} registered for format '{}'", DirectionName(op), format)
            : fmt::format("no {} for format '{}' handles {} (available: {})",
                          DirectionName(op), format, TypeIdToString(type),
                          JoinTypes(available));
    return std::unexpected(Error{ErrorCode::NoAdapterFound, std::move(message),
                                 std::string(format), std::string(TypeIdToString(type)),
                                 Operation::Resolve});
}

Result<void> AdapterRegistry::Register(LoaderKind kind) {
    std::unique_lock lock(mutex_);
    return Insert(loaders_, std::move(kind), Operation::Load);
}

Result<void> AdapterRegistry::Register(SaverKind kind) {
    std::unique_lock lock(mutex_);
    return Insert(savers_, std::move(kind), Operation::Save);
}

Result<std::shared_ptr<const LoaderKind>> AdapterRegistry::ResolveLoader(
        std::string_view format, TypeId type) const {
    std::shared_lock lock(mutex_);
    return Lookup(loaders_, format, type, Operation::Load);
}

Result<std::shared_ptr<const SaverKind>> AdapterRegistry::ResolveSaver(
        std::string_view format, TypeId type) const {
    std::shared_lock lock(mutex_);
    return Lookup(savers_, format, type, Operation::Save);
}

std::vector<std::string> AdapterRegistry::Formats(Operation op) const {
    std::shared_lock lock(mutex_);
    std::set<std::string> formats;
    if (op == Operation::Load) {
        for (const auto& [key, kind] : loaders_) formats.insert(key.format);
    } else {
        for (const auto& [key, kind] : savers_) formats.insert(key.format);
    }
    return {formats.begin(), formats.end()};
}

AdapterRegistry& AdapterRegistry::Default() {
    static AdapterRegistry registry;
    static std::once_flag once;
    std::call_once(once, [] { RegisterBuiltinAdapters(registry); });
    return registry;
}

}  // namespace dataport
