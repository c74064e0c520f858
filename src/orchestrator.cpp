// SPDX-License-Identifier: MIT

#include "dataport/orchestrator.hpp"

#include "dataport/logging.hpp"

namespace dataport {

namespace {

// Factory errors are raised before the adapter knows which type it serves
Error WithType(Error error, TypeId type) {
    if (error.type.empty()) {
        error.type = std::string(TypeIdToString(type));
    }
    return error;
}

}  // namespace

Result<LoadResult> LoadData(const AdapterRegistry& registry, std::string_view format,
                            TypeId target, const OptionMap& options,
                            const ExternalHandles& handles) {
    auto kind = registry.ResolveLoader(format, target);
    if (!kind) {
        Logger()->warn("{}", ToString(kind.error()));
        return std::unexpected(std::move(kind.error()));
    }
    auto loader = (*kind)->create(options, handles);
    if (!loader) {
        auto error = WithType(std::move(loader.error()), target);
        Logger()->warn("{}", ToString(error));
        return std::unexpected(std::move(error));
    }
    return LoadData(**loader, target);
}

Result<ResultMetadata> SaveData(const AdapterRegistry& registry, std::string_view format,
                                const Dataset& data, const OptionMap& options,
                                const ExternalHandles& handles) {
    auto kind = registry.ResolveSaver(format, TypeOf(data));
    if (!kind) {
        Logger()->warn("{}", ToString(kind.error()));
        return std::unexpected(std::move(kind.error()));
    }
    auto saver = (*kind)->create(options, handles);
    if (!saver) {
        auto error = WithType(std::move(saver.error()), TypeOf(data));
        Logger()->warn("{}", ToString(error));
        return std::unexpected(std::move(error));
    }
    return SaveData(**saver, data);
}

Result<LoadResult> LoadData(const DataLoader& loader, TypeId target) {
    Logger()->debug("loading {} as {}", loader.format(), TypeIdToString(target));
    auto result = loader.Load(target);
    if (!result) {
        Logger()->warn("{}", ToString(result.error()));
        return result;
    }
    Logger()->debug("loaded {} rows x {} columns from {}",
                    result->metadata.dataframe_metadata.rows,
                    result->metadata.dataframe_metadata.column_names.size(), loader.format());
    return result;
}

Result<ResultMetadata> SaveData(const DataSaver& saver, const Dataset& data) {
    Logger()->debug("saving {} as {}", TypeIdToString(TypeOf(data)), saver.format());
    auto result = saver.Save(data);
    if (!result) {
        Logger()->warn("{}", ToString(result.error()));
        return result;
    }
    Logger()->debug("saved {} rows x {} columns to {}", result->dataframe_metadata.rows,
                    result->dataframe_metadata.column_names.size(), saver.format());
    return result;
}

}  // namespace dataport
