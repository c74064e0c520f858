// SPDX-License-Identifier: MIT

// include/dataport/orchestrator.hpp
#pragma once

#include <string_view>

#include "dataport/adapter.hpp"
#include "dataport/dataset.hpp"
#include "dataport/error.hpp"
#include "dataport/metadata.hpp"
#include "dataport/options.hpp"
#include "dataport/registry.hpp"

namespace dataport {

/// Resolve the reader for (@p format, @p target), build it from @p options
/// and load once.
///
/// Errors from resolution, configuration, type checks and the codec are
/// returned unchanged.  Nothing is retried.
Result<LoadResult> LoadData(const AdapterRegistry& registry, std::string_view format,
                            TypeId target, const OptionMap& options,
                            const ExternalHandles& handles = {});

/// Resolve the writer for @p format and the dataset's own type, build it
/// from @p options and save once.
Result<ResultMetadata> SaveData(const AdapterRegistry& registry, std::string_view format,
                                const Dataset& data, const OptionMap& options,
                                const ExternalHandles& handles = {});

/// Load through an already constructed reader.
Result<LoadResult> LoadData(const DataLoader& loader, TypeId target);

/// Save through an already constructed writer.
Result<ResultMetadata> SaveData(const DataSaver& saver, const Dataset& data);

}  // namespace dataport
