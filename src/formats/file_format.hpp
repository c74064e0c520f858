// SPDX-License-Identifier: MIT

// src/formats/file_format.hpp
#pragma once

#include <expected>
#include <string>
#include <utility>

#include "dataport/adapter.hpp"
#include "dataport/options.hpp"

namespace dataport::formats {

/// Decode @p path with @p read and pair the frame with the file's transport info.
template <typename ReadFn>
std::expected<Decoded, std::string> DecodeFile(const std::string& path, const OptionMap& options,
                                               ReadFn read) {
    auto frame = read(path, options);
    if (!frame) return std::unexpected(std::move(frame.error()));
    auto transport = StatFile(path);
    if (!transport) return std::unexpected(std::move(transport.error()));
    return Decoded{std::move(*frame), std::move(*transport)};
}

/// Encode @p frame to @p path with @p write and stat the written file.
template <typename WriteFn>
std::expected<TransportInfo, std::string> EncodeFile(const DataFrame& frame,
                                                     const std::string& path,
                                                     const OptionMap& options, WriteFn write) {
    if (auto ok = write(frame, path, options); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    return StatFile(path);
}

/// Validation shared by every file-backed format.
inline std::expected<void, std::string> RequirePath(const std::string& path) {
    if (path.empty()) {
        return std::unexpected(std::string("path must not be empty"));
    }
    return {};
}

}  // namespace dataport::formats
