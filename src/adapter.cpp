// SPDX-License-Identifier: MIT

#include "dataport/adapter.hpp"

#include <filesystem>
#include <system_error>

namespace dataport {

std::string JoinTypes(std::span<const TypeId> types) {
    std::string out;
    for (TypeId type : types) {
        if (!out.empty()) out += ", ";
        out += TypeIdToString(type);
    }
    return out;
}

std::expected<TransportInfo, std::string> StatFile(const std::string& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(fmt::format("cannot stat '{}': {}", path, ec.message()));
    }
    return TransportInfo{FileTransport{path, static_cast<uint64_t>(size)}};
}

}  // namespace dataport
