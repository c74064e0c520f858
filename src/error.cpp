// SPDX-License-Identifier: MIT

#include "dataport/error.hpp"

#include <fmt/format.h>

namespace dataport {

std::string ToString(const Error& error) {
    std::string out = fmt::format("{} error:", error_category(error.code));
    if (!error.format.empty()) {
        out += fmt::format(" {}", error.format);
    }
    out += fmt::format(" {}", OperationToString(error.operation));
    if (!error.type.empty()) {
        out += fmt::format(" ({})", error.type);
    }
    out += fmt::format(": {}", error.message);
    return out;
}

}  // namespace dataport
