// SPDX-License-Identifier: MIT

// include/dataport/error.hpp
#pragma once

#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace dataport {

/// Error codes for adapter construction, dispatch and I/O.
enum class ErrorCode {
    // Configuration
    ConfigurationError,    ///< Adapter field missing or invalid for its format

    // Type
    TypeMismatch,          ///< Requested/supplied type not in the adapter's applicable types

    // Registry
    NoAdapterFound,        ///< No adapter registered for (format, type)
    AmbiguousAdapter,      ///< A second adapter claimed an already registered (format, type)

    // Codec
    CodecError,            ///< Underlying encode/decode call failed
};

/// The kind of call an error originated from.
enum class Operation {
    Load,
    Save,
    Register,
    Resolve,
};

/// Error payload returned by every fallible adapter and registry call.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    std::string format = {};       ///< Format identifier involved (e.g. "csv")
    std::string type = {};         ///< In-memory type involved, empty if not applicable
    Operation operation = Operation::Load;  ///< Call that failed
};

template <typename T>
using Result = std::expected<T, Error>;

/// Return a short category string for an error code (e.g. "codec").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::ConfigurationError:
            return "configuration";
        case ErrorCode::TypeMismatch:
            return "type";
        case ErrorCode::NoAdapterFound:
        case ErrorCode::AmbiguousAdapter:
            return "registry";
        case ErrorCode::CodecError:
            return "codec";
    }
    return "unknown";
}

constexpr std::string_view OperationToString(Operation op) {
    switch (op) {
        case Operation::Load: return "load";
        case Operation::Save: return "save";
        case Operation::Register: return "register";
        case Operation::Resolve: return "resolve";
    }
    return "";  // Unreachable
}

/// Render an error as a single diagnostic line, e.g.
/// `codec error: csv load (DataFrame): No such file`.
std::string ToString(const Error& error);

/// Exception carrying an Error, thrown by adapter constructors and by
/// start-up registration of built-in adapters.
class AdapterException : public std::runtime_error {
public:
    explicit AdapterException(Error error)
        : std::runtime_error(ToString(error)), error_(std::move(error)) {}

    const Error& error() const noexcept { return error_; }

private:
    Error error_;
};

}  // namespace dataport
