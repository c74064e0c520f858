// SPDX-License-Identifier: MIT

// include/dataport/adapter.hpp
#pragma once

#include <concepts>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#include "dataport/data_frame.hpp"
#include "dataport/dataset.hpp"
#include "dataport/error.hpp"
#include "dataport/metadata.hpp"
#include "dataport/options.hpp"

namespace dataport {

class ISqlConnection;

/// Externally owned handles an adapter may be bound to.  Never owned or
/// closed by dataport.
struct ExternalHandles {
    ISqlConnection* sql = nullptr;
};

/// Raw result of one decode call: the frame plus where it came from.
struct Decoded {
    DataFrame frame;
    TransportInfo transport;
};

/// Data and metadata returned by a successful load.
struct LoadResult {
    Dataset data;
    ResultMetadata metadata;
};

/// Per-format configuration for a reader.
///
/// A load format is a plain value object: its fields are the adapter's
/// configuration, LoadingOptions() projects them onto the exact option map
/// forwarded to the codec, and Decode() performs the single codec call.
template <typename F>
concept LoadFormat = requires(const F& f, const OptionMap& options,
                              const ExternalHandles& handles) {
    { F::kFormat } -> std::convertible_to<std::string_view>;
    { F::kApplicableTypes.size() } -> std::convertible_to<std::size_t>;
    { F::FromOptions(options, handles) } -> std::same_as<std::expected<F, std::string>>;
    { f.Validate() } -> std::same_as<std::expected<void, std::string>>;
    { f.LoadingOptions() } -> std::same_as<OptionMap>;
    { f.Decode(options) } -> std::same_as<std::expected<Decoded, std::string>>;
};

/// Per-format configuration for a writer.  See LoadFormat.
template <typename F>
concept SaveFormat = requires(const F& f, const OptionMap& options,
                              const ExternalHandles& handles, const DataFrame& frame) {
    { F::kFormat } -> std::convertible_to<std::string_view>;
    { F::kApplicableTypes.size() } -> std::convertible_to<std::size_t>;
    { F::FromOptions(options, handles) } -> std::same_as<std::expected<F, std::string>>;
    { f.Validate() } -> std::same_as<std::expected<void, std::string>>;
    { f.SavingOptions() } -> std::same_as<OptionMap>;
    { f.Encode(frame, options) } -> std::same_as<std::expected<TransportInfo, std::string>>;
};

/// Type-erased reader, as handed out by the registry.
class DataLoader {
public:
    virtual ~DataLoader() = default;

    virtual std::string_view format() const = 0;
    virtual std::span<const TypeId> types() const = 0;

    /// @return The exact options the codec call will receive.
    virtual OptionMap LoadingOptions() const = 0;

    /// Read the source and materialize it as @p target.
    virtual Result<LoadResult> Load(TypeId target) const = 0;
};

/// Type-erased writer, as handed out by the registry.
class DataSaver {
public:
    virtual ~DataSaver() = default;

    virtual std::string_view format() const = 0;
    virtual std::span<const TypeId> types() const = 0;

    /// @return The exact options the codec call will receive.
    virtual OptionMap SavingOptions() const = 0;

    /// Write @p data with exactly one codec call.
    virtual Result<ResultMetadata> Save(const Dataset& data) const = 0;
};

/// Comma-separated type names, for diagnostics.
std::string JoinTypes(std::span<const TypeId> types);

/// Stat a file written or read by an adapter.
/// @return File transport info, or an error string if the file is missing.
std::expected<TransportInfo, std::string> StatFile(const std::string& path);

/// Reader adapter composed with its format value object.
///
/// Construction validates the configuration and throws AdapterException
/// (ConfigurationError) on failure; Create() reports the same error as a
/// value.  Immutable after construction.
template <LoadFormat F>
class Reader final : public DataLoader {
public:
    static_assert(!F::kApplicableTypes.empty(), "reader must declare at least one type");

    explicit Reader(F format) : format_(std::move(format)) {
        if (auto ok = format_.Validate(); !ok) {
            throw AdapterException(ConfigError(ok.error()));
        }
    }

    static Result<std::unique_ptr<Reader>> Create(F format) {
        if (auto ok = format.Validate(); !ok) {
            return std::unexpected(ConfigError(ok.error()));
        }
        return std::make_unique<Reader>(std::move(format));
    }

    /// Types this reader can materialize.  Needs no instance.
    static std::span<const TypeId> ApplicableTypes() { return F::kApplicableTypes; }

    std::string_view format() const override { return F::kFormat; }
    std::span<const TypeId> types() const override { return ApplicableTypes(); }
    OptionMap LoadingOptions() const override { return format_.LoadingOptions(); }

    const F& config() const { return format_; }

    Result<LoadResult> Load(TypeId target) const override {
        if (!Contains(ApplicableTypes(), target)) {
            return std::unexpected(Error{
                ErrorCode::TypeMismatch,
                fmt::format("{} reader cannot produce {} (applicable: {})", F::kFormat,
                            TypeIdToString(target), JoinTypes(ApplicableTypes())),
                std::string(F::kFormat), std::string(TypeIdToString(target)),
                Operation::Load});
        }

        auto decoded = format_.Decode(format_.LoadingOptions());
        if (!decoded) {
            return std::unexpected(Error{ErrorCode::CodecError, std::move(decoded.error()),
                                         std::string(F::kFormat),
                                         std::string(TypeIdToString(target)),
                                         Operation::Load});
        }

        auto metadata = BuildMetadata(decoded->transport, ShapeOf(decoded->frame));
        return LoadResult{Materialize(std::move(decoded->frame), target), std::move(metadata)};
    }

private:
    static Error ConfigError(std::string message) {
        return Error{ErrorCode::ConfigurationError, std::move(message),
                     std::string(F::kFormat), {}, Operation::Load};
    }

    F format_;
};

/// Writer adapter composed with its format value object.  See Reader.
template <SaveFormat F>
class Writer final : public DataSaver {
public:
    static_assert(!F::kApplicableTypes.empty(), "writer must declare at least one type");

    explicit Writer(F format) : format_(std::move(format)) {
        if (auto ok = format_.Validate(); !ok) {
            throw AdapterException(ConfigError(ok.error()));
        }
    }

    static Result<std::unique_ptr<Writer>> Create(F format) {
        if (auto ok = format.Validate(); !ok) {
            return std::unexpected(ConfigError(ok.error()));
        }
        return std::make_unique<Writer>(std::move(format));
    }

    /// Types this writer accepts.  Needs no instance.
    static std::span<const TypeId> ApplicableTypes() { return F::kApplicableTypes; }

    std::string_view format() const override { return F::kFormat; }
    std::span<const TypeId> types() const override { return ApplicableTypes(); }
    OptionMap SavingOptions() const override { return format_.SavingOptions(); }

    const F& config() const { return format_; }

    Result<ResultMetadata> Save(const Dataset& data) const override {
        TypeId source = TypeOf(data);
        std::string type_name(TypeIdToString(source));
        if (!Contains(ApplicableTypes(), source)) {
            return std::unexpected(Error{
                ErrorCode::TypeMismatch,
                fmt::format("{} writer cannot accept {} (applicable: {})", F::kFormat,
                            type_name, JoinTypes(ApplicableTypes())),
                std::string(F::kFormat), type_name, Operation::Save});
        }

        // Records are converted before any I/O so a bad dataset never
        // produces a partial file.
        const DataFrame* frame = std::get_if<DataFrame>(&data);
        std::optional<DataFrame> converted;
        if (!frame) {
            auto result = FromRecords(std::get<RecordList>(data));
            if (!result) {
                return std::unexpected(Error{ErrorCode::TypeMismatch,
                                             "records do not form a table: " + result.error(),
                                             std::string(F::kFormat), type_name,
                                             Operation::Save});
            }
            converted = std::move(*result);
            frame = &*converted;
        }

        auto transport = format_.Encode(*frame, format_.SavingOptions());
        if (!transport) {
            return std::unexpected(Error{ErrorCode::CodecError, std::move(transport.error()),
                                         std::string(F::kFormat), type_name,
                                         Operation::Save});
        }
        return BuildMetadata(*transport, ShapeOf(*frame));
    }

private:
    static Error ConfigError(std::string message) {
        return Error{ErrorCode::ConfigurationError, std::move(message),
                     std::string(F::kFormat), {}, Operation::Save};
    }

    F format_;
};

}  // namespace dataport
