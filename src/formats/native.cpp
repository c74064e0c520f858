// SPDX-License-Identifier: MIT

#include "dataport/formats/native.hpp"

#include <fmt/format.h>

#include "dataport/codec/native_codec.hpp"
#include "file_format.hpp"

namespace dataport {

namespace {

constexpr int64_t kMinLevel = 1;
constexpr int64_t kMaxLevel = 19;

}  // namespace

std::expected<NativeLoad, std::string> NativeLoad::FromOptions(const OptionMap& options,
                                                               const ExternalHandles&) {
    OptionReader opts(options);
    NativeLoad cfg;
    cfg.path = opts.Require<std::string>("path");
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> NativeLoad::Validate() const {
    return formats::RequirePath(path);
}

OptionMap NativeLoad::LoadingOptions() const {
    return {};
}

std::expected<Decoded, std::string> NativeLoad::Decode(const OptionMap& options) const {
    return formats::DecodeFile(path, options, codec::ReadNative);
}

std::expected<NativeSave, std::string> NativeSave::FromOptions(const OptionMap& options,
                                                               const ExternalHandles&) {
    OptionReader opts(options);
    NativeSave cfg;
    cfg.path = opts.Require<std::string>("path");
    cfg.compression_level = opts.GetOr<int64_t>("compression_level", cfg.compression_level);
    cfg.checksum = opts.GetOr<bool>("checksum", cfg.checksum);
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());
    return cfg;
}

std::expected<void, std::string> NativeSave::Validate() const {
    if (auto ok = formats::RequirePath(path); !ok) return ok;
    if (compression_level < kMinLevel || compression_level > kMaxLevel) {
        return std::unexpected(fmt::format("compression_level must be in [{}, {}], got {}",
                                           kMinLevel, kMaxLevel, compression_level));
    }
    return {};
}

OptionMap NativeSave::SavingOptions() const {
    return OptionMap{{"compression_level", compression_level}, {"checksum", checksum}};
}

std::expected<TransportInfo, std::string> NativeSave::Encode(const DataFrame& frame,
                                                             const OptionMap& options) const {
    return formats::EncodeFile(frame, path, options, codec::WriteNative);
}

}  // namespace dataport
