// SPDX-License-Identifier: MIT

#include "dataport/codec/native_codec.hpp"

#include <zstd.h>

#include <cstring>
#include <fstream>
#include <iterator>
#include <memory>
#include <vector>

#include <fmt/format.h>

#include "dataport/codec/byte_buffer.hpp"

namespace dataport::codec {

namespace {

// "DPFRAME\0"
constexpr std::byte kMagic[] = {
    std::byte{'D'}, std::byte{'P'}, std::byte{'F'}, std::byte{'R'},
    std::byte{'A'}, std::byte{'M'}, std::byte{'E'}, std::byte{0x00}};

// Refuse to allocate more than this for one decompressed frame
constexpr unsigned long long kMaxDecodedSize = 4ULL * 1024 * 1024 * 1024;  // 4GB

constexpr uint8_t kNullCell = 0;
constexpr uint8_t kValueCell = 1;

struct CCtxDeleter {
    void operator()(ZSTD_CCtx* ctx) const { ZSTD_freeCCtx(ctx); }
};

void EncodeCell(const Value& value, DType dtype, ByteBuffer& buf) {
    if (IsNull(value)) {
        buf.put_u8(kNullCell);
        return;
    }
    buf.put_u8(kValueCell);
    switch (dtype) {
        case DType::Int64: buf.put_i64_be(std::get<int64_t>(value)); break;
        case DType::Float64: buf.put_f64_be(std::get<double>(value)); break;
        case DType::Bool: buf.put_u8(std::get<bool>(value) ? 1 : 0); break;
        case DType::String: buf.put_string(std::get<std::string>(value)); break;
    }
}

std::expected<Value, std::string> DecodeCell(DType dtype, ByteReader& in) {
    auto tag = in.get_u8();
    if (!tag) return std::unexpected(tag.error());
    if (*tag == kNullCell) return Value{};
    if (*tag != kValueCell) {
        return std::unexpected(fmt::format("invalid cell tag {}", *tag));
    }
    switch (dtype) {
        case DType::Int64: {
            auto v = in.get_i64_be();
            if (!v) return std::unexpected(v.error());
            return Value{*v};
        }
        case DType::Float64: {
            auto v = in.get_f64_be();
            if (!v) return std::unexpected(v.error());
            return Value{*v};
        }
        case DType::Bool: {
            auto v = in.get_u8();
            if (!v) return std::unexpected(v.error());
            return Value{*v != 0};
        }
        case DType::String: {
            auto v = in.get_string();
            if (!v) return std::unexpected(v.error());
            return Value{std::move(*v)};
        }
    }
    return std::unexpected(std::string("unreachable dtype"));
}

std::expected<std::vector<char>, std::string> ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(fmt::format("cannot open '{}' for reading", path));
    }
    std::vector<char> bytes((std::istreambuf_iterator<char>(file)),
                            std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::unexpected(fmt::format("error reading '{}'", path));
    }
    return bytes;
}

}  // namespace

std::expected<DataFrame, std::string> ReadNative(const std::string& path,
                                                 const OptionMap& options) {
    OptionReader opts(options);
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    auto compressed = ReadFile(path);
    if (!compressed) return std::unexpected(compressed.error());

    unsigned long long content_size =
        ZSTD_getFrameContentSize(compressed->data(), compressed->size());
    if (content_size == ZSTD_CONTENTSIZE_ERROR) {
        return std::unexpected(fmt::format("'{}' is not a zstd frame", path));
    }
    if (content_size == ZSTD_CONTENTSIZE_UNKNOWN || content_size > kMaxDecodedSize) {
        return std::unexpected(fmt::format("'{}' has an unknown or oversized content size", path));
    }

    std::vector<std::byte> payload(static_cast<size_t>(content_size));
    size_t decoded = ZSTD_decompress(payload.data(), payload.size(),
                                     compressed->data(), compressed->size());
    if (ZSTD_isError(decoded)) {
        return std::unexpected(fmt::format("zstd decompression failed: {}",
                                           ZSTD_getErrorName(decoded)));
    }
    payload.resize(decoded);

    ByteReader in(payload);
    auto magic = in.get_bytes(sizeof(kMagic));
    if (!magic || std::memcmp(magic->data(), kMagic, sizeof(kMagic)) != 0) {
        return std::unexpected(fmt::format("'{}' is not a native frame file", path));
    }
    auto version = in.get_u8();
    if (!version) return std::unexpected(version.error());
    if (*version != kNativeVersion) {
        return std::unexpected(fmt::format("unsupported native frame version {} (expected {})",
                                           *version, kNativeVersion));
    }

    auto column_count = in.get_u32_be();
    if (!column_count) return std::unexpected(column_count.error());
    auto row_count = in.get_u64_be();
    if (!row_count) return std::unexpected(row_count.error());

    std::vector<Column> columns;
    for (uint32_t c = 0; c < *column_count; ++c) {
        auto name = in.get_string();
        if (!name) return std::unexpected(name.error());
        auto dtype = in.get_u8();
        if (!dtype) return std::unexpected(dtype.error());
        if (*dtype > static_cast<uint8_t>(DType::String)) {
            return std::unexpected(fmt::format("column '{}' has invalid dtype {}", *name, *dtype));
        }
        columns.push_back(Column{std::move(*name), static_cast<DType>(*dtype), {}});
    }

    for (auto& col : columns) {
        // Each cell takes at least one byte, which bounds a corrupt row count
        if (*row_count > in.remaining()) {
            return std::unexpected(fmt::format("truncated data for column '{}'", col.name));
        }
        col.values.reserve(static_cast<size_t>(*row_count));
        for (uint64_t r = 0; r < *row_count; ++r) {
            auto cell = DecodeCell(col.dtype, in);
            if (!cell) {
                return std::unexpected(fmt::format("column '{}' row {}: {}", col.name, r,
                                                   cell.error()));
            }
            col.values.push_back(std::move(*cell));
        }
    }
    if (in.remaining() != 0) {
        return std::unexpected(fmt::format("{} trailing bytes after frame data", in.remaining()));
    }

    return DataFrame::FromColumns(std::move(columns));
}

std::expected<void, std::string> WriteNative(const DataFrame& frame, const std::string& path,
                                             const OptionMap& options) {
    OptionReader opts(options);
    auto level = opts.GetOr<int64_t>("compression_level", 3);
    auto checksum = opts.GetOr<bool>("checksum", false);
    if (auto ok = opts.Finish(); !ok) return std::unexpected(ok.error());

    ByteBuffer buf;
    buf.put_bytes(kMagic);
    buf.put_u8(kNativeVersion);
    buf.put_u32_be(static_cast<uint32_t>(frame.ColumnCount()));
    buf.put_u64_be(frame.RowCount());
    for (const auto& col : frame.columns()) {
        buf.put_string(col.name);
        buf.put_u8(static_cast<uint8_t>(col.dtype));
    }
    for (const auto& col : frame.columns()) {
        for (const auto& value : col.values) {
            EncodeCell(value, col.dtype, buf);
        }
    }

    std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx(ZSTD_createCCtx());
    if (!cctx) {
        return std::unexpected(std::string("failed to create zstd context"));
    }
    size_t rc = ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel,
                                       static_cast<int>(level));
    if (!ZSTD_isError(rc)) {
        rc = ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_checksumFlag, checksum ? 1 : 0);
    }
    if (ZSTD_isError(rc)) {
        return std::unexpected(fmt::format("zstd parameter rejected: {}", ZSTD_getErrorName(rc)));
    }

    auto src = buf.view();
    std::vector<char> compressed(ZSTD_compressBound(src.size()));
    size_t written = ZSTD_compress2(cctx.get(), compressed.data(), compressed.size(),
                                    src.data(), src.size());
    if (ZSTD_isError(written)) {
        return std::unexpected(fmt::format("zstd compression failed: {}",
                                           ZSTD_getErrorName(written)));
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return std::unexpected(fmt::format("cannot open '{}' for writing", path));
    }
    file.write(compressed.data(), static_cast<std::streamsize>(written));
    file.close();
    if (!file) {
        return std::unexpected(fmt::format("error writing '{}'", path));
    }
    return {};
}

}  // namespace dataport::codec
