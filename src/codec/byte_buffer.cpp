// SPDX-License-Identifier: MIT

#include "dataport/codec/byte_buffer.hpp"

#include <bit>
#include <cstring>

#include <fmt/format.h>

namespace dataport::codec {

void ByteBuffer::put_u8(uint8_t val) {
    data_.push_back(static_cast<std::byte>(val));
}

void ByteBuffer::put_u32_be(uint32_t val) {
    if constexpr (std::endian::native == std::endian::little) {
        val = __builtin_bswap32(val);
    }
    auto* bytes = reinterpret_cast<const std::byte*>(&val);
    data_.insert(data_.end(), bytes, bytes + 4);
}

void ByteBuffer::put_u64_be(uint64_t val) {
    if constexpr (std::endian::native == std::endian::little) {
        val = __builtin_bswap64(val);
    }
    auto* bytes = reinterpret_cast<const std::byte*>(&val);
    data_.insert(data_.end(), bytes, bytes + 8);
}

void ByteBuffer::put_i64_be(int64_t val) {
    put_u64_be(static_cast<uint64_t>(val));
}

void ByteBuffer::put_f64_be(double val) {
    put_u64_be(std::bit_cast<uint64_t>(val));
}

void ByteBuffer::put_bytes(std::span<const std::byte> data) {
    data_.insert(data_.end(), data.begin(), data.end());
}

void ByteBuffer::put_string(std::string_view s) {
    put_u32_be(static_cast<uint32_t>(s.size()));
    put_bytes({reinterpret_cast<const std::byte*>(s.data()), s.size()});
}

std::expected<std::span<const std::byte>, std::string> ByteReader::get_bytes(size_t n) {
    if (n > remaining()) {
        return std::unexpected(fmt::format("truncated input: need {} bytes at offset {}, have {}",
                                           n, pos_, remaining()));
    }
    auto out = data_.subspan(pos_, n);
    pos_ += n;
    return out;
}

std::expected<uint8_t, std::string> ByteReader::get_u8() {
    auto bytes = get_bytes(1);
    if (!bytes) return std::unexpected(bytes.error());
    return static_cast<uint8_t>((*bytes)[0]);
}

std::expected<uint32_t, std::string> ByteReader::get_u32_be() {
    auto bytes = get_bytes(4);
    if (!bytes) return std::unexpected(bytes.error());
    uint32_t val;
    std::memcpy(&val, bytes->data(), 4);
    if constexpr (std::endian::native == std::endian::little) {
        val = __builtin_bswap32(val);
    }
    return val;
}

std::expected<uint64_t, std::string> ByteReader::get_u64_be() {
    auto bytes = get_bytes(8);
    if (!bytes) return std::unexpected(bytes.error());
    uint64_t val;
    std::memcpy(&val, bytes->data(), 8);
    if constexpr (std::endian::native == std::endian::little) {
        val = __builtin_bswap64(val);
    }
    return val;
}

std::expected<int64_t, std::string> ByteReader::get_i64_be() {
    auto val = get_u64_be();
    if (!val) return std::unexpected(val.error());
    return static_cast<int64_t>(*val);
}

std::expected<double, std::string> ByteReader::get_f64_be() {
    auto val = get_u64_be();
    if (!val) return std::unexpected(val.error());
    return std::bit_cast<double>(*val);
}

std::expected<std::string, std::string> ByteReader::get_string() {
    auto len = get_u32_be();
    if (!len) return std::unexpected(len.error());
    auto bytes = get_bytes(*len);
    if (!bytes) return std::unexpected(bytes.error());
    return std::string(reinterpret_cast<const char*>(bytes->data()), bytes->size());
}

}  // namespace dataport::codec
