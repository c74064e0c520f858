// SPDX-License-Identifier: MIT

// include/dataport/codec/byte_buffer.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace dataport::codec {

// Big-endian byte buffer for the native binary layout
class ByteBuffer {
public:
    void put_u8(uint8_t val);
    void put_u32_be(uint32_t val);
    void put_u64_be(uint64_t val);
    void put_i64_be(int64_t val);
    void put_f64_be(double val);
    void put_bytes(std::span<const std::byte> data);
    // Length-prefixed (u32) string
    void put_string(std::string_view s);

    std::span<const std::byte> view() const { return data_; }
    void clear() { data_.clear(); }
    size_t size() const { return data_.size(); }

private:
    std::vector<std::byte> data_;
};

// Bounds-checked reader over bytes produced by ByteBuffer
class ByteReader {
public:
    explicit ByteReader(std::span<const std::byte> data) : data_(data) {}

    std::expected<uint8_t, std::string> get_u8();
    std::expected<uint32_t, std::string> get_u32_be();
    std::expected<uint64_t, std::string> get_u64_be();
    std::expected<int64_t, std::string> get_i64_be();
    std::expected<double, std::string> get_f64_be();
    std::expected<std::string, std::string> get_string();
    std::expected<std::span<const std::byte>, std::string> get_bytes(size_t n);

    size_t remaining() const { return data_.size() - pos_; }

private:
    std::span<const std::byte> data_;
    size_t pos_ = 0;
};

}  // namespace dataport::codec
