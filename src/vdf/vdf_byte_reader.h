/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "vdf_error.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace appinfo::vdf {
// Forward-only little-endian reader. A read that cannot be satisfied throws
// VdfError{EndOfInput} and leaves the position untouched.
class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data) : _data(data), _pos(0) {}

    std::size_t position() const { return _pos; }
    std::size_t size() const { return _data.size(); }
    std::size_t bytes_left() const { return _data.size() - _pos; }
    bool remaining() const { return _pos < _data.size(); }

    std::uint64_t read_uint(int width_bits) {
        if (width_bits != 8 && width_bits != 32 && width_bits != 64) {
            throw std::invalid_argument(std::string("widthBits must be 8, 32 or 64"));
        }
        const std::size_t byte_count = static_cast<std::size_t>(width_bits / 8);
        require(byte_count);

        std::uint64_t value = 0;
        for (std::size_t i = 0; i < byte_count; i++) {
            value |= static_cast<std::uint64_t>(_data[_pos + i]) << (8 * i);
        }
        _pos += byte_count;
        return value;
    }

    std::uint8_t read_u8() { return static_cast<std::uint8_t>(read_uint(8)); }
    std::uint32_t read_u32() { return static_cast<std::uint32_t>(read_uint(32)); }
    std::uint64_t read_u64() { return read_uint(64); }

    std::string read_cstring() {
        std::size_t end = _pos;
        while (end < _data.size() && _data[end] != 0) {
            end++;
        }
        if (end >= _data.size()) {
            throw VdfError(
                VdfErrorCode::EndOfInput,
                std::string("Unexpected EOF while reading string at offset ")
                    + std::to_string(_pos),
                _pos
            );
        }
        std::string out(reinterpret_cast<const char*>(_data.data() + _pos), end - _pos);
        _pos = end + 1;
        return out;
    }

    std::string read_raw_hex(int width_bits) {
        if (width_bits <= 0 || (width_bits % 8) != 0) {
            throw std::invalid_argument(std::string("widthBits must be a positive multiple of 8"));
        }
        static const char hexdig[] = "0123456789abcdef";
        const std::size_t byte_count = static_cast<std::size_t>(width_bits / 8);
        require(byte_count);

        std::string out;
        out.resize(byte_count * 2);
        for (std::size_t i = 0; i < byte_count; i++) {
            const std::uint8_t b = _data[_pos + i];
            out[i * 2] = hexdig[(b >> 4) & 0xF];
            out[i * 2 + 1] = hexdig[b & 0xF];
        }
        _pos += byte_count;
        return out;
    }

   private:
    void require(std::size_t byte_count) const {
        if (byte_count > bytes_left()) {
            throw VdfError(
                VdfErrorCode::EndOfInput,
                std::string("Unexpected EOF at offset ") + std::to_string(_pos) + ": needed "
                    + std::to_string(byte_count) + " bytes, " + std::to_string(bytes_left())
                    + " left",
                _pos
            );
        }
    }

    std::span<const std::uint8_t> _data;
    std::size_t _pos;
};
}  // namespace appinfo::vdf
