/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace appinfo::vdf {
enum class VdfErrorCode {
    EndOfInput,
    InvalidSignature,
    InvalidVersion,
    UnsupportedTag,
    NestingTooDeep,
};

const char* error_code_name(VdfErrorCode code);

// Decoder failure. offset is the byte position where the failing read started.
class VdfError : public std::runtime_error {
   public:
    VdfError(VdfErrorCode code, const std::string& what, std::size_t offset)
        : std::runtime_error(what), _code(code), _offset(offset) {}

    VdfErrorCode code() const { return _code; }
    std::size_t offset() const { return _offset; }

   private:
    VdfErrorCode _code;
    std::size_t _offset;
};
}  // namespace appinfo::vdf
