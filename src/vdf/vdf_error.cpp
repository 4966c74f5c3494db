/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "vdf/vdf_error.h"

namespace appinfo::vdf {
const char* error_code_name(VdfErrorCode code) {
    switch (code) {
        case VdfErrorCode::EndOfInput:
            return "EndOfInput";
        case VdfErrorCode::InvalidSignature:
            return "InvalidSignature";
        case VdfErrorCode::InvalidVersion:
            return "InvalidVersion";
        case VdfErrorCode::UnsupportedTag:
            return "UnsupportedTag";
        case VdfErrorCode::NestingTooDeep:
            return "NestingTooDeep";
    }
    return "Unknown";
}
}  // namespace appinfo::vdf
