/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "vdf_entry.h"
#include "vdf_options.h"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace appinfo::vdf {
// appinfo.vdf magic ("'DV\x07" little-endian).
constexpr std::uint32_t kAppInfoSignature = 0x07564427u;
// The second header word (Steam universe); only the public universe is accepted.
constexpr std::array<std::uint32_t, 1> kAppInfoVersions = {1u};

struct VdfHeader {
    std::uint32_t sign = 0;
    std::uint32_t version = 0;
};

struct VdfDocument {
    VdfHeader header{};
    std::vector<VdfEntry> entries;
};

bool is_supported_version(std::uint32_t version);

// Validates the header and decodes entries until the buffer ends. A trailing zero app id
// is the end-of-table marker. Throws VdfError on any failure; see VdfReadOptions for the
// truncated tail case.
VdfDocument parse_vdf(std::span<const std::uint8_t> bytes, const VdfReadOptions& opt = {});
}  // namespace appinfo::vdf
