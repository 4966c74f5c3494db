/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "vdf_byte_reader.h"
#include "vdf_node.h"
#include "vdf_options.h"

#include <cstdint>
#include <optional>
#include <string>

namespace appinfo::vdf {
struct VdfEntryHeader {
    std::uint32_t app_id = 0;
    // Bytes following this field up to the end of the entry. Not enforced.
    std::uint32_t data_size = 0;
    std::uint32_t info_state = 0;
    std::uint32_t last_updated = 0;
    std::uint64_t access_token = 0;
    std::string sha;  // SHA-1, lowercase hex
    std::uint32_t change_number = 0;
};

struct VdfEntry {
    VdfEntryHeader header{};
    VdfMap root{};
};

// Reads one entry. Returns nullopt for the end-of-table marker: a zero app id that is the
// final word of the buffer.
std::optional<VdfEntry> read_entry(ByteReader& reader, const VdfReadOptions& opt);
}  // namespace appinfo::vdf
