/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "vdf/vdf_entry.h"

#include "utils/log.h"

namespace appinfo::vdf {
std::optional<VdfEntry> read_entry(ByteReader& reader, const VdfReadOptions& opt) {
    VdfEntry entry{};
    auto& hdr = entry.header;
    hdr.app_id = reader.read_u32();
    // A zero app id closes the table only as the last word of the file; anywhere else
    // it is an ordinary entry.
    if (hdr.app_id == 0 && !reader.remaining()) {
        return std::nullopt;
    }

    hdr.data_size = reader.read_u32();
    const std::size_t body_start = reader.position();
    hdr.info_state = reader.read_u32();
    hdr.last_updated = reader.read_u32();
    hdr.access_token = reader.read_u64();
    hdr.sha = reader.read_raw_hex(160);
    hdr.change_number = reader.read_u32();

    // The body is the key/value list of an unnamed root map: in practice one "appinfo" map
    // node followed by the root's own terminator, which read_map_body consumes.
    entry.root = read_map_body(reader, opt, 0);

    const std::size_t consumed = reader.position() - body_start;
    if (consumed != hdr.data_size) {
        APPINFO_LOG_DEBUG(
            "App %u: declared size %u, consumed %zu bytes", hdr.app_id, hdr.data_size, consumed
        );
    }
    return entry;
}
}  // namespace appinfo::vdf
