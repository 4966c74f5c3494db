/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "vdf/vdf_document.h"

#include "utils/log.h"

#include <algorithm>
#include <cstdio>
#include <string>

namespace appinfo::vdf {
static std::string to_hex_u32(std::uint32_t v) {
    char buf[11];
    std::snprintf(buf, sizeof(buf), "0x%08X", v);
    return std::string(buf);
}

bool is_supported_version(std::uint32_t version) {
    return std::find(kAppInfoVersions.begin(), kAppInfoVersions.end(), version)
           != kAppInfoVersions.end();
}

static VdfHeader read_header(ByteReader& reader) {
    VdfHeader hdr{};
    hdr.sign = reader.read_u32();
    if (hdr.sign != kAppInfoSignature) {
        throw VdfError(
            VdfErrorCode::InvalidSignature, "Invalid VDF file type: " + to_hex_u32(hdr.sign), 0
        );
    }
    hdr.version = reader.read_u32();
    if (!is_supported_version(hdr.version)) {
        throw VdfError(
            VdfErrorCode::InvalidVersion,
            "Invalid VDF version: " + std::to_string(hdr.version), 4
        );
    }
    return hdr;
}

VdfDocument parse_vdf(std::span<const std::uint8_t> bytes, const VdfReadOptions& opt) {
    ByteReader reader(bytes);
    VdfDocument doc{};
    doc.header = read_header(reader);

    while (reader.remaining()) {
        const std::size_t entry_offset = reader.position();
        try {
            auto entry = read_entry(reader, opt);
            if (!entry.has_value()) {
                break;
            }
            doc.entries.push_back(std::move(*entry));
        } catch (const VdfError& e) {
            if (e.code() != VdfErrorCode::EndOfInput) {
                throw;
            }
            if (!opt.tolerate_truncated_tail) {
                throw VdfError(
                    VdfErrorCode::EndOfInput,
                    "Entry #" + std::to_string(doc.entries.size()) + " starting at offset "
                        + std::to_string(entry_offset) + " is truncated: " + e.what(),
                    e.offset()
                );
            }
            APPINFO_LOG_WARN(
                "Discarding truncated entry #%zu at offset %zu (%s)", doc.entries.size(),
                entry_offset, e.what()
            );
            break;
        }
    }
    return doc;
}
}  // namespace appinfo::vdf
