/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "vdf_parser.h"

#include "utils/fs_utils.h"
#include "utils/log.h"
#include "vdf/vdf_json.h"

#include <chrono>
#include <stdexcept>
#include <string>

namespace appinfo::vdf {

static VdfReadOptions to_read_options(const ParserDecodeOptions& opt) {
    VdfReadOptions out{};
    out.unhandled_tags = opt.unhandled_tags;
    out.max_depth = opt.max_depth;
    out.tolerate_truncated_tail = opt.tolerate_truncated_tail;
    return out;
}

DecodeResult
VdfParser::DecodeVdfFile(const std::filesystem::path& path, const ParserDecodeOptions& opt) {
    const auto bytes = appinfo::fs_utils::read_binary(path);
    if (bytes.empty()) {
        throw std::runtime_error("VDF file is empty: " + path.string());
    }
    return DecodeVdfBytes(bytes, opt, path.filename().string());
}

DecodeResult VdfParser::DecodeVdfBytes(
    std::span<const std::uint8_t> bytes,
    const ParserDecodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    DecodeResult result{};
    result.document = parse_vdf(bytes, to_read_options(opt));
    const auto t1 = std::chrono::steady_clock::now();

    JsonOptions json_opt{};
    json_opt.include_internal_fields = opt.include_internal_fields;
    result.json = document_to_json(result.document, json_opt);
    const auto t2 = std::chrono::steady_clock::now();

    if (appinfo::log::enabled(appinfo::log::Level::Debug)) {
        const auto parse_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        const auto json_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t2 - t1).count();
        APPINFO_LOG_DEBUG(
            "Decode %s: bytes=%zu entries=%zu parse=%lldms json=%lldms",
            std::string(label).c_str(), bytes.size(), result.document.entries.size(),
            static_cast<long long>(parse_ms), static_cast<long long>(json_ms)
        );
    }
    return result;
}

}  // namespace appinfo::vdf
