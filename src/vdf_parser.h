/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "vdf/vdf_document.h"
#include "vdf/vdf_options.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>

namespace appinfo::vdf {

struct ParserDecodeOptions {
    UnhandledTagPolicy unhandled_tags = UnhandledTagPolicy::Report;
    int max_depth = 256;
    bool tolerate_truncated_tail = false;
    bool include_internal_fields = false;
};

struct DecodeResult {
    VdfDocument document{};
    nlohmann::ordered_json json = nlohmann::ordered_json::object();
};

class VdfParser {
   public:
    static DecodeResult
    DecodeVdfFile(const std::filesystem::path& path, const ParserDecodeOptions& opt = {});
    static DecodeResult DecodeVdfBytes(
        std::span<const std::uint8_t> bytes,
        const ParserDecodeOptions& opt = {},
        std::string_view label = {}
    );
};

}  // namespace appinfo::vdf
