/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "vdf_document.h"
#include "vdf_entry.h"
#include "vdf_node.h"

#include <nlohmann/json.hpp>

namespace appinfo::vdf {
struct JsonOptions {
    // Adds dataSize, accessToken and sha to every entry.
    bool include_internal_fields = false;
};

nlohmann::ordered_json node_to_json(const VdfNode& node);
nlohmann::ordered_json map_to_json(const VdfMap& map);
nlohmann::ordered_json entry_to_json(const VdfEntry& entry, const JsonOptions& opt = {});
nlohmann::ordered_json document_to_json(const VdfDocument& doc, const JsonOptions& opt = {});
}  // namespace appinfo::vdf
