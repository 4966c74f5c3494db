/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "vdf/vdf_json.h"

#include <type_traits>

namespace appinfo::vdf {
nlohmann::ordered_json node_to_json(const VdfNode& node) {
    return std::visit(
        [](const auto& v) -> nlohmann::ordered_json {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, VdfMap>) {
                return map_to_json(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, std::int32_t>) {
                return v;
            } else {
                // VdfTerminator never reaches here; VdfUnhandled has no decoded value.
                return nullptr;
            }
        },
        node.value
    );
}

nlohmann::ordered_json map_to_json(const VdfMap& map) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (const auto& child : map.children) {
        out[child.name] = node_to_json(child);
    }
    return out;
}

nlohmann::ordered_json entry_to_json(const VdfEntry& entry, const JsonOptions& opt) {
    const auto& hdr = entry.header;
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    out["appId"] = hdr.app_id;
    if (opt.include_internal_fields) {
        out["dataSize"] = hdr.data_size;
    }
    out["infoState"] = hdr.info_state;
    out["lastUpdated"] = hdr.last_updated;
    if (opt.include_internal_fields) {
        out["accessToken"] = hdr.access_token;
        out["sha"] = hdr.sha;
    }
    out["changeNumber"] = hdr.change_number;
    for (const auto& child : entry.root.children) {
        out[child.name] = node_to_json(child);
    }
    return out;
}

nlohmann::ordered_json document_to_json(const VdfDocument& doc, const JsonOptions& opt) {
    nlohmann::ordered_json games = nlohmann::ordered_json::array();
    for (const auto& entry : doc.entries) {
        games.push_back(entry_to_json(entry, opt));
    }

    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    out["sign"] = doc.header.sign;
    out["version"] = doc.header.version;
    out["count"] = doc.entries.size();
    out["games"] = std::move(games);
    return out;
}
}  // namespace appinfo::vdf
