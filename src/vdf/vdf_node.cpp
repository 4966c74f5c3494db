/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "vdf/vdf_node.h"

#include "utils/log.h"

#include <string>

namespace appinfo::vdf {
const char* type_name(std::uint8_t tag) {
    switch (static_cast<VdfType>(tag)) {
        case VdfType::Map:
            return "map";
        case VdfType::String:
            return "string";
        case VdfType::Int32:
            return "int32";
        case VdfType::Float32:
            return "float32";
        case VdfType::Pointer:
            return "pointer";
        case VdfType::WideString:
            return "wstring";
        case VdfType::Color:
            return "color";
        case VdfType::Uint64:
            return "uint64";
        case VdfType::End:
            return "end";
    }
    return "unknown";
}

const VdfNode* VdfMap::find(std::string_view name) const {
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        if (it->name == name) {
            return &*it;
        }
    }
    return nullptr;
}

const VdfNode* VdfMap::find_path(std::initializer_list<std::string_view> path) const {
    const VdfMap* cur = this;
    const VdfNode* found = nullptr;
    for (const auto segment : path) {
        if (cur == nullptr) {
            return nullptr;
        }
        found = cur->find(segment);
        if (found == nullptr) {
            return nullptr;
        }
        cur = found->as_map();
    }
    return found;
}

static void check_depth(const ByteReader& reader, const VdfReadOptions& opt, int depth) {
    if (depth > opt.max_depth) {
        throw VdfError(
            VdfErrorCode::NestingTooDeep,
            "Map nesting exceeds " + std::to_string(opt.max_depth) + " levels at offset "
                + std::to_string(reader.position()),
            reader.position()
        );
    }
}

VdfMap read_map_body(ByteReader& reader, const VdfReadOptions& opt, int depth) {
    check_depth(reader, opt, depth);

    VdfMap map{};
    while (true) {
        VdfNode child = read_node(reader, opt, depth);
        if (child.is_terminator()) {
            break;
        }
        map.children.push_back(std::move(child));
    }
    return map;
}

VdfNode read_node(ByteReader& reader, const VdfReadOptions& opt, int depth) {
    const std::size_t node_offset = reader.position();
    VdfNode node{};
    node.tag = reader.read_u8();
    if (node.tag == static_cast<std::uint8_t>(VdfType::End)) {
        node.value = VdfTerminator{};
        return node;
    }

    node.name = reader.read_cstring();

    switch (static_cast<VdfType>(node.tag)) {
        case VdfType::Map:
            node.value = read_map_body(reader, opt, depth + 1);
            break;
        case VdfType::String:
            node.value = reader.read_cstring();
            break;
        case VdfType::Int32:
            node.value = static_cast<std::int32_t>(reader.read_u32());
            break;
        default:
            if (opt.unhandled_tags == UnhandledTagPolicy::Reject) {
                throw VdfError(
                    VdfErrorCode::UnsupportedTag,
                    std::string("Unsupported node type ") + type_name(node.tag) + " ("
                        + std::to_string(node.tag) + ") for key '" + node.name + "' at offset "
                        + std::to_string(node_offset),
                    node_offset
                );
            }
            APPINFO_LOG_WARN(
                "Unhandled node type %s (%u) for key '%s' at offset %zu; value bytes not consumed",
                type_name(node.tag), static_cast<unsigned>(node.tag), node.name.c_str(),
                node_offset
            );
            node.value = VdfUnhandled{node.tag};
            break;
    }
    return node;
}
}  // namespace appinfo::vdf
