/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "vdf_byte_reader.h"
#include "vdf_options.h"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace appinfo::vdf {
// Binary KeyValues node tags.
enum class VdfType : std::uint8_t {
    Map = 0,
    String = 1,
    Int32 = 2,
    Float32 = 3,
    Pointer = 4,
    WideString = 5,
    Color = 6,
    Uint64 = 7,
    End = 8,
};

const char* type_name(std::uint8_t tag);

struct VdfNode;

struct VdfTerminator {};

struct VdfMap {
    std::vector<VdfNode> children;

    // Last child with this name, matching the last-write-wins rule of the JSON view.
    const VdfNode* find(std::string_view name) const;
    const VdfNode* find_path(std::initializer_list<std::string_view> path) const;
};

struct VdfUnhandled {
    std::uint8_t tag = 0;
};

using VdfValue = std::variant<VdfTerminator, VdfMap, std::string, std::int32_t, VdfUnhandled>;

struct VdfNode {
    std::uint8_t tag = static_cast<std::uint8_t>(VdfType::End);
    std::string name;
    VdfValue value;

    bool is_terminator() const { return std::holds_alternative<VdfTerminator>(value); }
    const VdfMap* as_map() const { return std::get_if<VdfMap>(&value); }
    const std::string* as_string() const { return std::get_if<std::string>(&value); }
    const std::int32_t* as_int32() const { return std::get_if<std::int32_t>(&value); }
};

// Reads one node. A terminator tag yields a VdfTerminator node with no name.
VdfNode read_node(ByteReader& reader, const VdfReadOptions& opt, int depth = 0);

// Reads sibling nodes up to and including the terminator. The terminator is not returned.
VdfMap read_map_body(ByteReader& reader, const VdfReadOptions& opt, int depth);
}  // namespace appinfo::vdf
