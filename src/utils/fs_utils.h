/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace appinfo::fs_utils {
bool is_appinfo_file(const std::filesystem::path& path);

// Every *.vdf file below the directory root, sorted.
std::vector<std::filesystem::path> find_appinfo_files(const std::filesystem::path& root);

std::vector<std::uint8_t> read_binary(const std::filesystem::path& path);

// <out_dir>/<input stem>.json
std::filesystem::path json_output_path(
    const std::filesystem::path& out_dir,
    const std::filesystem::path& input
);
void write_json(const std::filesystem::path& path, const nlohmann::ordered_json& json, int indent);
}  // namespace appinfo::fs_utils
