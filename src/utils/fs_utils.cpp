/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "fs_utils.h"

#include "log.h"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace appinfo::fs_utils {
bool is_appinfo_file(const fs::path& path) {
    return path.extension() == ".vdf";
}

std::vector<fs::path> find_appinfo_files(const fs::path& root) {
    std::vector<fs::path> out;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    const fs::recursive_directory_iterator end{};
    while (!ec && it != end) {
        if (it->is_regular_file() && is_appinfo_file(it->path())) {
            out.push_back(it->path());
        }
        it.increment(ec);
    }
    if (ec) {
        APPINFO_LOG_WARN("Stopped scanning %s: %s", root.string().c_str(), ec.message().c_str());
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::vector<std::uint8_t> read_binary(const fs::path& path) {
    std::error_code ec;
    const auto size = fs::file_size(path, ec);
    if (ec) {
        throw std::runtime_error("Cannot stat " + path.string() + ": " + ec.message());
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    std::vector<std::uint8_t> bytes(static_cast<std::size_t>(size));
    if (!f.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()))) {
        throw std::runtime_error(
            "Short read on " + path.string() + ": got " + std::to_string(f.gcount()) + " of "
            + std::to_string(bytes.size()) + " bytes"
        );
    }
    return bytes;
}

fs::path json_output_path(const fs::path& out_dir, const fs::path& input) {
    return out_dir / input.stem().concat(".json");
}

void write_json(const fs::path& path, const nlohmann::ordered_json& json, int indent) {
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) {
        throw std::runtime_error("Cannot open " + path.string() + " for writing");
    }
    f << json.dump(indent) << '\n';
    if (!f.flush()) {
        throw std::runtime_error("Failed writing " + path.string());
    }
}
}  // namespace appinfo::fs_utils
