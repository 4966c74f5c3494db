/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "utils/fs_utils.h"
#include "utils/log.h"
#include "vdf/vdf_error.h"
#include "vdf_parser.h"

#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

struct Settings {
    bool full = false;
    bool strict = false;
    bool lenient = false;
    bool to_stdout = false;
    fs::path out_dir = fs::path("output") / "json";
};

static void print_usage() {
    APPINFO_LOG_INFO(
        "Usage:\n" \
        "    appinfo_parser <appinfo.vdf|dir> [--out <dir>] [--stdout] [--full] [--strict] [--lenient] [--debug]\n\n" \
        "Options:\n" \
        "    A directory is searched recursively for .vdf files\n" \
        "    --out <dir>   JSON output directory (default: ./output/json)\n" \
        "    --stdout      prints JSON instead of writing <out>/<name>.json\n" \
        "    --full        adds dataSize, accessToken and sha to every app\n" \
        "    --strict      fails on node types the decoder does not handle\n" \
        "    --lenient     drops a truncated final app instead of failing\n" \
        "    --debug       logs timings and declared-size mismatches\n"
    );
}

static appinfo::vdf::ParserDecodeOptions decode_options(const Settings& settings) {
    appinfo::vdf::ParserDecodeOptions opt{};
    opt.unhandled_tags = settings.strict ? appinfo::vdf::UnhandledTagPolicy::Reject
                                         : appinfo::vdf::UnhandledTagPolicy::Report;
    opt.tolerate_truncated_tail = settings.lenient;
    opt.include_internal_fields = settings.full;
    return opt;
}

// Returns false when the file could not be decoded or written.
static bool process_file(const fs::path& path, const Settings& settings) {
    try {
        const auto res = appinfo::vdf::VdfParser::DecodeVdfFile(path, decode_options(settings));
        if (settings.to_stdout) {
            std::fputs(res.json.dump(2).c_str(), stdout);
            std::fputc('\n', stdout);
            return true;
        }
        const fs::path json_path = appinfo::fs_utils::json_output_path(settings.out_dir, path);
        appinfo::fs_utils::write_json(json_path, res.json, 2);
        APPINFO_LOG_INFO(
            "%s -> %s (%zu apps)", path.string().c_str(), json_path.string().c_str(),
            res.document.entries.size()
        );
        return true;
    } catch (const appinfo::vdf::VdfError& e) {
        APPINFO_LOG_ERROR(
            "%s: %s at offset %zu: %s", path.string().c_str(),
            appinfo::vdf::error_code_name(e.code()), e.offset(), e.what()
        );
    } catch (const std::exception& e) {
        APPINFO_LOG_ERROR("%s: %s", path.string().c_str(), e.what());
    }
    return false;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        APPINFO_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--full") {
            settings.full = true;
        } else if (arg == "--strict") {
            settings.strict = true;
        } else if (arg == "--lenient") {
            settings.lenient = true;
        } else if (arg == "--stdout") {
            settings.to_stdout = true;
        } else if (arg == "--debug") {
            appinfo::log::set_min_level(appinfo::log::Level::Debug);
        } else if (arg == "--out") {
            if (i + 1 >= argc) {
                APPINFO_LOG_ERROR("Missing value for --out");
                return 2;
            }
            settings.out_dir = fs::path(argv[++i]);
        } else {
            APPINFO_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
            return 2;
        }
    }

    if (!fs::exists(input)) {
        APPINFO_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }

    const std::vector<fs::path> inputs = fs::is_directory(input)
                                             ? appinfo::fs_utils::find_appinfo_files(input)
                                             : std::vector<fs::path>{input};
    if (inputs.empty()) {
        APPINFO_LOG_INFO("No .vdf files found under %s", input.string().c_str());
        return 0;
    }

    std::size_t failed = 0;
    for (const auto& p : inputs) {
        if (!process_file(p, settings)) {
            failed++;
        }
    }
    return failed == 0 ? 0 : 3;
}
