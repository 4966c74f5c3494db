/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "log.h"

#include <atomic>
#include <cstdio>

namespace appinfo::log {
namespace {
std::atomic<Level> g_min_level{Level::Info};

const char* prefix(Level level) {
    switch (level) {
        case Level::Debug:
            return "[DEBUG] ";
        case Level::Info:
            return "";
        case Level::Warn:
            return "[WARN] ";
        case Level::Error:
            return "[ERROR] ";
    }
    return "";
}
}  // namespace

void set_min_level(Level level) {
    g_min_level.store(level, std::memory_order_release);
}

bool enabled(Level level) {
    return level >= g_min_level.load(std::memory_order_acquire);
}

void write(Level level, const char* fmt, ...) {
    if (!enabled(level)) {
        return;
    }
    FILE* out = level == Level::Info ? stdout : stderr;
    va_list args;
    va_start(args, fmt);
    std::fputs(prefix(level), out);
    std::vfprintf(out, fmt, args);
    va_end(args);
    std::fputc('\n', out);
    std::fflush(out);
}
}  // namespace appinfo::log
