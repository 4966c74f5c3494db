/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace appinfo::log {
enum class Level { Debug, Info, Warn, Error };

// Messages below the threshold are dropped. Defaults to Level::Info.
void set_min_level(Level level);
bool enabled(Level level);

// Info goes to stdout; everything else to stderr with a level prefix.
void write(Level level, const char* fmt, ...);
}  // namespace appinfo::log

#define APPINFO_LOG_DEBUG(fmt, ...) \
    ::appinfo::log::write(::appinfo::log::Level::Debug, fmt, ##__VA_ARGS__)
#define APPINFO_LOG_INFO(fmt, ...) \
    ::appinfo::log::write(::appinfo::log::Level::Info, fmt, ##__VA_ARGS__)
#define APPINFO_LOG_WARN(fmt, ...) \
    ::appinfo::log::write(::appinfo::log::Level::Warn, fmt, ##__VA_ARGS__)
#define APPINFO_LOG_ERROR(fmt, ...) \
    ::appinfo::log::write(::appinfo::log::Level::Error, fmt, ##__VA_ARGS__)
