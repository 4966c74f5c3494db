/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

namespace appinfo::vdf {
// What to do with float32, pointer, wide-string, color and uint64 nodes.
// Their payload layout is not decoded, so no value bytes are consumed for them.
enum class UnhandledTagPolicy {
    Report,  // keep an Unhandled node and log a warning
    Reject,  // throw VdfError{UnsupportedTag}
};

struct VdfReadOptions {
    UnhandledTagPolicy unhandled_tags = UnhandledTagPolicy::Report;
    int max_depth = 256;
    // Discard an entry cut short by the end of the buffer instead of failing.
    bool tolerate_truncated_tail = false;
};
}  // namespace appinfo::vdf
