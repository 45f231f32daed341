// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license
// Fuzz target for tor control port reply parsing
// Replies come from the local tor daemon but are parsed without trusting it

#include "tor/control_connection.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

using namespace torlink::tor;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string line(reinterpret_cast<const char *>(data), size);

    auto [type, rest] = SplitTorReplyLine(line);
    if (type.size() + rest.size() > line.size()) {
        __builtin_trap();
    }
    if (type.find(' ') != std::string::npos) {
        __builtin_trap();
    }

    auto mapping = ParseTorReplyMapping(rest);
    for (const auto &[key, value] : mapping) {
        // Keys never contain separators
        if (key.find('=') != std::string::npos || key.find(' ') != std::string::npos) {
            __builtin_trap();
        }
        (void)value;
    }

    // Quoting always produces a value the mapping parser reads back
    const std::string quoted = "K=" + QuoteTorString(line);
    auto back = ParseTorReplyMapping(quoted);
    if (back.size() != 1 || back.count("K") == 0) {
        __builtin_trap();
    }

    auto progress = ParseBootstrapProgress(line);
    if (progress && (*progress < 0 || *progress > 100)) {
        __builtin_trap();
    }
    return 0;
}
