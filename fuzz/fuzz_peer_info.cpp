// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license
// Fuzz target for PeerInfo JSON validation
// Peer lists are user supplied files and provider records are remote data

#include "dht/peer_info.hpp"
#include "transport/multiaddr.hpp"
#include "util/string_parsing.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

using namespace torlink;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string text(reinterpret_cast<const char *>(data), size);
    nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return 0;
    }

    dht::PeerInfo info;
    std::string error;
    if (dht::PeerInfoFromJson(j, info, &error)) {
        // Accepted records are always dialable
        if (info.id.empty() || info.onion_port == 0) {
            __builtin_trap();
        }
        const size_t len = info.onion_service_id.size();
        if ((len != transport::ONION_V2_ID_LENGTH && len != transport::ONION_V3_ID_LENGTH) ||
            !util::IsBase32Lower(info.onion_service_id)) {
            __builtin_trap();
        }

        dht::PeerInfo again;
        if (!dht::PeerInfoFromJson(dht::PeerInfoToJson(info), again) || again != info) {
            __builtin_trap();
        }
    } else if (error.empty()) {
        __builtin_trap();
    }
    return 0;
}
