// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license
// Fuzz target for multiaddr text parsing and the onion address codec
// Inputs are untrusted: they arrive in peer lists and provider records

#include "transport/address_codec.hpp"
#include "transport/multiaddr.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

using namespace torlink::transport;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    const std::string text(reinterpret_cast<const char *>(data), size);

    auto addr = Multiaddr::parse(text);
    if (addr) {
        // Printing a parsed address must give text that parses to the same address
        auto reparsed = Multiaddr::parse(addr->to_string());
        if (!reparsed || *reparsed != *addr) {
            __builtin_trap();
        }

        AddressCodec codec;
        OnionEndpoint endpoint;
        TransportState state;
        if (codec.decode(*addr, endpoint, state)) {
            // Anything the codec accepts must survive to_multiaddr
            const bool framed = addr->has_protocol(Protocol::WS);
            OnionEndpoint again;
            if (!codec.decode(codec.to_multiaddr(endpoint.service_id, endpoint.port, framed), again,
                              state) ||
                again != endpoint) {
                __builtin_trap();
            }
            if (endpoint.port == 0) {
                __builtin_trap();
            }
        } else if (state.IsValid()) {
            // Failures always carry a reason
            __builtin_trap();
        }
        if (codec.is_listen_marker(*addr) && codec.decode(*addr, endpoint, state)) {
            __builtin_trap();
        }
    }

    // Display form "<id>.onion:<port>[/ws]"
    AddressCodec codec;
    OnionEndpoint endpoint;
    bool framed = false;
    TransportState state;
    if (codec.decode_host_port(text, endpoint, framed, state)) {
        const std::string encoded = framed ? codec.encode_framed(endpoint.service_id, endpoint.port)
                                           : codec.encode(endpoint);
        OnionEndpoint again;
        bool framed_again = false;
        if (!codec.decode_host_port(encoded, again, framed_again, state) || again != endpoint ||
            framed_again != framed) {
            __builtin_trap();
        }
    }

    Multiaddr::from_endpoint(text);
    return 0;
}
