// Copyright (c) 2025 The Torlink Developers
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Safe parsing of untrusted strings (command line, config files, multiaddr
 text, tor control replies). Every function validates that the whole input
 is consumed and returns std::nullopt / false instead of throwing.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace torlink {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt
 */
std::optional<int> SafeParseInt(const std::string &str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("4001") -> 4001
 *   SafeParsePort("0") -> std::nullopt
 *   SafeParsePort("+80") -> std::nullopt
 */
std::optional<uint16_t> SafeParsePort(const std::string &str);

/**
 * Split "host:port" at the LAST colon
 *
 * The port must satisfy SafeParsePort and the host must be non-empty.
 * Bracketed IPv6 hosts ("[::1]:9050") are unwrapped.
 */
bool SplitHostPort(const std::string &host_port, std::string &out_host,
                   uint16_t &out_port);

/**
 * Check lowercase RFC 4648 base32 alphabet (a-z, 2-7), non-empty
 *
 * Onion service identities are written in this alphabet.
 */
bool IsBase32Lower(const std::string &str);

// Lowercase hex encoding ("\x01\xab" -> "01ab")
std::string HexEncode(const std::string &bytes);

/**
 * Split on a single delimiter; empty fields are kept
 *
 *   SplitString("a,,b", ',') -> {"a", "", "b"}
 */
std::vector<std::string> SplitString(const std::string &str, char delim);

} // namespace util
} // namespace torlink
