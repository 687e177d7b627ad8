#pragma once

/*
 Overlay Address Utilities

 Purpose:
 - Validate and normalize IP address strings
 - Convert between "ip:port" endpoints and the opaque overlay address bytes
   that travel in HELLO and identify a link

 Overlay address layout (18 bytes):
   [16-byte IPv6 address, IPv4 as v4-mapped][u16 port, big-endian]
*/

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace parley {
namespace util {

constexpr size_t OVERLAY_ADDRESS_SIZE = 18;

/**
 * Validate and normalize an IP address string
 *
 * Only numeric addresses are accepted. IPv4-mapped IPv6 addresses are
 * normalized to plain IPv4 so "::ffff:10.0.0.1" and "10.0.0.1" compare equal.
 *
 * Examples:
 *   "192.168.1.1" -> "192.168.1.1"
 *   "::ffff:192.168.1.1" -> "192.168.1.1"
 *   "2001:db8::1" -> "2001:db8::1"
 *   "invalid" -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string &address);

bool IsValidIPAddress(const std::string &address);

/**
 * Encode ip + port as overlay address bytes. nullopt if ip is not numeric.
 */
std::optional<std::vector<uint8_t>> EncodeOverlayAddress(const std::string &ip,
                                                         uint16_t port);

/**
 * Decode overlay address bytes into a normalized ip and port.
 * nullopt unless exactly OVERLAY_ADDRESS_SIZE bytes.
 */
std::optional<std::pair<std::string, uint16_t>>
DecodeOverlayAddress(const std::vector<uint8_t> &bytes);

/**
 * Resolve a user-supplied address: "ip:port", "[v6]:port", or the hex form
 * of overlay address bytes. Hostnames are not resolved.
 */
std::optional<std::pair<std::string, uint16_t>>
ParseOverlayAddress(const std::string &address);

} // namespace util
} // namespace parley
