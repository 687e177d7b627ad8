#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line and console input
 - Hex encoding of public keys and transport addresses

 All parsers validate that the entire input is consumed and return
 std::nullopt on any error; none of them throw.
*/

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace parley {
namespace util {

/**
 * Parse port number string (1-65535)
 */
std::optional<uint16_t> SafeParsePort(const std::string &str);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("42", 0, 100) -> 42
 *   SafeParseInt64("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt64("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max);

/**
 * @return true if str is non-empty and all characters are [0-9a-fA-F]
 */
bool IsValidHex(const std::string &str);

/** Lowercase hex encoding. */
std::string HexStr(const uint8_t *data, size_t len);
std::string HexStr(const std::vector<uint8_t> &data);

/**
 * Decode a hex string
 * @return std::nullopt on odd length or non-hex characters
 */
std::optional<std::vector<uint8_t>> ParseHex(const std::string &str);

/**
 * Split "host:port" or "[v6host]:port"
 *
 * Examples:
 *   SplitHostPort("127.0.0.1:9590") -> {"127.0.0.1", 9590}
 *   SplitHostPort("[::1]:9590") -> {"::1", 9590}
 *   SplitHostPort("localhost") -> std::nullopt
 */
std::optional<std::pair<std::string, uint16_t>>
SplitHostPort(const std::string &str);

/** Trim ASCII whitespace from both ends. */
std::string Trim(const std::string &str);

} // namespace util
} // namespace parley
