#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace parley {
namespace util {

namespace {

bool StartsWithSpace(const std::string &str) {
  return !str.empty() && std::isspace(static_cast<unsigned char>(str[0]));
}

int HexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

std::optional<uint16_t> SafeParsePort(const std::string &str) {
  auto value = SafeParseInt64(str, 1, 65535);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string &str, int64_t min,
                                      int64_t max) {
  if (str.empty() || StartsWithSpace(str)) {
    return std::nullopt;
  }

  long long value = 0;
  size_t pos = 0;
  try {
    value = std::stoll(str, &pos);
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }

  if (pos != str.size()) {
    return std::nullopt;
  }
  if (value < min || value > max) {
    return std::nullopt;
  }
  return static_cast<int64_t>(value);
}

bool IsValidHex(const std::string &str) {
  if (str.empty()) {
    return false;
  }
  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::string HexStr(const uint8_t *data, size_t len) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(kDigits[data[i] >> 4]);
    out.push_back(kDigits[data[i] & 0x0F]);
  }
  return out;
}

std::string HexStr(const std::vector<uint8_t> &data) {
  return HexStr(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> ParseHex(const std::string &str) {
  if (str.size() % 2 != 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> out;
  out.reserve(str.size() / 2);
  for (size_t i = 0; i < str.size(); i += 2) {
    int hi = HexValue(str[i]);
    int lo = HexValue(str[i + 1]);
    if (hi < 0 || lo < 0) {
      return std::nullopt;
    }
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::optional<std::pair<std::string, uint16_t>>
SplitHostPort(const std::string &str) {
  std::string host;
  std::string port;

  if (!str.empty() && str[0] == '[') {
    auto close = str.find(']');
    if (close == std::string::npos || close + 1 >= str.size() ||
        str[close + 1] != ':') {
      return std::nullopt;
    }
    host = str.substr(1, close - 1);
    port = str.substr(close + 2);
  } else {
    auto colon = str.rfind(':');
    if (colon == std::string::npos || str.find(':') != colon) {
      return std::nullopt;
    }
    host = str.substr(0, colon);
    port = str.substr(colon + 1);
  }

  if (host.empty()) {
    return std::nullopt;
  }
  auto parsed = SafeParsePort(port);
  if (!parsed) {
    return std::nullopt;
  }
  return std::make_pair(host, *parsed);
}

std::string Trim(const std::string &str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(str[begin])))
    ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1])))
    --end;
  return str.substr(begin, end - begin);
}

} // namespace util
} // namespace parley
