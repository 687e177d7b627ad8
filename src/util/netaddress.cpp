#include "util/netaddress.hpp"
#include "util/endian.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <boost/asio/ip/address.hpp>
#include <cstring>

namespace parley {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string &address) {
  if (address.empty()) {
    return std::nullopt;
  }

  try {
    boost::system::error_code ec;
    auto ip = boost::asio::ip::make_address(address, ec);
    if (ec) {
      return std::nullopt;
    }

    // ::ffff:192.168.1.1 -> 192.168.1.1
    if (ip.is_v6() && ip.to_v6().is_v4_mapped()) {
      auto v4 = boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped,
                                                 ip.to_v6());
      return v4.to_string();
    }
    return ip.to_string();

  } catch (const std::exception &e) {
    LOG_TRACE("ValidateAndNormalizeIP: exception parsing address '{}': {}",
              address, e.what());
    return std::nullopt;
  }
}

bool IsValidIPAddress(const std::string &address) {
  return ValidateAndNormalizeIP(address).has_value();
}

std::optional<std::vector<uint8_t>> EncodeOverlayAddress(const std::string &ip,
                                                         uint16_t port) {
  boost::system::error_code ec;
  auto addr = boost::asio::ip::make_address(ip, ec);
  if (ec) {
    return std::nullopt;
  }

  boost::asio::ip::address_v6 v6 =
      addr.is_v4() ? boost::asio::ip::make_address_v6(
                         boost::asio::ip::v4_mapped, addr.to_v4())
                   : addr.to_v6();
  auto raw = v6.to_bytes();

  std::vector<uint8_t> out(OVERLAY_ADDRESS_SIZE);
  std::memcpy(out.data(), raw.data(), raw.size());
  WriteBE16(out.data() + 16, port);
  return out;
}

std::optional<std::pair<std::string, uint16_t>>
DecodeOverlayAddress(const std::vector<uint8_t> &bytes) {
  if (bytes.size() != OVERLAY_ADDRESS_SIZE) {
    return std::nullopt;
  }
  boost::asio::ip::address_v6::bytes_type raw;
  std::memcpy(raw.data(), bytes.data(), raw.size());
  boost::asio::ip::address_v6 v6(raw);

  auto ip = ValidateAndNormalizeIP(v6.to_string());
  if (!ip) {
    return std::nullopt;
  }
  return std::make_pair(*ip, ReadBE16(bytes.data() + 16));
}

std::optional<std::pair<std::string, uint16_t>>
ParseOverlayAddress(const std::string &address) {
  if (address.size() == OVERLAY_ADDRESS_SIZE * 2 && IsValidHex(address)) {
    auto bytes = ParseHex(address);
    if (bytes) {
      return DecodeOverlayAddress(*bytes);
    }
    return std::nullopt;
  }

  auto split = SplitHostPort(address);
  if (!split) {
    return std::nullopt;
  }
  auto ip = ValidateAndNormalizeIP(split->first);
  if (!ip) {
    return std::nullopt;
  }
  return std::make_pair(*ip, split->second);
}

} // namespace util
} // namespace parley
