#include "address_util.hpp"

#include <algorithm>
#include <regex>

#include <boost/asio/ip/address.hpp>

#include <sonde/common/log.hpp>

namespace sonde {
std::optional<boost::asio::ip::address>
ParseIPAddress(const std::string& addressStr) {
  boost::system::error_code err;
  auto address = boost::asio::ip::make_address(addressStr, err);
  if(err) {
    sonde_log(SONDE_GENERAL,
              SONDE_DEBUG,
              "Could not parse given IP Address \"{}\"! Error: {}",
              addressStr,
              err.message());
    return std::nullopt;
  }
  return address;
}

std::string
SplitHost(const std::string& address) {
  if(!address.empty() && address.front() == '[') {
    auto end = address.find(']');
    if(end == std::string::npos)
      return address;
    return address.substr(1, end - 1);
  }

  if(std::count(address.begin(), address.end(), ':') != 1)
    return address;

  auto colon = address.find(':');
  std::string port = address.substr(colon + 1);
  if(port.empty() || !std::all_of(port.begin(), port.end(), [](char c) {
       return c >= '0' && c <= '9';
     }))
    return address;
  return address.substr(0, colon);
}

bool
IsValidHostName(const std::string& name) {
  static const std::regex hostNameRegex(
    "^[A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?"
    "(\\.[A-Za-z0-9]([A-Za-z0-9-]{0,61}[A-Za-z0-9])?)*\\.?$");

  if(name.empty() || name.size() > 253)
    return false;
  return std::regex_match(name, hostNameRegex);
}
}
