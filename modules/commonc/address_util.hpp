#pragma once

#include <optional>
#include <string>

namespace boost::asio::ip {
class address;
}

namespace sonde {
std::optional<boost::asio::ip::address>
ParseIPAddress(const std::string& addressStr);

/** @brief Strips an optional port from host:port, [v6]:port or [v6].
 *
 * Addresses without a port (including bare IPv6 addresses) are returned as-is.
 */
std::string
SplitHost(const std::string& address);

/// RFC 1123 host name check.
bool
IsValidHostName(const std::string& name);
}
