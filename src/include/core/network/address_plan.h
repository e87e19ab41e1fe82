#pragma once

#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/network_v4.hpp>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bridgefinder::core {

// Source of the host's own IPv4 address; system::LocalIpv4Address in
// production.
using LocalAddressProvider = std::function<std::optional<boost::asio::ip::address_v4>()>;

// Hosts that consumer routers commonly hand out first.
const std::vector<std::string>& CommonBridgeAddresses();

// Ordered, duplicate free shortlist for heuristic probing: likely octets of
// the local /24, then `extra`, then CommonBridgeAddresses(). `local` itself
// is never included.
std::vector<std::string> HeuristicAddresses(std::optional<boost::asio::ip::address_v4> local,
                                            const std::vector<std::string>& extra);

// Every host of the local /24 followed by every host of `subnets`, without
// duplicates and without `local`. Subnets wider than /16 are skipped.
std::vector<std::string> SubnetHosts(std::optional<boost::asio::ip::address_v4> local,
                                     const std::vector<boost::asio::ip::network_v4>& subnets);

// "192.168.1.0/24". Host bits are cleared.
std::optional<boost::asio::ip::network_v4> ParseSubnet(std::string_view cidr);

} // namespace bridgefinder::core
