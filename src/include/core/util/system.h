#pragma once

#include <boost/asio/ip/address_v4.hpp>
#include <optional>
#include <string>

namespace bridgefinder::core {

namespace system {

std::string Hostname();

// IPv4 address of the interface that routes to the internet. Nothing is
// sent; a UDP socket is connected only to let the kernel pick the route.
std::optional<boost::asio::ip::address_v4> LocalIpv4Address();

} // namespace system

} // namespace bridgefinder::core
