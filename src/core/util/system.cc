#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/ip/udp.hpp>
#include <core/util/system.h>
#include <spdlog/spdlog.h>

namespace bridgefinder::core {

namespace system {

std::string Hostname() {
    std::string hostname = boost::asio::ip::host_name();
    if (hostname.ends_with(".local")) {
        hostname = hostname.substr(0, hostname.size() - 6);
    } else if (hostname.ends_with(".localdomain")) {
        hostname = hostname.substr(0, hostname.size() - 12);
    } else if (hostname.ends_with(".lan")) {
        hostname = hostname.substr(0, hostname.size() - 4);
    }
    return hostname;
}

std::optional<boost::asio::ip::address_v4> LocalIpv4Address() {
    try {
        namespace net = boost::asio;
        net::io_context io_context;

        net::ip::udp::socket socket(io_context);

        socket.connect(net::ip::udp::endpoint(net::ip::make_address_v4("8.8.8.8"), 53));

        auto local = socket.local_endpoint().address();
        if (!local.is_v4() || local.is_loopback() || local.is_unspecified()) {
            spdlog::warn("No usable local IPv4 address (got {})", local.to_string());
            return std::nullopt;
        }
        return local.to_v4();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to get local IPv4 address: {}", e.what());
        return std::nullopt;
    }
}

} // namespace system

} // namespace bridgefinder::core
