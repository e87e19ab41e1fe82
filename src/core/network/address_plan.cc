#include <array>
#include <core/network/address_plan.h>
#include <set>
#include <spdlog/spdlog.h>
#include <utility>

namespace net = boost::asio;

namespace bridgefinder::core {

namespace {

// Inclusive ranges of last octets tried first on the local /24.
constexpr std::array<std::pair<int, int>, 5> kLikelyOctets{{
    {1, 10},
    {20, 25},
    {50, 55},
    {100, 105},
    {200, 205},
}};

constexpr unsigned short kMinPrefixLength = 16;

class AddressList {
public:
    explicit AddressList(std::optional<net::ip::address_v4> exclude) {
        if (exclude) {
            seen_.insert(exclude->to_string());
        }
    }

    void Add(std::string address) {
        if (seen_.insert(address).second) {
            addresses_.push_back(std::move(address));
        }
    }

    std::vector<std::string> Take() { return std::move(addresses_); }

private:
    std::set<std::string> seen_;
    std::vector<std::string> addresses_;
};

net::ip::network_v4 localNetwork(net::ip::address_v4 local) {
    return net::ip::make_network_v4(local, 24).canonical();
}

} // namespace

const std::vector<std::string>& CommonBridgeAddresses() {
    static const std::vector<std::string> addresses{
        "192.168.1.2",   "192.168.1.3",   "192.168.1.4",   "192.168.1.5",   "192.168.1.6",
        "192.168.1.7",   "192.168.1.8",   "192.168.1.10",  "192.168.0.2",   "192.168.0.3",
        "192.168.0.4",   "192.168.0.5",   "192.168.0.6",   "192.168.0.7",   "192.168.0.8",
        "192.168.0.10",  "192.168.100.2", "192.168.100.3", "192.168.100.4", "192.168.100.5",
        "192.168.86.2",  "192.168.86.3",  "192.168.86.4",  "192.168.86.5",  "10.0.0.2",
        "10.0.0.3",      "10.0.0.4",      "10.0.0.5",      "10.0.1.2",      "10.0.1.3",
        "172.16.0.2",    "172.16.0.3",    "172.16.1.2",    "172.16.1.3",
    };
    return addresses;
}

std::vector<std::string> HeuristicAddresses(std::optional<net::ip::address_v4> local,
                                            const std::vector<std::string>& extra) {
    AddressList list(local);

    if (local) {
        auto base = localNetwork(*local).network().to_uint();
        for (auto [first, last] : kLikelyOctets) {
            for (int octet = first; octet <= last; ++octet) {
                list.Add(net::ip::address_v4(base | static_cast<uint32_t>(octet)).to_string());
            }
        }
    }

    for (const auto& address : extra) {
        boost::system::error_code ec;
        auto parsed = net::ip::make_address_v4(address, ec);
        if (ec) {
            spdlog::warn("Ignoring invalid address \"{}\"", address);
            continue;
        }
        list.Add(parsed.to_string());
    }

    for (const auto& address : CommonBridgeAddresses()) {
        list.Add(address);
    }

    return list.Take();
}

std::vector<std::string> SubnetHosts(std::optional<net::ip::address_v4> local,
                                     const std::vector<net::ip::network_v4>& subnets) {
    AddressList list(local);

    std::vector<net::ip::network_v4> networks;
    if (local) {
        networks.push_back(localNetwork(*local));
    }
    networks.insert(networks.end(), subnets.begin(), subnets.end());

    for (const auto& network : networks) {
        if (network.prefix_length() < kMinPrefixLength) {
            spdlog::warn("Subnet {} is too large to scan, skipped", network.to_string());
            continue;
        }
        for (const auto& host : network.hosts()) {
            list.Add(host.to_string());
        }
    }

    return list.Take();
}

std::optional<net::ip::network_v4> ParseSubnet(std::string_view cidr) {
    boost::system::error_code ec;
    auto network = net::ip::make_network_v4(cidr, ec);
    if (ec) {
        return std::nullopt;
    }
    return network.canonical();
}

} // namespace bridgefinder::core
