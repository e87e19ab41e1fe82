#pragma once

#include <boost/asio/ip/network_v4.hpp>
#include <chrono>
#include <core/discovery/discovery_probe.h>
#include <core/network/address_plan.h>
#include <core/network/bridge_validator.h>
#include <cstddef>
#include <vector>

namespace bridgefinder::core {

struct BruteForceOptions {
    std::vector<boost::asio::ip::network_v4> subnets{
        boost::asio::ip::make_network_v4("192.168.0.0/24"),
        boost::asio::ip::make_network_v4("192.168.1.0/24"),
    };
    std::size_t concurrency = 32;
    std::chrono::milliseconds deadline{30000};
};

// Last resort: every host of the local /24 and of the configured subnets.
class BruteForceProbe : public DiscoveryProbe {
public:
    BruteForceProbe(BruteForceOptions options,
                    ValidationOptions validation,
                    LocalAddressProvider local_address);

    std::string_view name() const override { return "bruteforce"; }

    boost::asio::awaitable<std::vector<CandidateRecord>> Run(StopSignal stop) override;

private:
    BruteForceOptions options_;
    BridgeValidator validator_;
    LocalAddressProvider local_address_;
};

} // namespace bridgefinder::core
