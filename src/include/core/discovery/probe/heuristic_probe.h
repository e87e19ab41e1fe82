#pragma once

#include <chrono>
#include <core/discovery/discovery_probe.h>
#include <core/network/address_plan.h>
#include <core/network/bridge_validator.h>
#include <cstddef>
#include <string>
#include <vector>

namespace bridgefinder::core {

struct HeuristicOptions {
    std::vector<std::string> addresses; // tried after the local shortlist
    std::size_t concurrency = 8;
    std::chrono::milliseconds deadline{15000};
};

// Checks a short list of addresses where bridges usually end up.
class HeuristicProbe : public DiscoveryProbe {
public:
    HeuristicProbe(HeuristicOptions options,
                   ValidationOptions validation,
                   LocalAddressProvider local_address);

    std::string_view name() const override { return "heuristic"; }

    boost::asio::awaitable<std::vector<CandidateRecord>> Run(StopSignal stop) override;

private:
    HeuristicOptions options_;
    BridgeValidator validator_;
    LocalAddressProvider local_address_;
};

} // namespace bridgefinder::core
