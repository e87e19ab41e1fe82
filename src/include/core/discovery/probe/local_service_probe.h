#pragma once

#include <chrono>
#include <core/discovery/discovery_probe.h>
#include <core/discovery/probe/local_bridge_collector.h>
#include <core/network/bridge_validator.h>
#include <memory>
#include <optional>
#include <string>

namespace bridgefinder::core {

struct LocalServiceOptions {
    bool mdns = true;
    bool ssdp = true;
    std::chrono::milliseconds window{5000}; // how long to listen for replies
    std::chrono::milliseconds settle{500};  // kept listening after the first bridge
};

/*
    Asks the LAN directly: an mDNS browse for _hue._tcp.local and an SSDP
    M-SEARCH, sent together. Replies are collected until the listening window
    closes, or until `settle` after the first bridge showed up.

    SSDP replies that look like a bridge but carry no hue-bridgeid header are
    confirmed with the BridgeValidator before they count.
*/
class LocalServiceProbe : public DiscoveryProbe {
public:
    LocalServiceProbe(LocalServiceOptions options, ValidationOptions validation);

    std::string_view name() const override { return "local"; }

    boost::asio::awaitable<std::vector<CandidateRecord>> Run(StopSignal stop) override;

private:
    static boost::asio::awaitable<void> browseMdns(std::shared_ptr<LocalBridgeCollector> collector);
    static boost::asio::awaitable<void> searchSsdp(std::shared_ptr<LocalBridgeCollector> collector);

    LocalServiceOptions options_;
    BridgeValidator validator_;
};

} // namespace bridgefinder::core
