#include <boost/asio/this_coro.hpp>
#include <core/discovery/probe/brute_force_probe.h>
#include <core/discovery/stop_scope.h>
#include <core/network/address_scanner.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace bridgefinder::core {

BruteForceProbe::BruteForceProbe(BruteForceOptions options,
                                 ValidationOptions validation,
                                 LocalAddressProvider local_address)
    : options_(std::move(options))
    , validator_(std::move(validation))
    , local_address_(std::move(local_address)) {}

net::awaitable<std::vector<CandidateRecord>> BruteForceProbe::Run(StopSignal stop) {
    auto local = local_address_ ? local_address_() : std::nullopt;
    auto addresses = SubnetHosts(local, options_.subnets);
    spdlog::info("Brute force probe: scanning {} addresses", addresses.size());

    auto executor = co_await net::this_coro::executor;
    StopScope scope(executor, stop, options_.deadline);
    AddressScanner scanner(validator_, options_.concurrency);

    auto found = co_await scanner.Scan(std::move(addresses), scope.signal());
    if (scope.expired()) {
        spdlog::info("Brute force probe reached its deadline with {} bridge(s)", found.size());
    }
    co_return found;
}

} // namespace bridgefinder::core
