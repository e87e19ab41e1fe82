#include <boost/asio/this_coro.hpp>
#include <core/discovery/probe/heuristic_probe.h>
#include <core/discovery/stop_scope.h>
#include <core/network/address_scanner.h>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace bridgefinder::core {

HeuristicProbe::HeuristicProbe(HeuristicOptions options,
                               ValidationOptions validation,
                               LocalAddressProvider local_address)
    : options_(std::move(options))
    , validator_(std::move(validation))
    , local_address_(std::move(local_address)) {}

net::awaitable<std::vector<CandidateRecord>> HeuristicProbe::Run(StopSignal stop) {
    auto local = local_address_ ? local_address_() : std::nullopt;
    auto addresses = HeuristicAddresses(local, options_.addresses);
    spdlog::debug("Heuristic probe: {} addresses (local address {})",
                  addresses.size(),
                  local ? local->to_string() : "unknown");

    auto executor = co_await net::this_coro::executor;
    StopScope scope(executor, stop, options_.deadline);
    AddressScanner scanner(validator_, options_.concurrency);

    auto found = co_await scanner.Scan(std::move(addresses), scope.signal());
    if (scope.expired()) {
        spdlog::info("Heuristic probe reached its deadline with {} bridge(s)", found.size());
    }
    co_return found;
}

} // namespace bridgefinder::core
