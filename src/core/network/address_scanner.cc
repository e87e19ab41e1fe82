#include <utility>
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/address_scanner.h>
#include <memory>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace bridgefinder::core {

namespace {

// Shared by the workers of one scan. All of them run on the caller's
// executor, which is a strand, so no locking.
struct ScanState {
    ScanState(net::any_io_executor executor, std::vector<std::string> list)
        : addresses(std::move(list))
        , done(executor, net::steady_timer::time_point::max()) {}

    std::vector<std::string> addresses;
    std::size_t next = 0;
    std::size_t active = 0;
    std::vector<CandidateRecord> found;
    net::steady_timer done;
};

net::awaitable<void> worker(std::shared_ptr<ScanState> state,
                            const BridgeValidator* validator,
                            StopSignal stop) {
    while (state->next < state->addresses.size() && !stop.StopRequested()) {
        const auto address = state->addresses[state->next++];
        try {
            if (auto record = co_await validator->Validate(address, stop)) {
                state->found.push_back(std::move(*record));
            }
        } catch (const std::exception& e) {
            spdlog::debug("Checking {} failed: {}", address, e.what());
        }
    }

    if (--state->active == 0) {
        state->done.cancel();
    }
}

} // namespace

AddressScanner::AddressScanner(const BridgeValidator& validator, std::size_t concurrency)
    : validator_(validator)
    , concurrency_(std::max<std::size_t>(concurrency, 1)) {}

net::awaitable<std::vector<CandidateRecord>> AddressScanner::Scan(
    std::vector<std::string> addresses, StopSignal stop) const {
    if (addresses.empty() || stop.StopRequested()) {
        co_return std::vector<CandidateRecord>{};
    }

    auto executor = co_await net::this_coro::executor;
    auto state = std::make_shared<ScanState>(executor, std::move(addresses));
    auto workers = std::min(concurrency_, state->addresses.size());

    spdlog::debug("Scanning {} addresses with {} workers",
                  state->addresses.size(),
                  workers);

    state->active = workers;
    for (std::size_t i = 0; i < workers; ++i) {
        net::co_spawn(executor, worker(state, &validator_, stop), net::detached);
    }

    if (state->active > 0) {
        boost::system::error_code ec;
        co_await state->done.async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    co_return std::move(state->found);
}

} // namespace bridgefinder::core
