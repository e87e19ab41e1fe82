#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/discovery/discovery_probe.h>
#include <core/discovery/probe/local_bridge_collector.h>
#include <exception>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace bridgefinder::core {

std::shared_ptr<LocalBridgeCollector> LocalBridgeCollector::Create(
    net::any_io_executor executor,
    const StopSignal& outer,
    std::chrono::milliseconds window,
    std::chrono::milliseconds settle,
    Confirmer confirmer) {
    return std::shared_ptr<LocalBridgeCollector>(
        new LocalBridgeCollector(std::move(executor), outer, window, settle, std::move(confirmer)));
}

LocalBridgeCollector::LocalBridgeCollector(net::any_io_executor executor,
                                           const StopSignal& outer,
                                           std::chrono::milliseconds window,
                                           std::chrono::milliseconds settle,
                                           Confirmer confirmer)
    : executor_(executor)
    , scope_(executor, outer, window)
    , settle_(settle)
    , confirmer_(std::move(confirmer))
    , done_(executor, net::steady_timer::time_point::max()) {}

void LocalBridgeCollector::Spawn(net::awaitable<void> task) {
    ++active_;
    net::co_spawn(executor_, std::move(task), [self = shared_from_this()](std::exception_ptr e) {
        if (e) {
            try {
                std::rethrow_exception(e);
            } catch (const std::exception& ex) {
                spdlog::warn("Local discovery task failed: {}", ex.what());
            }
        }
        if (--self->active_ == 0) {
            self->done_.cancel();
        }
    });
}

void LocalBridgeCollector::Add(CandidateRecord record, std::string_view via) {
    addresses_.insert(record.address);
    if (!keys_.insert(record.MergeKey()).second) {
        return;
    }
    spdlog::info("Found bridge {} at {} via {}", record.id, record.address, via);
    found_.push_back(std::move(record));
    if (!settling_) {
        settling_ = true;
        Spawn(settle(shared_from_this()));
    }
}

void LocalBridgeCollector::Confirm(const std::string& address) {
    if (!addresses_.insert(address).second) {
        return;
    }
    Spawn(confirm(shared_from_this(), address));
}

net::awaitable<std::vector<CandidateRecord>> LocalBridgeCollector::Wait() {
    if (active_ > 0) {
        boost::system::error_code ec;
        co_await done_.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    co_return Deduplicate(found_);
}

net::awaitable<void> LocalBridgeCollector::confirm(std::shared_ptr<LocalBridgeCollector> self,
                                                   std::string address) {
    auto record = co_await self->confirmer_(address, self->signal());
    if (record) {
        self->Add(std::move(*record), "validation");
    }
}

net::awaitable<void> LocalBridgeCollector::settle(std::shared_ptr<LocalBridgeCollector> self) {
    co_await SleepFor(self->settle_, self->signal());
    self->scope_.RequestStop();
}

} // namespace bridgefinder::core
