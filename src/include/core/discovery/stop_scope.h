#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/discovery/cancellation_controller.h>
#include <memory>

namespace bridgefinder::core {

/*
    Stop signal local to one probe run. It fires when the outer signal fires
    or when the probe's own soft deadline elapses, whichever comes first.

        StopScope scope(executor, stop, std::chrono::seconds(15));
        co_await scanner.Scan(addresses, scope.signal());
        if (scope.expired()) { ... partial result ... }

    Destroying the scope disarms the deadline and detaches from the outer
    signal.
*/
class StopScope {
public:
    StopScope(boost::asio::any_io_executor executor,
              const StopSignal& outer,
              std::chrono::milliseconds deadline);
    ~StopScope();

    StopScope(const StopScope&) = delete;
    StopScope& operator=(const StopScope&) = delete;

    StopSignal signal() const { return controller_->signal(); }

    bool StopRequested() const { return controller_->IsCancelled(); }

    // True once the deadline, not the outer signal, stopped the scope.
    bool expired() const { return *expired_; }

    // Stops the scope from inside the probe, e.g. after an early success.
    void RequestStop() { controller_->CancelAll(); }

private:
    std::shared_ptr<CancellationController> controller_;
    std::shared_ptr<bool> expired_;
    std::shared_ptr<boost::asio::steady_timer> timer_;
    StopCallback link_;
};

} // namespace bridgefinder::core
