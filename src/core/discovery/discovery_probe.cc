#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/discovery/discovery_probe.h>

namespace net = boost::asio;

namespace bridgefinder::core {

net::awaitable<bool> SleepFor(std::chrono::milliseconds duration, StopSignal stop) {
    if (stop.StopRequested()) {
        co_return false;
    }
    auto executor = co_await net::this_coro::executor;
    net::steady_timer timer(executor, duration);
    auto on_stop = stop.OnStop([&timer] { timer.cancel(); });

    boost::system::error_code ec;
    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    co_return !ec && !stop.StopRequested();
}

} // namespace bridgefinder::core
