#include <core/discovery/stop_scope.h>

namespace net = boost::asio;

namespace bridgefinder::core {

StopScope::StopScope(net::any_io_executor executor,
                     const StopSignal& outer,
                     std::chrono::milliseconds deadline)
    : controller_(CancellationController::Create())
    , expired_(std::make_shared<bool>(false))
    , timer_(std::make_shared<net::steady_timer>(executor, deadline)) {
    timer_->async_wait([controller = controller_, expired = expired_](
                           const boost::system::error_code& ec) {
        if (!ec && !controller->IsCancelled()) {
            *expired = true;
            controller->CancelAll();
        }
    });
    link_ = outer.OnStop([controller = controller_] { controller->CancelAll(); });
}

StopScope::~StopScope() {
    link_.Reset();
    timer_->cancel();
}

} // namespace bridgefinder::core
