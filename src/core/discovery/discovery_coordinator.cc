#include <boost/asio/detached.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <core/discovery/completion_gate.h>
#include <core/discovery/discovery_coordinator.h>
#include <core/discovery/discovery_session.h>
#include <exception>
#include <spdlog/spdlog.h>

namespace net = boost::asio;

namespace bridgefinder::core {

std::string_view ToString(FinishReason reason) {
    switch (reason) {
    case FinishReason::kProbeSucceeded:
        return "probe succeeded";
    case FinishReason::kExhausted:
        return "exhausted";
    case FinishReason::kTimedOut:
        return "timeout";
    case FinishReason::kStopped:
        return "stopped";
    }
    return "unknown";
}

std::string DiscoveryOutcome::Describe() const {
    if (reason == FinishReason::kProbeSucceeded) {
        return "probe " + probe + " succeeded";
    }
    return std::string(ToString(reason));
}

// Everything one Discover() call shares with the coroutines it spawns.
// Coroutines hold it by shared_ptr, so a probe that is still unwinding after
// the result was delivered never touches the coordinator.
struct DiscoveryCoordinator::Run {
    Run(const net::strand<net::io_context::executor_type>& strand,
        ProbeList probe_list,
        FinishedCallback callback)
        : cancellation(CancellationController::Create())
        , done(strand, net::steady_timer::time_point::max())
        , probes(std::move(probe_list))
        , on_finished(std::move(callback)) {}

    bool IsRunning() {
        std::lock_guard<std::mutex> lock(mutex);
        return session.IsRunning();
    }

    std::mutex mutex; // guards session, gate transitions, records, outcome
    DiscoverySession session;
    CompletionGate gate;
    std::shared_ptr<CancellationController> cancellation;
    net::steady_timer done; // cancelled by the winning finisher
    ProbeList probes;
    std::vector<CandidateRecord> records;
    std::optional<DiscoveryOutcome> outcome;
    FinishedCallback on_finished;
};

DiscoveryCoordinator::DiscoveryCoordinator(net::io_context& ioc, ProbeList probes)
    : strand_(net::make_strand(ioc))
    , probes_(std::move(probes)) {
    spdlog::debug("discovery coordinator created with {} probe(s)", probes_.size());
}

DiscoveryCoordinator::~DiscoveryCoordinator() {
    Stop();
}

std::future<std::vector<CandidateRecord>> DiscoveryCoordinator::Discover(
    std::chrono::milliseconds timeout) {
    return AsyncDiscover(timeout, net::use_future);
}

void DiscoveryCoordinator::Stop() {
    std::shared_ptr<Run> run;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        run = active_;
    }
    if (!run) {
        spdlog::debug("stop requested while idle");
        return;
    }
    spdlog::info("[{}] stop requested", run->session.id());
    net::dispatch(strand_, [run] { finish(*run, {}, FinishReason::kStopped, {}); });
}

bool DiscoveryCoordinator::IsRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_ && active_->IsRunning();
}

std::optional<DiscoveryOutcome> DiscoveryCoordinator::LastOutcome() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_outcome_;
}

void DiscoveryCoordinator::SetFinishedCallback(FinishedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_callback_ = std::move(callback);
}

std::shared_ptr<DiscoveryCoordinator::Run> DiscoveryCoordinator::begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_ && active_->IsRunning()) {
        spdlog::warn("[{}] discovery already in progress, request rejected",
                     active_->session.id());
        return nullptr;
    }
    auto run = std::make_shared<Run>(strand_, probes_, finished_callback_);
    run->session.Start();
    active_ = run;
    return run;
}

net::awaitable<std::vector<CandidateRecord>> DiscoveryCoordinator::discover(
    std::shared_ptr<Run> run, std::chrono::milliseconds timeout) {
    if (!run) {
        co_return std::vector<CandidateRecord>{};
    }
    spdlog::info("[{}] discovery started: {} probe(s), timeout {} ms",
                 run->session.id(),
                 run->probes.size(),
                 timeout.count());

    net::co_spawn(strand_, watchTimeout(run, timeout), net::detached);
    net::co_spawn(strand_, runWaterfall(run), net::detached);

    if (!run->gate.IsCompleted()) {
        boost::system::error_code ec;
        co_await run->done.async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    std::vector<CandidateRecord> records;
    std::optional<DiscoveryOutcome> outcome;
    {
        std::lock_guard<std::mutex> lock(run->mutex);
        records = run->records;
        outcome = run->outcome;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_outcome_ = std::move(outcome);
        if (active_ == run) {
            active_.reset();
        }
    }
    co_return records;
}

net::awaitable<void> DiscoveryCoordinator::runWaterfall(std::shared_ptr<Run> run) {
    const auto& id = run->session.id();

    for (std::size_t i = 0; i < run->probes.size(); ++i) {
        {
            std::lock_guard<std::mutex> lock(run->mutex);
            if (run->gate.IsCompleted()) {
                co_return;
            }
            if (i > 0) {
                run->session.Advance(i);
            }
        }

        const auto& probe = run->probes[i];
        spdlog::info("[{}] probe {}/{}: {}", id, i + 1, run->probes.size(), probe->name());

        std::vector<CandidateRecord> found;
        try {
            found = co_await probe->Run(run->cancellation->signal());
        } catch (const std::exception& e) {
            spdlog::error("[{}] probe {} failed: {}", id, probe->name(), e.what());
        }

        if (!found.empty()) {
            finish(*run, std::move(found), FinishReason::kProbeSucceeded, std::string(probe->name()));
            co_return;
        }
        spdlog::info("[{}] probe {} found nothing", id, probe->name());
    }

    finish(*run, {}, FinishReason::kExhausted, {});
}

net::awaitable<void> DiscoveryCoordinator::watchTimeout(std::shared_ptr<Run> run,
                                                        std::chrono::milliseconds timeout) {
    // The session may have finished before this coroutine got to run; a
    // cancel issued before the wait is armed would be lost.
    if (run->cancellation->IsCancelled()) {
        co_return;
    }
    auto executor = co_await net::this_coro::executor;
    net::steady_timer timer(executor, timeout);
    StopCallback on_cancel(run->cancellation, [&timer] { timer.cancel(); });

    boost::system::error_code ec;
    co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
    if (ec == net::error::operation_aborted) {
        co_return;
    }
    finish(*run, {}, FinishReason::kTimedOut, {});
}

bool DiscoveryCoordinator::finish(Run& run,
                                  std::vector<CandidateRecord> records,
                                  FinishReason reason,
                                  std::string probe) {
    DiscoveryOutcome outcome;
    std::vector<CandidateRecord> delivered;
    {
        std::lock_guard<std::mutex> lock(run.mutex);
        if (!run.gate.TryComplete()) {
            spdlog::debug("[{}] {} arrived after the session finished, dropped",
                          run.session.id(),
                          ToString(reason));
            return false;
        }

        delivered = Deduplicate(std::move(records));
        if (reason == FinishReason::kStopped) {
            run.session.Cancel();
        } else {
            run.session.Complete(delivered);
        }

        outcome.session_id = run.session.id();
        outcome.reason = reason;
        outcome.probe = std::move(probe);
        outcome.record_count = delivered.size();
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            run.session.Elapsed());

        run.records = delivered;
        run.outcome = outcome;
    }

    run.cancellation->CancelAll();
    run.done.cancel();

    spdlog::info("[{}] {}: {} bridge(s) in {} ms",
                 outcome.session_id,
                 outcome.Describe(),
                 outcome.record_count,
                 outcome.elapsed.count());
    for (const auto& record : delivered) {
        spdlog::info("   - {} ({}) at {}",
                     record.display_name.value_or("Unknown"),
                     record.normalized_id,
                     record.address);
    }

    if (run.on_finished) {
        run.on_finished(outcome, delivered);
    }
    return true;
}

} // namespace bridgefinder::core
