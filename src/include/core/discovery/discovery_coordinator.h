#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <chrono>
#include <core/discovery/discovery_probe.h>
#include <core/model/candidate_record.h>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bridgefinder::core {

enum class FinishReason {
    kProbeSucceeded,
    kExhausted,
    kTimedOut,
    kStopped,
};

std::string_view ToString(FinishReason reason);

// Diagnostics of a finished session. Never an error: an empty result is a
// normal outcome.
struct DiscoveryOutcome {
    std::string session_id;
    FinishReason reason = FinishReason::kExhausted;
    std::string probe; // set for kProbeSucceeded
    std::size_t record_count = 0;
    std::chrono::milliseconds elapsed{0};

    std::string Describe() const;
};

/*
    Runs the probes as a strict waterfall: each probe is awaited fully before
    the next one starts, the first non-empty result ends the search, and an
    overall timeout bounds the whole run. Exactly one of
    {probe success, exhaustion, timeout, Stop()} delivers the result; the
    others are dropped.

    Everything runs on a strand of the io_context passed in. Discover() may be
    called from any thread; the coordinator must outlive the Discover() calls
    it has accepted.
*/
class DiscoveryCoordinator {
public:
    using FinishedCallback =
        std::function<void(const DiscoveryOutcome&, const std::vector<CandidateRecord>&)>;

    static constexpr std::chrono::milliseconds kDefaultTimeout{40000};

    DiscoveryCoordinator(boost::asio::io_context& ioc, ProbeList probes);
    ~DiscoveryCoordinator();

    DiscoveryCoordinator(const DiscoveryCoordinator&) = delete;
    DiscoveryCoordinator& operator=(const DiscoveryCoordinator&) = delete;

    // Empty result, immediately, when a discovery is already running.
    std::future<std::vector<CandidateRecord>> Discover(
        std::chrono::milliseconds timeout = kDefaultTimeout);

    // Same as Discover() with any asio completion token, e.g.
    //     auto bridges = co_await coordinator.AsyncDiscover(t, net::use_awaitable);
    template<typename CompletionToken>
    auto AsyncDiscover(std::chrono::milliseconds timeout, CompletionToken&& token) {
        return boost::asio::co_spawn(strand_,
                                     discover(begin(), timeout),
                                     std::forward<CompletionToken>(token));
    }

    // Ends the running discovery with an empty result. No-op when idle.
    void Stop();

    bool IsRunning() const;

    std::optional<DiscoveryOutcome> LastOutcome() const;

    // Invoked once per session, on the coordinator's strand, by the finisher
    // that won.
    void SetFinishedCallback(FinishedCallback callback);

    const ProbeList& probes() const { return probes_; }

private:
    struct Run;

    std::shared_ptr<Run> begin();

    boost::asio::awaitable<std::vector<CandidateRecord>> discover(
        std::shared_ptr<Run> run, std::chrono::milliseconds timeout);

    static boost::asio::awaitable<void> runWaterfall(std::shared_ptr<Run> run);
    static boost::asio::awaitable<void> watchTimeout(std::shared_ptr<Run> run,
                                                     std::chrono::milliseconds timeout);
    static bool finish(Run& run,
                       std::vector<CandidateRecord> records,
                       FinishReason reason,
                       std::string probe);

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    ProbeList probes_;

    mutable std::mutex mutex_;
    std::shared_ptr<Run> active_;
    std::optional<DiscoveryOutcome> last_outcome_;
    FinishedCallback finished_callback_;
};

} // namespace bridgefinder::core
