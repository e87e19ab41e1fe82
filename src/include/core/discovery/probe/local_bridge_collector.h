#pragma once

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/discovery/stop_scope.h>
#include <core/model/candidate_record.h>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace bridgefinder::core {

/*
    Gathers what the local listeners of one LocalServiceProbe run report.

    Listening ends when the window closes, when the outer signal fires, or
    `settle` after the first bridge was added, whichever comes first. Wait()
    returns once every task spawned through the collector has finished.

    Everything is used from the probe's strand.
*/
class LocalBridgeCollector : public std::enable_shared_from_this<LocalBridgeCollector> {
public:
    // Checks an address that answered like a bridge without naming itself.
    using Confirmer = std::function<boost::asio::awaitable<std::optional<CandidateRecord>>(
        std::string address, StopSignal stop)>;

    static std::shared_ptr<LocalBridgeCollector> Create(boost::asio::any_io_executor executor,
                                                        const StopSignal& outer,
                                                        std::chrono::milliseconds window,
                                                        std::chrono::milliseconds settle,
                                                        Confirmer confirmer);

    LocalBridgeCollector(const LocalBridgeCollector&) = delete;
    LocalBridgeCollector& operator=(const LocalBridgeCollector&) = delete;

    void Spawn(boost::asio::awaitable<void> task);

    // Bridges are merged by MergeKey(); the first report wins.
    void Add(CandidateRecord record, std::string_view via);

    // Each address is confirmed at most once, and never when a bridge was
    // already reported there.
    void Confirm(const std::string& address);

    boost::asio::awaitable<std::vector<CandidateRecord>> Wait();

    StopSignal signal() const { return scope_.signal(); }

    bool StopRequested() const { return scope_.StopRequested(); }

    bool settling() const { return settling_; }

    const boost::asio::any_io_executor& executor() const { return executor_; }

private:
    LocalBridgeCollector(boost::asio::any_io_executor executor,
                         const StopSignal& outer,
                         std::chrono::milliseconds window,
                         std::chrono::milliseconds settle,
                         Confirmer confirmer);

    static boost::asio::awaitable<void> confirm(std::shared_ptr<LocalBridgeCollector> self,
                                                std::string address);
    static boost::asio::awaitable<void> settle(std::shared_ptr<LocalBridgeCollector> self);

    boost::asio::any_io_executor executor_;
    StopScope scope_;
    std::chrono::milliseconds settle_;
    Confirmer confirmer_;
    boost::asio::steady_timer done_;
    std::size_t active_ = 0;
    bool settling_ = false;
    std::set<std::string> addresses_; // reported or being confirmed
    std::set<std::string> keys_;
    std::vector<CandidateRecord> found_;
};

} // namespace bridgefinder::core
