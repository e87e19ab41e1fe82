#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <core/discovery/cancellation_controller.h>
#include <core/model/candidate_record.h>
#include <memory>
#include <string_view>
#include <vector>

namespace bridgefinder::core {

// One independent, best-effort discovery technique.
//
// Run() must not let transport errors escape: a failed probe and a probe
// that found nothing look the same to the caller. It is expected to watch
// `stop` and return promptly, with whatever it has, once it fires.
class DiscoveryProbe {
public:
    virtual ~DiscoveryProbe() = default;

    virtual std::string_view name() const = 0;

    virtual boost::asio::awaitable<std::vector<CandidateRecord>> Run(StopSignal stop) = 0;
};

using ProbeList = std::vector<std::shared_ptr<DiscoveryProbe>>;

// Suspends for `duration` on the current executor. Returns false when `stop`
// cut the wait short.
boost::asio::awaitable<bool> SleepFor(std::chrono::milliseconds duration, StopSignal stop);

} // namespace bridgefinder::core
