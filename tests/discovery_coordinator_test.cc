#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <core/discovery/discovery_coordinator.h>
#include <future>
#include <gtest/gtest.h>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace net = boost::asio;
using namespace bridgefinder::core;
using namespace std::chrono_literals;

namespace {

// Records every probe start, in order.
class RunLog {
public:
    void Add(std::string name) {
        std::lock_guard<std::mutex> lock(mutex_);
        names_.push_back(std::move(name));
    }

    std::vector<std::string> names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return names_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> names_;
};

class FakeProbe : public DiscoveryProbe {
public:
    FakeProbe(std::string name,
              std::vector<CandidateRecord> result,
              std::chrono::milliseconds delay,
              RunLog& log)
        : name_(std::move(name))
        , result_(std::move(result))
        , delay_(delay)
        , log_(log) {}

    std::string_view name() const override { return name_; }

    net::awaitable<std::vector<CandidateRecord>> Run(StopSignal stop) override {
        ++runs;
        log_.Add(name_);
        if (delay_ > 0ms) {
            bool slept = co_await SleepFor(delay_, stop);
            if (!slept) {
                saw_stop = true;
            }
        }
        co_return result_;
    }

    std::atomic<int> runs{0};
    std::atomic<bool> saw_stop{false};

private:
    std::string name_;
    std::vector<CandidateRecord> result_;
    std::chrono::milliseconds delay_;
    RunLog& log_;
};

class ThrowingProbe : public DiscoveryProbe {
public:
    std::string_view name() const override { return "throwing"; }

    net::awaitable<std::vector<CandidateRecord>> Run(StopSignal) override {
        throw std::runtime_error("socket exploded");
        co_return std::vector<CandidateRecord>{};
    }
};

std::vector<CandidateRecord> bridge(std::string id, std::string address) {
    return {CandidateRecord::Make(id, address)};
}

// Polls `predicate` for up to one second.
template<typename Predicate>
bool eventually(Predicate predicate) {
    for (int i = 0; i < 100; ++i) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(10ms);
    }
    return predicate();
}

} // namespace

class DiscoveryCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        thread_ = std::thread([this] { ioc_.run(); });
    }

    void TearDown() override {
        work_.reset();
        thread_.join();
    }

    std::shared_ptr<FakeProbe> probe(std::string name,
                                     std::vector<CandidateRecord> result = {},
                                     std::chrono::milliseconds delay = 0ms) {
        return std::make_shared<FakeProbe>(std::move(name), std::move(result), delay, log_);
    }

    net::io_context ioc_;
    net::executor_work_guard<net::io_context::executor_type> work_{ioc_.get_executor()};
    std::thread thread_;
    RunLog log_;
};

// =============================================================================
// Waterfall
// =============================================================================

TEST_F(DiscoveryCoordinatorTest, LocalHitShortCircuitsTheRest) {
    auto local = probe("local", bridge("001788fffe4a2b3c", "192.168.1.2"));
    auto directory = probe("directory", bridge("other", "192.168.1.3"));
    auto heuristic = probe("heuristic");
    DiscoveryCoordinator coordinator(ioc_, {local, directory, heuristic});

    auto result = coordinator.Discover(5s).get();

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].normalized_id, "001788FFFE4A2B3C");
    EXPECT_EQ(directory->runs, 0);
    EXPECT_EQ(heuristic->runs, 0);

    auto outcome = coordinator.LastOutcome();
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome->reason, FinishReason::kProbeSucceeded);
    EXPECT_EQ(outcome->probe, "local");
    EXPECT_EQ(outcome->record_count, 1u);
}

TEST_F(DiscoveryCoordinatorTest, ProbesRunInPriorityOrderUntilOneFinds) {
    auto local = probe("local");
    auto directory = probe("directory");
    auto heuristic = probe("heuristic", bridge("abc", "10.0.0.2"));
    auto brute_force = probe("bruteforce", bridge("def", "10.0.0.3"));
    DiscoveryCoordinator coordinator(ioc_, {local, directory, heuristic, brute_force});

    auto result = coordinator.Discover(5s).get();

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].address, "10.0.0.2");
    EXPECT_EQ(log_.names(), (std::vector<std::string>{"local", "directory", "heuristic"}));
    EXPECT_EQ(brute_force->runs, 0);
}

TEST_F(DiscoveryCoordinatorTest, AllProbesEmptyIsExhausted) {
    auto a = probe("local");
    auto b = probe("directory");
    DiscoveryCoordinator coordinator(ioc_, {a, b});

    auto result = coordinator.Discover(5s).get();

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(a->runs, 1);
    EXPECT_EQ(b->runs, 1);
    ASSERT_TRUE(coordinator.LastOutcome());
    EXPECT_EQ(coordinator.LastOutcome()->reason, FinishReason::kExhausted);
}

TEST_F(DiscoveryCoordinatorTest, NoProbesIsExhausted) {
    DiscoveryCoordinator coordinator(ioc_, {});

    EXPECT_TRUE(coordinator.Discover(5s).get().empty());
    EXPECT_EQ(coordinator.LastOutcome()->reason, FinishReason::kExhausted);
}

TEST_F(DiscoveryCoordinatorTest, ThrowingProbeCountsAsEmpty) {
    auto after = probe("directory", bridge("abc", "10.0.0.2"));
    DiscoveryCoordinator coordinator(ioc_, {std::make_shared<ThrowingProbe>(), after});

    auto result = coordinator.Discover(5s).get();

    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(after->runs, 1);
}

TEST_F(DiscoveryCoordinatorTest, DuplicatesAcrossCasingAreMerged) {
    std::vector<CandidateRecord> records{
        CandidateRecord::Make("001788fffe4a2b3c", "192.168.1.2", std::nullopt, "first"),
        CandidateRecord::Make("00:17:88:FF:FE:4A:2B:3C", "192.168.1.2", std::nullopt, "second"),
        CandidateRecord::Make("ecb5fafffe000001", "192.168.1.9"),
    };
    DiscoveryCoordinator coordinator(ioc_, {probe("local", records)});

    auto result = coordinator.Discover(5s).get();

    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0].display_name, "first");
    EXPECT_EQ(result[1].normalized_id, "ECB5FAFFFE000001");
}

// =============================================================================
// Timeout and Stop
// =============================================================================

TEST_F(DiscoveryCoordinatorTest, TimeoutEndsAHangingProbe) {
    auto hanging = probe("local", bridge("abc", "10.0.0.2"), 10s);
    auto next = probe("directory", bridge("def", "10.0.0.3"));
    DiscoveryCoordinator coordinator(ioc_, {hanging, next});

    auto started = std::chrono::steady_clock::now();
    auto result = coordinator.Discover(100ms).get();
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_TRUE(result.empty());
    EXPECT_LT(elapsed, 2s);
    EXPECT_EQ(coordinator.LastOutcome()->reason, FinishReason::kTimedOut);
    EXPECT_TRUE(eventually([&] { return hanging->saw_stop.load(); }));
    EXPECT_EQ(next->runs, 0);
    EXPECT_FALSE(coordinator.IsRunning());
}

TEST_F(DiscoveryCoordinatorTest, StopDuringAProbeReturnsEmpty) {
    auto hanging = probe("local", {}, 10s);
    auto next = probe("directory", bridge("def", "10.0.0.3"));
    DiscoveryCoordinator coordinator(ioc_, {hanging, next});
    std::atomic<int> finished{0};
    coordinator.SetFinishedCallback(
        [&](const DiscoveryOutcome&, const std::vector<CandidateRecord>&) { ++finished; });

    auto pending = coordinator.Discover(10s);
    ASSERT_TRUE(eventually([&] { return hanging->runs.load() == 1; }));

    coordinator.Stop();
    coordinator.Stop();
    auto result = pending.get();

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(coordinator.LastOutcome()->reason, FinishReason::kStopped);
    EXPECT_TRUE(eventually([&] { return hanging->saw_stop.load(); }));
    EXPECT_EQ(next->runs, 0);
    EXPECT_EQ(finished, 1);
}

TEST(DiscoveryCoordinator, StopBeforeTheRunStartsLeavesNoTimerBehind) {
    net::io_context ioc;
    RunLog log;
    auto hanging = std::make_shared<FakeProbe>("local", std::vector<CandidateRecord>{}, 10s, log);
    std::future<std::vector<CandidateRecord>> pending;
    {
        DiscoveryCoordinator coordinator(ioc, {hanging});

        // Nothing has run yet: the session finishes before the timeout
        // watcher and the waterfall get a chance to start.
        pending = coordinator.Discover(10s);
        coordinator.Stop();

        auto started = std::chrono::steady_clock::now();
        ioc.run();
        auto drained = std::chrono::steady_clock::now() - started;

        EXPECT_LT(drained, 2s);
        EXPECT_EQ(coordinator.LastOutcome()->reason, FinishReason::kStopped);
    }
    EXPECT_TRUE(pending.get().empty());
    EXPECT_EQ(hanging->runs, 0);
}

TEST_F(DiscoveryCoordinatorTest, StopWhenIdleIsANoOp) {
    DiscoveryCoordinator coordinator(ioc_, {probe("local")});

    coordinator.Stop();

    EXPECT_FALSE(coordinator.IsRunning());
    EXPECT_FALSE(coordinator.LastOutcome());
}

TEST_F(DiscoveryCoordinatorTest, StopAfterCompletionChangesNothing) {
    DiscoveryCoordinator coordinator(ioc_, {probe("local", bridge("abc", "10.0.0.2"))});
    std::atomic<int> finished{0};
    coordinator.SetFinishedCallback(
        [&](const DiscoveryOutcome&, const std::vector<CandidateRecord>&) { ++finished; });

    auto result = coordinator.Discover(5s).get();
    coordinator.Stop();

    EXPECT_EQ(result.size(), 1u);
    EXPECT_EQ(coordinator.LastOutcome()->reason, FinishReason::kProbeSucceeded);
    EXPECT_EQ(finished, 1);
}

// =============================================================================
// Concurrency
// =============================================================================

TEST_F(DiscoveryCoordinatorTest, SecondDiscoverWhileRunningIsRejected) {
    auto slow = probe("local", bridge("abc", "10.0.0.2"), 300ms);
    DiscoveryCoordinator coordinator(ioc_, {slow});

    auto first = coordinator.Discover(5s);
    ASSERT_TRUE(eventually([&] { return slow->runs.load() == 1; }));
    EXPECT_TRUE(coordinator.IsRunning());

    auto second = coordinator.Discover(5s).get();

    EXPECT_TRUE(second.empty());
    EXPECT_EQ(slow->runs, 1);
    EXPECT_EQ(first.get().size(), 1u);
}

TEST_F(DiscoveryCoordinatorTest, CanDiscoverAgainAfterCompletion) {
    auto local = probe("local", bridge("abc", "10.0.0.2"));
    DiscoveryCoordinator coordinator(ioc_, {local});

    EXPECT_EQ(coordinator.Discover(5s).get().size(), 1u);
    EXPECT_EQ(coordinator.Discover(5s).get().size(), 1u);
    EXPECT_EQ(local->runs, 2);
}

TEST_F(DiscoveryCoordinatorTest, ProbeAndTimeoutRaceDeliverExactlyOnce) {
    for (int round = 0; round < 20; ++round) {
        auto racing = probe("local", bridge("abc", "10.0.0.2"), 20ms);
        DiscoveryCoordinator coordinator(ioc_, {racing});
        std::atomic<int> finished{0};
        coordinator.SetFinishedCallback(
            [&](const DiscoveryOutcome&, const std::vector<CandidateRecord>&) { ++finished; });

        auto result = coordinator.Discover(20ms).get();
        auto outcome = coordinator.LastOutcome();

        ASSERT_TRUE(outcome);
        EXPECT_EQ(finished, 1) << "round " << round;
        if (outcome->reason == FinishReason::kTimedOut) {
            EXPECT_TRUE(result.empty());
        } else {
            EXPECT_EQ(outcome->reason, FinishReason::kProbeSucceeded);
            EXPECT_EQ(result.size(), 1u);
        }
    }
}

TEST_F(DiscoveryCoordinatorTest, AsyncDiscoverWithCallback) {
    DiscoveryCoordinator coordinator(ioc_, {probe("local", bridge("abc", "10.0.0.2"))});
    std::promise<std::size_t> delivered;

    coordinator.AsyncDiscover(5s, [&](std::exception_ptr, std::vector<CandidateRecord> records) {
        delivered.set_value(records.size());
    });

    EXPECT_EQ(delivered.get_future().get(), 1u);
}

TEST(FinishReason, Names) {
    EXPECT_EQ(ToString(FinishReason::kProbeSucceeded), "probe succeeded");
    EXPECT_EQ(ToString(FinishReason::kExhausted), "exhausted");
    EXPECT_EQ(ToString(FinishReason::kTimedOut), "timeout");
    EXPECT_EQ(ToString(FinishReason::kStopped), "stopped");
}
