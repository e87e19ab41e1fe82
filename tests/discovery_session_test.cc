#include <core/discovery/discovery_session.h>
#include <gtest/gtest.h>

using namespace bridgefinder::core;

TEST(DiscoverySession, StartsIdleWithUniqueId) {
    DiscoverySession a;
    DiscoverySession b;

    EXPECT_EQ(a.state(), SessionState::kIdle);
    EXPECT_FALSE(a.id().empty());
    EXPECT_NE(a.id(), b.id());
}

TEST(DiscoverySession, WaterfallToCompleted) {
    DiscoverySession session;

    ASSERT_TRUE(session.Start());
    EXPECT_TRUE(session.IsRunning());
    EXPECT_EQ(session.probe_index(), 0u);

    EXPECT_TRUE(session.Advance(1));
    EXPECT_TRUE(session.Advance(3));
    EXPECT_EQ(session.probe_index(), 3u);

    ASSERT_TRUE(session.Complete({CandidateRecord::Make("abc", "10.0.0.2")}));
    EXPECT_EQ(session.state(), SessionState::kCompleted);
    EXPECT_TRUE(session.IsTerminal());
    EXPECT_EQ(session.records().size(), 1u);
}

TEST(DiscoverySession, ProbeIndexNeverGoesBack) {
    DiscoverySession session;
    session.Start();
    session.Advance(2);

    EXPECT_FALSE(session.Advance(2));
    EXPECT_FALSE(session.Advance(1));
    EXPECT_EQ(session.probe_index(), 2u);
}

TEST(DiscoverySession, IllegalTransitionsAreRefused) {
    DiscoverySession session;
    EXPECT_FALSE(session.Advance(1));
    EXPECT_FALSE(session.Complete({}));
    EXPECT_FALSE(session.Cancel());
    EXPECT_EQ(session.state(), SessionState::kIdle);

    session.Start();
    EXPECT_FALSE(session.Start());
    ASSERT_TRUE(session.Cancel());

    EXPECT_FALSE(session.Complete({}));
    EXPECT_FALSE(session.Cancel());
    EXPECT_FALSE(session.Advance(1));
    EXPECT_FALSE(session.Start());
    EXPECT_EQ(session.state(), SessionState::kCancelled);
}

TEST(DiscoverySession, ElapsedFreezesAtTerminalState) {
    DiscoverySession session;
    EXPECT_EQ(session.Elapsed(), DiscoverySession::Clock::duration::zero());

    session.Start();
    session.Complete({});
    auto first = session.Elapsed();
    auto second = session.Elapsed();

    EXPECT_EQ(first, second);
}

TEST(DiscoverySession, StateNames) {
    EXPECT_EQ(ToString(SessionState::kIdle), "idle");
    EXPECT_EQ(ToString(SessionState::kRunning), "running");
    EXPECT_EQ(ToString(SessionState::kCompleted), "completed");
    EXPECT_EQ(ToString(SessionState::kCancelled), "cancelled");
}
