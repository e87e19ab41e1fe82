#include <atomic>
#include <core/discovery/completion_gate.h>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace bridgefinder::core;

TEST(CompletionGate, FirstCallerWins) {
    CompletionGate gate;
    EXPECT_FALSE(gate.IsCompleted());

    EXPECT_TRUE(gate.TryComplete());
    EXPECT_TRUE(gate.IsCompleted());
    EXPECT_FALSE(gate.TryComplete());
    EXPECT_FALSE(gate.TryComplete());
}

TEST(CompletionGate, ExactlyOneWinnerUnderContention) {
    for (int round = 0; round < 50; ++round) {
        CompletionGate gate;
        std::atomic<int> winners{0};
        std::atomic<bool> go{false};

        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] {
                while (!go.load()) {
                    std::this_thread::yield();
                }
                if (gate.TryComplete()) {
                    ++winners;
                }
            });
        }
        go = true;
        for (auto& thread : threads) {
            thread.join();
        }

        ASSERT_EQ(winners.load(), 1) << "round " << round;
    }
}
