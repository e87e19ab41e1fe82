#pragma once

#include <chrono>
#include <core/model/candidate_record.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace bridgefinder::core {

enum class SessionState {
    kIdle,
    kRunning,   // probe_index() is the probe being awaited
    kCompleted, // records() holds the final list
    kCancelled, // stopped by the caller
};

std::string_view ToString(SessionState state);

/*
    State machine of one Discover() call:

        Idle -> Running(0) -> Running(1) -> ... -> Completed(records)
                    \______________________________-> Cancelled

    No state is revisited; every refused transition returns false and leaves
    the session untouched. Not synchronized, the owner serializes access.
*/
class DiscoverySession {
public:
    using Clock = std::chrono::steady_clock;

    DiscoverySession();

    bool Start();
    bool Advance(std::size_t probe_index);
    bool Complete(std::vector<CandidateRecord> records);
    bool Cancel();

    SessionState state() const { return state_; }
    bool IsRunning() const { return state_ == SessionState::kRunning; }
    bool IsTerminal() const {
        return state_ == SessionState::kCompleted || state_ == SessionState::kCancelled;
    }
    std::size_t probe_index() const { return probe_index_; }
    const std::vector<CandidateRecord>& records() const { return records_; }
    const std::string& id() const { return id_; }
    Clock::time_point started_at() const { return started_at_; }
    Clock::duration Elapsed() const;

private:
    std::string id_;
    SessionState state_ = SessionState::kIdle;
    std::size_t probe_index_ = 0;
    std::vector<CandidateRecord> records_;
    Clock::time_point started_at_{};
    Clock::time_point finished_at_{};
};

} // namespace bridgefinder::core
