#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/discovery/discovery_session.h>

namespace uuids = boost::uuids;

namespace bridgefinder::core {

std::string_view ToString(SessionState state) {
    switch (state) {
    case SessionState::kIdle:
        return "idle";
    case SessionState::kRunning:
        return "running";
    case SessionState::kCompleted:
        return "completed";
    case SessionState::kCancelled:
        return "cancelled";
    }
    return "unknown";
}

DiscoverySession::DiscoverySession()
    : id_(uuids::to_string(uuids::random_generator()())) {}

bool DiscoverySession::Start() {
    if (state_ != SessionState::kIdle) {
        return false;
    }
    state_ = SessionState::kRunning;
    probe_index_ = 0;
    started_at_ = Clock::now();
    return true;
}

bool DiscoverySession::Advance(std::size_t probe_index) {
    if (state_ != SessionState::kRunning || probe_index <= probe_index_) {
        return false;
    }
    probe_index_ = probe_index;
    return true;
}

bool DiscoverySession::Complete(std::vector<CandidateRecord> records) {
    if (state_ != SessionState::kRunning) {
        return false;
    }
    state_ = SessionState::kCompleted;
    records_ = std::move(records);
    finished_at_ = Clock::now();
    return true;
}

bool DiscoverySession::Cancel() {
    if (state_ != SessionState::kRunning) {
        return false;
    }
    state_ = SessionState::kCancelled;
    finished_at_ = Clock::now();
    return true;
}

DiscoverySession::Clock::duration DiscoverySession::Elapsed() const {
    switch (state_) {
    case SessionState::kIdle:
        return Clock::duration::zero();
    case SessionState::kRunning:
        return Clock::now() - started_at_;
    default:
        return finished_at_ - started_at_;
    }
}

} // namespace bridgefinder::core
