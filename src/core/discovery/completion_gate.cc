#include <core/discovery/completion_gate.h>

namespace bridgefinder::core {

bool CompletionGate::TryComplete() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fired_) {
        return false;
    }
    fired_ = true;
    return true;
}

bool CompletionGate::IsCompleted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}

} // namespace bridgefinder::core
