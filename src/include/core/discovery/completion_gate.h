#pragma once

#include <mutex>

namespace bridgefinder::core {

// Single-fire guard: of all racing finishers, exactly one gets `true` from
// TryComplete(). The gate does not act on its own; the winner does.
class CompletionGate {
public:
    CompletionGate() = default;
    CompletionGate(const CompletionGate&) = delete;
    CompletionGate& operator=(const CompletionGate&) = delete;

    [[nodiscard]] bool TryComplete();

    bool IsCompleted() const;

private:
    mutable std::mutex mutex_;
    bool fired_ = false;
};

} // namespace bridgefinder::core
