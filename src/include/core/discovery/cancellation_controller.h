#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace bridgefinder::core {

class StopSignal;

/*
    Owns the cancellation handles of every unit of work spawned during one
    discovery session: sockets, timers, probe coroutines.

    Handles run on the thread calling CancelAll(), while the controller's
    lock is held. A handle must not call back into the controller that is
    invoking it.
*/
class CancellationController : public std::enable_shared_from_this<CancellationController> {
public:
    using Handle = std::function<void()>;
    using Token = std::uint64_t;

    static std::shared_ptr<CancellationController> Create();

    CancellationController(const CancellationController&) = delete;
    CancellationController& operator=(const CancellationController&) = delete;

    // Returns 0 when the controller was already cancelled; `handle` has run
    // by then.
    Token Register(Handle handle);

    void Unregister(Token token);

    // Runs every handle once and clears the registry. Idempotent.
    void CancelAll();

    bool IsCancelled() const;

    std::size_t size() const;

    StopSignal signal();

private:
    CancellationController() = default;

    mutable std::mutex mutex_;
    bool cancelled_ = false;
    Token next_token_ = 1;
    std::map<Token, Handle> handles_;
};

// Unregisters its handle on destruction. Declare it after the resource the
// handle touches so it goes away first.
class StopCallback {
public:
    StopCallback() = default;
    StopCallback(std::shared_ptr<CancellationController> controller,
                 CancellationController::Handle handle);
    ~StopCallback();

    StopCallback(StopCallback&& other) noexcept;
    StopCallback& operator=(StopCallback&& other) noexcept;
    StopCallback(const StopCallback&) = delete;
    StopCallback& operator=(const StopCallback&) = delete;

    void Reset();

private:
    std::shared_ptr<CancellationController> controller_;
    CancellationController::Token token_ = 0;
};

// Cooperative stop input handed to probes. A default constructed signal
// never fires.
class StopSignal {
public:
    StopSignal() = default;

    bool StopRequested() const;

    [[nodiscard]] StopCallback OnStop(CancellationController::Handle handle) const;

private:
    friend class CancellationController;
    explicit StopSignal(std::shared_ptr<CancellationController> controller)
        : controller_(std::move(controller)) {}

    std::shared_ptr<CancellationController> controller_;
};

} // namespace bridgefinder::core
