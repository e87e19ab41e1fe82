#include <core/discovery/cancellation_controller.h>
#include <exception>
#include <spdlog/spdlog.h>

namespace bridgefinder::core {

namespace {

void invoke(const CancellationController::Handle& handle) {
    try {
        handle();
    } catch (const std::exception& e) {
        spdlog::warn("cancellation handle failed: {}", e.what());
    }
}

} // namespace

std::shared_ptr<CancellationController> CancellationController::Create() {
    return std::shared_ptr<CancellationController>(new CancellationController());
}

CancellationController::Token CancellationController::Register(Handle handle) {
    if (!handle) {
        return 0;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            auto token = next_token_++;
            handles_.emplace(token, std::move(handle));
            return token;
        }
    }
    invoke(handle);
    return 0;
}

void CancellationController::Unregister(Token token) {
    if (token == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    handles_.erase(token);
}

void CancellationController::CancelAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        return;
    }
    cancelled_ = true;
    spdlog::debug("cancelling {} registered handle(s)", handles_.size());
    for (const auto& [token, handle] : handles_) {
        invoke(handle);
    }
    handles_.clear();
}

bool CancellationController::IsCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

std::size_t CancellationController::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

StopSignal CancellationController::signal() {
    return StopSignal(shared_from_this());
}

StopCallback::StopCallback(std::shared_ptr<CancellationController> controller,
                           CancellationController::Handle handle)
    : controller_(std::move(controller)) {
    if (controller_) {
        token_ = controller_->Register(std::move(handle));
    }
}

StopCallback::~StopCallback() {
    Reset();
}

StopCallback::StopCallback(StopCallback&& other) noexcept
    : controller_(std::move(other.controller_))
    , token_(other.token_) {
    other.token_ = 0;
}

StopCallback& StopCallback::operator=(StopCallback&& other) noexcept {
    if (this != &other) {
        Reset();
        controller_ = std::move(other.controller_);
        token_ = other.token_;
        other.token_ = 0;
    }
    return *this;
}

void StopCallback::Reset() {
    if (controller_) {
        controller_->Unregister(token_);
        controller_.reset();
    }
    token_ = 0;
}

bool StopSignal::StopRequested() const {
    return controller_ && controller_->IsCancelled();
}

StopCallback StopSignal::OnStop(CancellationController::Handle handle) const {
    return StopCallback(controller_, std::move(handle));
}

} // namespace bridgefinder::core
