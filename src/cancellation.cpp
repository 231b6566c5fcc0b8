#include "cancellation.hpp"
#include "errors.hpp"

namespace ferry {

CancellationToken::CancellationToken()
    : cancelled_(std::make_shared<std::atomic<bool>>(false)) {
}

void CancellationToken::cancel() {
    cancelled_->store(true);
}

bool CancellationToken::is_cancelled() const {
    return cancelled_->load();
}

void CancellationToken::throw_if_cancelled() const {
    if (cancelled_->load()) {
        throw CancelledError();
    }
}

void PauseGate::pause() {
    paused_.store(true);
}

void PauseGate::resume() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        paused_.store(false);
    }
    cv_.notify_all();
}

bool PauseGate::wait_while_paused(const CancellationToken& token) {
    if (!paused_.load()) return false;

    std::unique_lock<std::mutex> lock(mutex_);
    while (paused_.load() && !token.is_cancelled()) {
        cv_.wait_for(lock, CANCEL_POLL);
    }
    return true;
}

} // namespace ferry
