#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace ferry {

/**
 * Cooperative cancellation signal.
 *
 * Copies share one flag. cancel() returns immediately; the worker observes
 * it at its next checkpoint.
 */
class CancellationToken {
public:
    CancellationToken();

    void cancel();
    bool is_cancelled() const;

    // Throws CancelledError when the token is set
    void throw_if_cancelled() const;

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

/**
 * Pause checkpoint for the worker thread.
 *
 * pause()/resume() never block. The worker parks in wait_while_paused()
 * and wakes on resume or when the token is cancelled.
 */
class PauseGate {
public:
    void pause();
    void resume();
    bool is_paused() const { return paused_.load(); }

    // Returns true if the call actually parked the caller
    bool wait_while_paused(const CancellationToken& token);

private:
    std::atomic<bool> paused_{false};
    std::mutex mutex_;
    std::condition_variable cv_;

    static constexpr std::chrono::milliseconds CANCEL_POLL{50};
};

} // namespace ferry
