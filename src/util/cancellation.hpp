#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "util/errors.hpp"

namespace courserag {

// Shared between the caller that owns a query turn and the code running it.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    void throw_if_cancelled() const {
        if (is_cancelled()) {
            throw TurnCancelled();
        }
    }

    const std::atomic<bool>* flag() const noexcept { return &cancelled_; }

private:
    std::atomic<bool> cancelled_{false};
};

// Polls peer_gone on a background thread for as long as the object lives and
// cancels the token the first time it reports true. Used to stop a query
// turn when the HTTP client disconnects.
class CancelOnDisconnect {
public:
    CancelOnDisconnect(CancellationToken& token,
                       std::function<bool()> peer_gone,
                       std::chrono::milliseconds interval = std::chrono::milliseconds{100});
    ~CancelOnDisconnect();

    CancelOnDisconnect(const CancelOnDisconnect&) = delete;
    CancelOnDisconnect& operator=(const CancelOnDisconnect&) = delete;

private:
    void watch();

    CancellationToken& token_;
    std::function<bool()> peer_gone_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable stop_cv_;
    bool stopping_ = false;
    std::thread watcher_;
};

}  // namespace courserag
