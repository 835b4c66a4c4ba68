#include "util/cancellation.hpp"

#include <utility>

#include "util/log.hpp"

namespace courserag {

CancelOnDisconnect::CancelOnDisconnect(CancellationToken& token,
                                       std::function<bool()> peer_gone,
                                       std::chrono::milliseconds interval)
    : token_(token), peer_gone_(std::move(peer_gone)), interval_(interval) {
    if (peer_gone_) {
        watcher_ = std::thread([this] { watch(); });
    }
}

CancelOnDisconnect::~CancelOnDisconnect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    stop_cv_.notify_all();
    if (watcher_.joinable()) {
        watcher_.join();
    }
}

void CancelOnDisconnect::watch() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
        if (peer_gone_()) {
            log::info("client disconnected, cancelling query turn");
            token_.cancel();
            return;
        }
    }
}

}  // namespace courserag
