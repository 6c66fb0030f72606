#include "reservation/expiry_sweeper.h"

namespace reservation {

ExpirySweeper::ExpirySweeper(ReservationManager &manager,
                             std::chrono::milliseconds interval,
                             ClockFn clock)
    : manager_(manager), interval_(interval), clock_(std::move(clock)) {}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

void ExpirySweeper::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }
    running_ = true;
    stop_requested_ = false;
    thread_ = std::thread(&ExpirySweeper::sweepLoop, this);
}

void ExpirySweeper::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
}

std::size_t ExpirySweeper::runOnce() {
    const auto expired = manager_.sweepExpired(clock_());
    std::lock_guard<std::mutex> lock(mutex_);
    total_expired_ += expired;
    passes_ += 1;
    return expired;
}

bool ExpirySweeper::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::size_t ExpirySweeper::totalExpired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_expired_;
}

std::size_t ExpirySweeper::passes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return passes_;
}

void ExpirySweeper::sweepLoop() {
    for (;;) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
                return;
            }
        }
        runOnce();
    }
}

}  // namespace reservation
