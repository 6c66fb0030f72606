#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

#include "reservation/reservation_manager.h"

namespace reservation {

// Periodic caller of ReservationManager::sweepExpired on its own thread.
class ExpirySweeper {
public:
    using ClockFn = std::function<TimePoint()>;

    ExpirySweeper(ReservationManager &manager,
                  std::chrono::milliseconds interval,
                  ClockFn clock = [] { return stock::Clock::now(); });
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper &) = delete;
    ExpirySweeper &operator=(const ExpirySweeper &) = delete;

    void start();
    void stop();
    std::size_t runOnce();

    bool running() const;
    std::size_t totalExpired() const;
    std::size_t passes() const;

private:
    void sweepLoop();

    ReservationManager &manager_;
    std::chrono::milliseconds interval_;
    ClockFn clock_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_{false};
    bool stop_requested_{false};
    std::size_t total_expired_{0};
    std::size_t passes_{0};
};

}  // namespace reservation
