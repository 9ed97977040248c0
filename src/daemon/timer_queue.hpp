#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <utility>

// Deadline-ordered one-shot timers, fired from the event loop thread.
class TimerQueue {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using TimerId = uint64_t;
    using NowFn = std::function<TimePoint()>;

    TimerQueue();
    explicit TimerQueue(NowFn now);

    TimePoint now() const { return now_(); }

    TimerId schedule(std::chrono::milliseconds delay, std::function<void()> cb);

    // Returns false if the timer already fired or was cancelled.
    bool cancel(TimerId id);

    // Runs every timer whose deadline is <= now(). Returns timers fired.
    size_t run_due();

    // For epoll_wait: -1 when idle, 0 when a timer is already due.
    int next_timeout_ms() const;

    size_t size() const { return timers_.size(); }

private:
    NowFn now_;
    TimerId next_id_ = 1;
    // Keyed on (deadline, id) so equal deadlines fire in scheduling order.
    std::map<std::pair<TimePoint, TimerId>, std::function<void()>> timers_;
};
