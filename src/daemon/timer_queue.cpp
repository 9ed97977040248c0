#include "timer_queue.hpp"

#include <algorithm>
#include <limits>

TimerQueue::TimerQueue() : now_([] { return Clock::now(); }) {}

TimerQueue::TimerQueue(NowFn now) : now_(std::move(now)) {}

TimerQueue::TimerId TimerQueue::schedule(std::chrono::milliseconds delay,
                                         std::function<void()> cb) {
    TimerId id = next_id_++;
    timers_.emplace(std::make_pair(now_() + delay, id), std::move(cb));
    return id;
}

bool TimerQueue::cancel(TimerId id) {
    auto it = std::ranges::find_if(timers_, [id](const auto& t) { return t.first.second == id; });
    if (it == timers_.end()) return false;
    timers_.erase(it);
    return true;
}

size_t TimerQueue::run_due() {
    size_t fired = 0;
    // Callbacks may schedule or cancel timers, so pop one at a time.
    while (!timers_.empty()) {
        auto it = timers_.begin();
        if (it->first.first > now_()) break;
        auto cb = std::move(it->second);
        timers_.erase(it);
        cb();
        fired++;
    }
    return fired;
}

int TimerQueue::next_timeout_ms() const {
    if (timers_.empty()) return -1;
    auto delta = timers_.begin()->first.first - now_();
    if (delta <= Clock::duration::zero()) return 0;
    auto ms = std::chrono::ceil<std::chrono::milliseconds>(delta).count();
    return static_cast<int>(std::min<int64_t>(ms, std::numeric_limits<int>::max()));
}
