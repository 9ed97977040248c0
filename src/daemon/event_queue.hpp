#pragma once

#include <functional>
#include <mutex>
#include <vector>

// Multi-producer task queue drained on the event loop thread. Worker and
// device threads post closures here instead of touching core state.
class EventQueue {
public:
    using Task = std::function<void()>;
    using NotifyCallback = std::function<void()>;

    explicit EventQueue(NotifyCallback notify = {}) : notify_(std::move(notify)) {}

    void set_notify(NotifyCallback notify) {
        std::lock_guard lock(mutex_);
        notify_ = std::move(notify);
    }

    void post(Task task) {
        NotifyCallback notify;
        {
            std::lock_guard lock(mutex_);
            tasks_.push_back(std::move(task));
            notify = notify_;
        }
        if (notify) notify();
    }

    // Runs queued tasks in posting order. Tasks posted while draining run on
    // the next call.
    size_t drain() {
        std::vector<Task> batch;
        {
            std::lock_guard lock(mutex_);
            batch.swap(tasks_);
        }
        for (auto& task : batch) task();
        return batch.size();
    }

    size_t pending() const {
        std::lock_guard lock(mutex_);
        return tasks_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<Task> tasks_;
    NotifyCallback notify_;
};
