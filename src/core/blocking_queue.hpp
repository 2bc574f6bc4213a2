// Copyright (c) 2025 VAM Desktop Live Whisper
// Unbounded thread-safe FIFO used to hand results between threads

#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

namespace core {

// Producers never block; pop() waits until an item arrives or the queue is stopped.
template <typename T>
class BlockingQueue {
public:
    bool push(T&& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (stopped_) {
            return false;
        }
        queue_.push(std::move(item));
        cv_pop_.notify_one();
        return true;
    }

    // Returns false only when stopped and drained.
    bool pop(T& item) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_pop_.wait(lock, [this] { return !queue_.empty() || stopped_; });
        if (queue_.empty()) {
            return false;
        }
        item = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    // Signal stop (no more items will be added)
    void stop() {
        std::unique_lock<std::mutex> lock(mutex_);
        stopped_ = true;
        cv_pop_.notify_all();
    }

    size_t size() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return queue_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_pop_;
    std::queue<T> queue_;
    bool stopped_ = false;
};

} // namespace core
