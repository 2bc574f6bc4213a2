// Copyright (c) 2025 VAM Desktop Live Whisper
// Fixed-size pool of worker threads draining a task queue

#pragma once

#include "core/blocking_queue.hpp"
#include "core/logging.hpp"

#include <functional>
#include <thread>
#include <vector>

namespace core {

class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(size_t threads) {
        if (threads == 0) threads = 1;
        workers_.reserve(threads);
        for (size_t i = 0; i < threads; ++i) {
            workers_.emplace_back([this] { run(); });
        }
    }

    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false after shutdown().
    bool submit(Task task) { return tasks_.push(std::move(task)); }

    // Runs every queued task, then joins all workers.
    void shutdown() {
        tasks_.stop();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
        workers_.clear();
    }

    size_t size() const { return workers_.size(); }

private:
    void run() {
        Task task;
        while (tasks_.pop(task)) {
            try {
                task();
            } catch (const std::exception& e) {
                log_error(std::string("[pool] task failed: ") + e.what());
            }
        }
    }

    BlockingQueue<Task> tasks_;
    std::vector<std::thread> workers_;
};

} // namespace core
