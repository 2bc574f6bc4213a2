#include <atomic>
#include <cassert>
#include <stdexcept>
#include <thread>
#include <vector>
#include "core/blocking_queue.hpp"
#include "core/worker_pool.hpp"

int main() {
    // Queue hands items across threads in order, stop() drains
    core::BlockingQueue<int> q;
    std::thread producer([&] {
        for (int i = 0; i < 100; ++i) q.push(int(i));
        q.stop();
    });
    int expected = 0;
    int v = 0;
    while (q.pop(v)) {
        assert(v == expected);
        ++expected;
    }
    producer.join();
    assert(expected == 100);
    assert(!q.push(1));
    assert(q.size() == 0);

    // Pool runs every task, survives throwing tasks, rejects after shutdown
    std::atomic<int> ran{0};
    core::WorkerPool pool(3);
    assert(pool.size() == 3);
    for (int i = 0; i < 50; ++i) {
        assert(pool.submit([&ran, i] {
            if (i % 10 == 0) throw std::runtime_error("task failed");
            ++ran;
        }));
    }
    pool.shutdown();
    assert(ran == 45);
    assert(pool.size() == 0);
    assert(!pool.submit([] {}));

    core::WorkerPool single(0);
    assert(single.size() == 1);
    return 0;
}
