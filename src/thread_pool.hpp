// thread_pool.hpp
// Fixed-size worker pool and the countdown latch used to
// signal completion of a batch of queued work.

#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace eratos {

// -------------------------------------------------------
// CountdownLatch: starts at `count`, released once it has
// been counted down to zero. Counting down past zero is a
// no-op.
// -------------------------------------------------------
class CountdownLatch {
public:
    explicit CountdownLatch(size_t count) : count_(count) {}

    CountdownLatch(const CountdownLatch&) = delete;
    CountdownLatch& operator=(const CountdownLatch&) = delete;

    void count_down();

    // Block until the count reaches zero.
    void wait();

    // Block for at most `timeout`. Returns true if the count
    // reached zero in time.
    bool wait_for(std::chrono::milliseconds timeout);

    size_t remaining() const;

private:
    mutable std::mutex m_;
    std::condition_variable cv_;
    size_t count_;
};

// -------------------------------------------------------
// ThreadPool: `threads` workers pulling tasks from one FIFO
// queue. The destructor runs every task already queued and
// then joins the workers.
//
// Tasks must not throw. Callers that can fail wrap their
// work and report the failure through their own channel.
// -------------------------------------------------------
class ThreadPool {
public:
    explicit ThreadPool(unsigned threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void enqueue(std::function<void()> task);

    unsigned size() const { return static_cast<unsigned>(workers_.size()); }

private:
    void worker_loop();
    void shutdown();

    std::mutex m_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> queue_;
    bool shutdown_ = false;
    std::vector<std::thread> workers_;
};

// Number of pool threads to use when none is configured.
unsigned default_pool_threads();

} // namespace eratos
