// thread_pool.cpp
// Worker loop follows the usual wait / pop / unlock / run
// shape: the queue lock is never held while a task runs.

#include "thread_pool.hpp"
#include <omp.h>
#include <stdexcept>
#include <utility>

namespace eratos {

// -------------------------------------------------------
// CountdownLatch
// -------------------------------------------------------

void CountdownLatch::count_down() {
    std::lock_guard<std::mutex> lk(m_);
    if (count_ == 0) return;
    if (--count_ == 0) cv_.notify_all();
}

void CountdownLatch::wait() {
    std::unique_lock<std::mutex> lk(m_);
    cv_.wait(lk, [&]{ return count_ == 0; });
}

bool CountdownLatch::wait_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_);
    return cv_.wait_for(lk, timeout, [&]{ return count_ == 0; });
}

size_t CountdownLatch::remaining() const {
    std::lock_guard<std::mutex> lk(m_);
    return count_;
}

// -------------------------------------------------------
// ThreadPool
// -------------------------------------------------------

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0)
        throw std::invalid_argument("thread pool needs at least one thread");

    workers_.reserve(threads);
    try {
        for (unsigned i = 0; i < threads; ++i)
            workers_.emplace_back(&ThreadPool::worker_loop, this);
    } catch (...) {
        // Thread creation failed part way: stop the ones we have
        shutdown();
        throw;
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::enqueue(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (shutdown_)
            throw std::logic_error("enqueue on a stopped thread pool");
        queue_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void ThreadPool::worker_loop() {
    std::unique_lock<std::mutex> lk(m_);
    for (;;) {
        cv_.wait(lk, [&]{ return !queue_.empty() || shutdown_; });
        if (queue_.empty()) break;   // shutdown and nothing left

        std::function<void()> task = std::move(queue_.front());
        queue_.pop_front();
        lk.unlock();

        task();

        lk.lock();
    }
}

void ThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lk(m_);
        shutdown_ = true;
    }
    cv_.notify_all();
    for (auto& t : workers_)
        if (t.joinable()) t.join();
}

unsigned default_pool_threads() {
    int n = omp_get_max_threads();
    return n > 0 ? static_cast<unsigned>(n) : 1u;
}

} // namespace eratos
