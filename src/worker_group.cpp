// worker_group.cpp

#include "worker_group.hpp"
#include "errors.hpp"
#include "thread_pool.hpp"
#include <thread>

namespace eratos {

void RunControl::record_failure(std::exception_ptr e) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (!first_failure_) first_failure_ = e;
    }
    request_stop();
}

void RunControl::rethrow_if_failed() {
    std::exception_ptr e;
    {
        std::lock_guard<std::mutex> lk(m_);
        e = first_failure_;
    }
    if (e) std::rethrow_exception(e);
}

void run_guarded(const WorkerFn& fn, RunControl& control) {
    try {
        fn(control);
    } catch (...) {
        control.record_failure(std::current_exception());
    }
}

bool await_workers(CountdownLatch& latch, RunControl& control,
                   std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        latch.wait();
        return true;
    }
    if (latch.wait_for(timeout)) return true;

    control.request_stop();
    latch.wait();
    return false;
}

void run_workers(const std::vector<WorkerFn>& workers,
                 std::chrono::milliseconds timeout) {
    RunControl control;
    CountdownLatch latch(workers.size());
    std::vector<std::thread> threads;
    threads.reserve(workers.size());

    try {
        for (const auto& fn : workers) {
            threads.emplace_back([&control, &latch, &fn] {
                run_guarded(fn, control);
                latch.count_down();
            });
        }
    } catch (...) {
        control.request_stop();
        for (auto& t : threads) t.join();
        throw;
    }

    bool in_time = await_workers(latch, control, timeout);
    for (auto& t : threads) t.join();

    control.rethrow_if_failed();
    if (!in_time) throw SieveTimeout(timeout);
}

} // namespace eratos
