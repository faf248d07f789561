// worker_group.hpp
// Coordination shared by the concurrent strategies:
// a stop flag, first-failure capture, and the blocking wait
// the driver thread performs before it extracts results.

#pragma once
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <mutex>
#include <vector>

namespace eratos {

class CountdownLatch;

// -------------------------------------------------------
// RunControl: state shared between one driver and its
// workers for the duration of a single sieve call.
//
// A worker that fails records its exception; the first one
// wins and raises the stop flag so siblings finish early.
// -------------------------------------------------------
class RunControl {
public:
    // Workers poll this once per index.
    bool stop_requested() const {
        return stop_.load(std::memory_order_relaxed);
    }

    void request_stop() {
        stop_.store(true, std::memory_order_relaxed);
    }

    void record_failure(std::exception_ptr e);

    // Rethrow the first recorded failure, if any.
    void rethrow_if_failed();

private:
    std::atomic<bool> stop_{false};
    std::mutex m_;
    std::exception_ptr first_failure_;
};

using WorkerFn = std::function<void(const RunControl&)>;

// -------------------------------------------------------
// Run `fn` and turn any exception into a recorded failure.
// -------------------------------------------------------
void run_guarded(const WorkerFn& fn, RunControl& control);

// -------------------------------------------------------
// Block until `latch` reaches zero.
//
// timeout == 0 waits unconditionally. Otherwise, if the
// timeout expires first, stop is requested and the call
// still waits for the latch to drain (workers are never
// abandoned). Returns false in that case.
// -------------------------------------------------------
bool await_workers(CountdownLatch& latch, RunControl& control,
                   std::chrono::milliseconds timeout);

// -------------------------------------------------------
// Start one plain thread per worker, wait for all of them,
// join them, then report:
//   - the first worker exception, rethrown unchanged
//   - SieveTimeout if the bounded wait expired
// -------------------------------------------------------
void run_workers(const std::vector<WorkerFn>& workers,
                 std::chrono::milliseconds timeout);

} // namespace eratos
