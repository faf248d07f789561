// pool_signaled.cpp
// One pool task per base prime. Each task clears the
// multiples of its prime above sqrt(n) and then counts down
// the latch the driver is waiting on.

#include "eratos.hpp"
#include "sieve_phases.hpp"
#include "thread_pool.hpp"
#include "worker_group.hpp"
#include <utility>

namespace eratos {

void eliminate_pool_signaled(PrimalityArray& array, const std::vector<int64_t>& divisors,
                             const SieveOptions& options) {
    validate_options(options);

    const int64_t n = array.limit();
    const int64_t start = isqrt(n) + 1;
    const unsigned threads = options.pool_threads ? options.pool_threads
                                                  : default_pool_threads();

    RunControl control;
    CountdownLatch latch(divisors.size());
    {
        // Declared last so it is joined before latch and
        // control go out of scope
        ThreadPool pool(threads);

        for (int64_t p : divisors) {
            pool.enqueue([&array, &control, &latch, p, start, n] {
                run_guarded([&](const RunControl& ctl) {
                    for (int64_t j = start; j <= n; j++) {
                        if (ctl.stop_requested()) return;
                        if (j % p == 0) array.clear_locked(j);
                    }
                }, control);
                latch.count_down();
            });
        }

        bool in_time = await_workers(latch, control, options.timeout);
        control.rethrow_if_failed();
        if (!in_time) throw SieveTimeout(options.timeout);
    }
}

std::vector<int64_t> pool_signaled_sieve(int64_t n, const SieveOptions& options) {
    validate_bound(n);
    validate_options(options);

    PrimalityArray array(n);
    std::vector<int64_t> divisors = base_primes(array, n);
    eliminate_pool_signaled(array, divisors, options);
    return collect_primes(array, std::move(divisors));
}

} // namespace eratos
