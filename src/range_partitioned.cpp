// range_partitioned.cpp
// Concurrent trial division by data decomposition.
// Parallelization strategy: divide the OUTPUT range above
// sqrt(n) into contiguous slices, one per thread. Every
// thread divides by the same read-only list of base primes.

#include "eratos.hpp"
#include "sieve_phases.hpp"
#include "worker_group.hpp"
#include <utility>

namespace eratos {

std::vector<Partition> partition_range(int64_t start, int64_t n, unsigned workers) {
    std::vector<Partition> parts;
    if (workers == 0) return parts;

    int64_t total = n >= start ? n - start + 1 : 0;
    int64_t slice = total / workers;

    parts.reserve(workers);
    for (unsigned k = 0; k < workers; k++) {
        int64_t from = start + static_cast<int64_t>(k) * slice;
        int64_t to   = (k + 1 == workers) ? start + total
                                          : from + slice;
        parts.push_back({from, to});
    }
    return parts;
}

void eliminate_range_partitioned(PrimalityArray& array, const std::vector<int64_t>& divisors,
                                 const SieveOptions& options) {
    validate_options(options);

    const int64_t n = array.limit();
    std::vector<Partition> parts = partition_range(isqrt(n) + 1, n, options.worker_count);

    // -------------------------------------------------------
    // Slices never overlap, so no two threads write the same
    // index. Writes still go through the array's lock.
    // -------------------------------------------------------
    std::vector<WorkerFn> workers;
    workers.reserve(parts.size());
    for (const Partition& part : parts) {
        workers.push_back([&array, &divisors, part](const RunControl& control) {
            for (int64_t i = part.from; i < part.to; i++) {
                if (control.stop_requested()) return;
                for (int64_t p : divisors) {
                    if (i % p == 0) {
                        array.clear_locked(i);
                        break;
                    }
                }
            }
        });
    }

    run_workers(workers, options.timeout);
}

std::vector<int64_t> range_partitioned_sieve(int64_t n, const SieveOptions& options) {
    validate_bound(n);
    validate_options(options);

    PrimalityArray array(n);
    std::vector<int64_t> divisors = base_primes(array, n);
    eliminate_range_partitioned(array, divisors, options);
    return collect_primes(array, std::move(divisors));
}

} // namespace eratos
