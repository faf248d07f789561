// divisor_partitioned.cpp
// Concurrent trial division by base-prime decomposition.
// Every thread scans the whole range above sqrt(n) but only
// divides by its own class of base primes.
//
// Unlike range_partitioned.cpp, two threads can clear the
// same index (30 is hit by the classes holding 2, 3 and 5),
// so the array lock is what keeps the writes well defined.

#include "eratos.hpp"
#include "sieve_phases.hpp"
#include "worker_group.hpp"
#include <utility>

namespace eratos {

std::vector<std::vector<int64_t>> divisor_classes(const std::vector<int64_t>& divisors,
                                                  unsigned workers) {
    std::vector<std::vector<int64_t>> classes(workers);
    if (workers == 0) return classes;

    for (size_t i = 0; i < divisors.size(); i++)
        classes[i % workers].push_back(divisors[i]);
    return classes;
}

void eliminate_divisor_partitioned(PrimalityArray& array, const std::vector<int64_t>& divisors,
                                   const SieveOptions& options) {
    validate_options(options);

    const int64_t n = array.limit();
    const int64_t start = isqrt(n) + 1;
    std::vector<std::vector<int64_t>> classes = divisor_classes(divisors, options.worker_count);

    std::vector<WorkerFn> workers;
    workers.reserve(classes.size());
    for (const auto& cls : classes) {
        workers.push_back([&array, &cls, start, n](const RunControl& control) {
            for (int64_t i = start; i <= n; i++) {
                if (control.stop_requested()) return;
                for (int64_t p : cls) {
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

std::vector<int64_t> divisor_partitioned_sieve(int64_t n, const SieveOptions& options) {
    validate_bound(n);
    validate_options(options);

    PrimalityArray array(n);
    std::vector<int64_t> divisors = base_primes(array, n);
    eliminate_divisor_partitioned(array, divisors, options);
    return collect_primes(array, std::move(divisors));
}

} // namespace eratos
